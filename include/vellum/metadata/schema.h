#pragma once

#include <vellum/core/types.h>
#include <vellum/metadata/database.h>

namespace vellum::metadata {

inline constexpr int kSchemaVersion = 1;

/// Creates the project, document, chunk and job tables when missing.
Result<void> initializeSchema(Database& db);

} // namespace vellum::metadata
