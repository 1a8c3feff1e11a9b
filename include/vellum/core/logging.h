#pragma once

#include <vellum/core/types.h>

#include <filesystem>
#include <string>

namespace vellum {

struct LoggingOptions {
    std::string level = "info";   // spdlog level name: trace ... critical, off
    std::filesystem::path file;   // empty: console only
    std::size_t maxFileSize = 10 * 1024 * 1024;
    std::size_t maxFiles = 5;
};

/// Installs the default "vellum" logger: colored stderr sink, plus a rotating
/// file sink when `file` is set.
Result<void> initLogging(const LoggingOptions& options);

/// Applies a textual level to the current default logger. Accepts every spdlog
/// level name and its short form (warn, err), case-insensitively.
Result<void> setLogLevel(const std::string& level);

} // namespace vellum
