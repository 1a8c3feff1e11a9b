#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace vellum::extraction {

inline constexpr std::string_view kTextPlain = "text/plain";
inline constexpr std::string_view kTextMarkdown = "text/markdown";
inline constexpr std::string_view kTextCsv = "text/csv";
inline constexpr std::string_view kTextHtml = "text/html";
inline constexpr std::string_view kXhtml = "application/xhtml+xml";
inline constexpr std::string_view kJson = "application/json";
inline constexpr std::string_view kXml = "application/xml";
inline constexpr std::string_view kPdf = "application/pdf";
inline constexpr std::string_view kDocx =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
inline constexpr std::string_view kMsWord = "application/msword";
inline constexpr std::string_view kZip = "application/zip";
inline constexpr std::string_view kOctetStream = "application/octet-stream";

/// Lower-cased MIME type without parameters ("Text/HTML; charset=x" -> "text/html").
std::string normalizeContentType(std::string_view declared);

/// MIME type for a filename extension, or empty when unknown.
std::string contentTypeForExtension(std::string_view filename);

/// MIME type from leading signature bytes, or empty when none matches.
std::string contentTypeFromMagic(std::span<const std::byte> data);

/// Heuristic: no NUL bytes and at most 30% control bytes in the first 8 KiB.
bool looksLikeText(std::span<const std::byte> data);

/**
 * Resolution order: a specific declared type, then signature bytes, then the
 * filename extension, then a text sniff. Unknown binary content is
 * application/octet-stream.
 */
std::string detectContentType(std::span<const std::byte> data, std::string_view filename,
                              std::string_view declaredType);

} // namespace vellum::extraction
