#include <vellum/core/utf8.h>
#include <vellum/extraction/content_type.h>
#include <vellum/extraction/plain_text_extractor.h>

#include <spdlog/spdlog.h>

namespace vellum::extraction {

Result<ExtractionResult> PlainTextExtractor::extractFromBuffer(std::span<const std::byte> data,
                                                               const ExtractionConfig& config) {
    if (data.size() > config.maxFileSize) {
        return Error{ErrorCode::ExtractionFailed,
                     "File exceeds maximum size: " + std::to_string(data.size())};
    }
    if (!looksLikeText(data)) {
        return Error{ErrorCode::ExtractionFailed, "Content is binary, not text"};
    }

    ExtractionResult result;
    result.extractionMethod = "plain_text";

    std::string_view raw(reinterpret_cast<const char*>(data.data()), data.size());
    if (raw.size() >= 3 && raw.substr(0, 3) == "\xEF\xBB\xBF") {
        raw.remove_prefix(3);
    }

    if (core::isValidUtf8(raw)) {
        result.text.assign(raw);
        result.metadata["encoding"] = "UTF-8";
    } else {
        result.text = core::latin1ToUtf8(raw);
        result.metadata["encoding"] = "ISO-8859-1";
        result.warnings.emplace_back("Input is not valid UTF-8; decoded as ISO-8859-1");
        spdlog::debug("[PlainTextExtractor] non UTF-8 input ({} bytes), decoded as Latin-1",
                      raw.size());
    }

    if (config.extractMetadata) {
        std::size_t lines = 0;
        for (char c : result.text) {
            if (c == '\n')
                ++lines;
        }
        if (!result.text.empty() && result.text.back() != '\n')
            ++lines;
        result.metadata["line_count"] = std::to_string(lines);
    }
    return result;
}

std::vector<std::string> PlainTextExtractor::supportedContentTypes() const {
    return {std::string(kTextPlain), std::string(kTextMarkdown), std::string(kTextCsv),
            std::string(kJson), std::string(kXml), "text/xml", "text/x-log"};
}

} // namespace vellum::extraction
