#pragma once

#include <vellum/extraction/text_extractor.h>

#include <string>

namespace vellum::extraction {

/**
 * @brief Converts HTML to readable plain text: script, style and comments are
 * dropped, block elements become line breaks, entities are decoded.
 */
class HtmlTextExtractor : public ITextExtractor {
public:
    HtmlTextExtractor() = default;
    ~HtmlTextExtractor() override = default;

    std::string name() const override { return "HtmlTextExtractor"; }

    Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                               const ExtractionConfig& config = {}) override;

    std::vector<std::string> supportedContentTypes() const override;

    static std::string extractTextFromHtml(const std::string& html);

    static std::string extractTitle(const std::string& html);
    static std::string extractMetaDescription(const std::string& html);

private:
    static std::string removeScriptAndStyle(const std::string& html);
    static std::string convertBlockTagsToNewlines(const std::string& html);
    static std::string stripHtmlTags(const std::string& html);
    static std::string decodeHtmlEntities(const std::string& text);
    static std::string cleanWhitespace(const std::string& text);
};

} // namespace vellum::extraction
