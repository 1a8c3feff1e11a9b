#pragma once

#include <vellum/extraction/text_extractor.h>

namespace vellum::extraction {

/**
 * @brief Extractor for plain text uploads (text, markdown, CSV, JSON, XML).
 *
 * UTF-8 input is passed through with a leading BOM removed. Input that is not
 * valid UTF-8 is decoded as ISO-8859-1, which maps every byte, and the
 * result carries a warning.
 */
class PlainTextExtractor : public ITextExtractor {
public:
    PlainTextExtractor() = default;
    ~PlainTextExtractor() override = default;

    Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                               const ExtractionConfig& config = {}) override;

    std::vector<std::string> supportedContentTypes() const override;

    std::string name() const override { return "PlainTextExtractor"; }
};

} // namespace vellum::extraction
