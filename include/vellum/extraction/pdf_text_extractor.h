#pragma once

#include <vellum/extraction/text_extractor.h>

#include <string>

namespace vellum::extraction {

/**
 * @brief Extracts the text layer of a PDF with qpdf.
 *
 * Pages are read in document order and joined by a blank line. Text drawn by
 * the show-text operators is kept; glyph positioning is reduced to spaces and
 * line breaks. Scanned pages carry no text layer and come back empty.
 */
class PdfTextExtractor : public ITextExtractor {
public:
    PdfTextExtractor() = default;
    ~PdfTextExtractor() override = default;

    std::string name() const override { return "PdfTextExtractor"; }

    Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                               const ExtractionConfig& config = {}) override;

    std::vector<std::string> supportedContentTypes() const override;

    /// Collapses runs of blanks, normalizes line endings and trims the result.
    static std::string cleanText(const std::string& rawText);
};

} // namespace vellum::extraction
