#pragma once

#include <vellum/core/types.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace vellum::extraction {

/**
 * @brief Result of text extraction from a document
 */
struct ExtractionResult {
    std::string text;                                      // UTF-8, natural reading order
    std::string contentType;                               // Type the extractor was chosen for
    std::unordered_map<std::string, std::string> metadata; // Additional metadata
    std::vector<std::string> warnings;                     // Non-fatal warnings
    bool partial = false;    // Content was knowingly dropped or substituted
    std::string extractionMethod;

    [[nodiscard]] size_t contentLength() const { return text.length(); }
};

/**
 * @brief Configuration for text extraction
 */
struct ExtractionConfig {
    size_t maxFileSize = 64 * 1024 * 1024;
    bool extractMetadata = true;
};

/**
 * @brief Base interface for text extractors. Implementations are pure transforms.
 */
class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;

    /**
     * @brief Extract text from a memory buffer
     * @return ExtractionFailed for malformed content of a supported type
     */
    virtual Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                                       const ExtractionConfig& config = {}) = 0;

    /**
     * @brief MIME types handled by this extractor
     */
    virtual std::vector<std::string> supportedContentTypes() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Content-type keyed registry of extractors
 */
class TextExtractorFactory {
public:
    using ExtractorCreator = std::function<std::unique_ptr<ITextExtractor>()>;

    /// Registers the built-in plain text and HTML extractors, and PDF when built with qpdf.
    TextExtractorFactory();

    /**
     * @brief Create an extractor for a MIME type, or nullptr when none is registered
     */
    std::unique_ptr<ITextExtractor> create(const std::string& contentType) const;

    void registerExtractor(const std::vector<std::string>& contentTypes, ExtractorCreator creator);

    bool isSupported(const std::string& contentType) const;

    std::vector<std::string> supportedContentTypes() const;

    /**
     * @brief Detect the type of an upload and run the matching extractor.
     * @return UnsupportedFormat when no extractor handles the detected type
     */
    Result<ExtractionResult> extract(std::span<const std::byte> data, const std::string& filename,
                                     const std::string& declaredType,
                                     const ExtractionConfig& config = {}) const;

private:
    std::unordered_map<std::string, ExtractorCreator> extractors_;
    mutable std::mutex mutex_;
};

} // namespace vellum::extraction
