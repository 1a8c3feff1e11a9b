#include <vellum/extraction/content_type.h>
#include <vellum/extraction/html_text_extractor.h>
#include <vellum/extraction/plain_text_extractor.h>
#ifdef VELLUM_HAS_PDF_SUPPORT
#include <vellum/extraction/pdf_text_extractor.h>
#endif
#include <vellum/extraction/text_extractor.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace vellum::extraction {

namespace {

// Recognized types with no in-process extractor; named in the error message
std::string describeUnsupported(const std::string& type) {
    if (type == kPdf)
        return "PDF documents are not supported by this build (qpdf not found)";
    if (type == kDocx || type == kMsWord)
        return "Word documents are not supported by this build";
    return "No extractor for content type '" + type + "'";
}

} // namespace

TextExtractorFactory::TextExtractorFactory() {
    registerExtractor(PlainTextExtractor{}.supportedContentTypes(),
                      []() { return std::make_unique<PlainTextExtractor>(); });
    registerExtractor(HtmlTextExtractor{}.supportedContentTypes(),
                      []() { return std::make_unique<HtmlTextExtractor>(); });
#ifdef VELLUM_HAS_PDF_SUPPORT
    registerExtractor(PdfTextExtractor{}.supportedContentTypes(),
                      []() { return std::make_unique<PdfTextExtractor>(); });
#endif
    spdlog::debug("TextExtractorFactory initialized with {} content types", extractors_.size());
}

std::unique_ptr<ITextExtractor> TextExtractorFactory::create(const std::string& contentType) const {
    auto type = normalizeContentType(contentType);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extractors_.find(type);
    if (it != extractors_.end()) {
        return it->second();
    }
    return nullptr;
}

void TextExtractorFactory::registerExtractor(const std::vector<std::string>& contentTypes,
                                             ExtractorCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& type : contentTypes) {
        extractors_[normalizeContentType(type)] = creator;
    }
}

bool TextExtractorFactory::isSupported(const std::string& contentType) const {
    auto type = normalizeContentType(contentType);
    std::lock_guard<std::mutex> lock(mutex_);
    return extractors_.find(type) != extractors_.end();
}

std::vector<std::string> TextExtractorFactory::supportedContentTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(extractors_.size());
    for (const auto& [type, _] : extractors_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

Result<ExtractionResult> TextExtractorFactory::extract(std::span<const std::byte> data,
                                                       const std::string& filename,
                                                       const std::string& declaredType,
                                                       const ExtractionConfig& config) const {
    auto type = detectContentType(data, filename, declaredType);
    auto extractor = create(type);
    if (!extractor) {
        return Error{ErrorCode::UnsupportedFormat, describeUnsupported(type)};
    }

    auto result = extractor->extractFromBuffer(data, config);
    if (!result) {
        // Extractors report malformed input; normalize other codes to the per-file taxonomy
        if (result.error().code != ErrorCode::ExtractionFailed) {
            return Error{ErrorCode::ExtractionFailed, result.error().message};
        }
        return result;
    }

    auto extracted = std::move(result).value();
    extracted.contentType = type;
    for (const auto& w : extracted.warnings) {
        spdlog::warn("[Extraction] {}: {}", filename, w);
    }
    return extracted;
}

} // namespace vellum::extraction
