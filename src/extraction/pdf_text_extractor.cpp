#include <vellum/extraction/content_type.h>
#include <vellum/extraction/pdf_text_extractor.h>

#include <spdlog/spdlog.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <regex>
#include <utility>
#include <vector>

namespace vellum::extraction {

namespace {

// TJ offsets are in thousandths of a text-space unit; a gap wider than this reads as a space
constexpr double kWordGapThreshold = -250.0;

// Collects the text shown by a page's content stream. Operands arrive before
// their operator, so they are buffered until the operator names what to do.
class PageTextCollector : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit PageTextCollector(std::string& text) : text_(text) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }
        handleOperator(obj.getOperatorValue());
        operands_.clear();
    }

    void handleEOF() override { lineBreak(); }

private:
    void handleOperator(const std::string& op) {
        if (op == "Tj") {
            showString(0);
        } else if (op == "'") {
            lineBreak();
            showString(0);
        } else if (op == "\"") {
            lineBreak();
            showString(2);
        } else if (op == "TJ") {
            showArray();
        } else if (op == "T*" || op == "ET") {
            lineBreak();
        } else if (op == "Td" || op == "TD") {
            moveText();
        }
    }

    void showString(size_t operandIndex) {
        if (operandIndex < operands_.size() && operands_[operandIndex].isString())
            text_ += operands_[operandIndex].getUTF8Value();
    }

    void showArray() {
        if (operands_.empty() || !operands_[0].isArray())
            return;
        for (auto& item : operands_[0].getArrayAsVector()) {
            if (item.isString()) {
                text_ += item.getUTF8Value();
            } else if (item.isNumber() && item.getNumericValue() <= kWordGapThreshold) {
                space();
            }
        }
    }

    // A vertical move starts a new line; a horizontal one separates words
    void moveText() {
        if (operands_.size() == 2 && operands_[1].isNumber() &&
            operands_[1].getNumericValue() != 0.0) {
            lineBreak();
        } else {
            space();
        }
    }

    void space() {
        if (!text_.empty() && text_.back() != ' ' && text_.back() != '\n')
            text_ += ' ';
    }

    void lineBreak() {
        if (!text_.empty() && text_.back() != '\n')
            text_ += '\n';
    }

    std::string& text_;
    std::vector<QPDFObjectHandle> operands_;
};

const std::vector<std::pair<std::string, std::string>> kInfoKeys = {
    {"/Title", "title"}, {"/Author", "author"}, {"/Subject", "subject"}, {"/Keywords", "keywords"}};

std::string infoString(QPDFObjectHandle info, const std::string& key) {
    if (info.hasKey(key)) {
        auto value = info.getKey(key);
        if (value.isString())
            return value.getUTF8Value();
    }
    return {};
}

void readDocumentInfo(QPDF& pdf, ExtractionResult& result) {
    try {
        auto trailer = pdf.getTrailer();
        if (trailer.hasKey("/Info")) {
            auto info = trailer.getKey("/Info");
            if (info.isDictionary()) {
                for (const auto& [pdfKey, key] : kInfoKeys) {
                    auto value = infoString(info, pdfKey);
                    if (!value.empty())
                        result.metadata[key] = value;
                }
            }
        }
        result.metadata["pdf_version"] = pdf.getPDFVersion();
    } catch (const std::exception& e) {
        result.warnings.push_back(std::string("Unreadable document info: ") + e.what());
    }
}

} // namespace

std::vector<std::string> PdfTextExtractor::supportedContentTypes() const {
    return {std::string(kPdf)};
}

Result<ExtractionResult> PdfTextExtractor::extractFromBuffer(std::span<const std::byte> data,
                                                             const ExtractionConfig& config) {
    if (data.size() > config.maxFileSize) {
        return Error{ErrorCode::ExtractionFailed,
                     "File exceeds maximum size: " + std::to_string(data.size())};
    }

    ExtractionResult result;
    result.extractionMethod = "qpdf";

    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile("upload.pdf", reinterpret_cast<const char*>(data.data()),
                              data.size());

        if (config.extractMetadata)
            readDocumentInfo(pdf, result);

        QPDFPageDocumentHelper helper(pdf);
        auto pages = helper.getAllPages();
        if (pages.empty()) {
            return Error{ErrorCode::ExtractionFailed, "PDF has no pages"};
        }
        result.metadata["page_count"] = std::to_string(pages.size());

        std::string text;
        size_t pagesWithText = 0;
        for (size_t i = 0; i < pages.size(); ++i) {
            std::string pageText;
            try {
                PageTextCollector collector(pageText);
                pages[i].parsePageContents(&collector);
            } catch (const std::exception& e) {
                result.warnings.push_back("Page " + std::to_string(i + 1) +
                                          " could not be parsed: " + e.what());
                result.partial = true;
                continue;
            }
            pageText = cleanText(pageText);
            if (pageText.empty())
                continue;
            if (!text.empty())
                text += "\n\n";
            text += pageText;
            ++pagesWithText;
        }

        if (pagesWithText == 0) {
            result.warnings.push_back("PDF has no text layer");
        }
        result.text = std::move(text);
        spdlog::debug("[PdfTextExtractor] {} of {} pages carried text", pagesWithText,
                      pages.size());
        return result;
    } catch (const std::exception& e) {
        return Error{ErrorCode::ExtractionFailed, "Failed to load PDF: " + std::string(e.what())};
    }
}

std::string PdfTextExtractor::cleanText(const std::string& rawText) {
    std::string cleaned = std::regex_replace(rawText, std::regex("\\r\\n|\\r"), "\n");
    cleaned = std::regex_replace(cleaned, std::regex("[ \\t]+"), " ");
    cleaned = std::regex_replace(cleaned, std::regex(" ?\\n ?"), "\n");
    cleaned = std::regex_replace(cleaned, std::regex("\\n{3,}"), "\n\n");

    size_t start = cleaned.find_first_not_of(" \n\t");
    if (start == std::string::npos)
        return {};
    size_t end = cleaned.find_last_not_of(" \n\t");
    return cleaned.substr(start, end - start + 1);
}

} // namespace vellum::extraction
