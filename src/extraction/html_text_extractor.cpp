#include <vellum/core/utf8.h>
#include <vellum/extraction/content_type.h>
#include <vellum/extraction/html_text_extractor.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace vellum::extraction {

namespace {

size_t find_caseless(const std::string& haystack, std::string_view needle, size_t offset = 0) {
    if (offset >= haystack.size())
        return std::string::npos;
    auto it = std::search(
        haystack.begin() + static_cast<std::ptrdiff_t>(offset), haystack.end(), needle.begin(),
        needle.end(),
        [](unsigned char c1, unsigned char c2) { return std::tolower(c1) == std::tolower(c2); });
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(std::distance(haystack.begin(), it));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void appendCodepoint(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

Result<ExtractionResult> HtmlTextExtractor::extractFromBuffer(std::span<const std::byte> data,
                                                              const ExtractionConfig& config) {
    if (data.size() > config.maxFileSize) {
        return Error{ErrorCode::ExtractionFailed,
                     "File exceeds maximum size: " + std::to_string(data.size())};
    }
    if (!looksLikeText(data)) {
        return Error{ErrorCode::ExtractionFailed, "HTML content contains binary data"};
    }

    ExtractionResult result;
    result.extractionMethod = "html_text";

    std::string html(reinterpret_cast<const char*>(data.data()), data.size());
    if (!core::isValidUtf8(html)) {
        html = core::latin1ToUtf8(html);
        result.warnings.emplace_back("HTML is not valid UTF-8; decoded as ISO-8859-1");
    }

    result.text = extractTextFromHtml(html);

    if (config.extractMetadata) {
        result.metadata["format"] = "html";
        if (auto title = extractTitle(html); !title.empty()) {
            result.metadata["title"] = std::move(title);
        }
        if (auto description = extractMetaDescription(html); !description.empty()) {
            result.metadata["description"] = std::move(description);
        }
    }
    return result;
}

std::vector<std::string> HtmlTextExtractor::supportedContentTypes() const {
    return {std::string(kTextHtml), std::string(kXhtml)};
}

std::string HtmlTextExtractor::extractTextFromHtml(const std::string& html) {
    if (html.empty()) {
        return "";
    }
    std::string text = removeScriptAndStyle(html);
    text = convertBlockTagsToNewlines(text);
    text = stripHtmlTags(text);
    text = decodeHtmlEntities(text);
    return cleanWhitespace(text);
}

std::string HtmlTextExtractor::removeScriptAndStyle(const std::string& html) {
    struct Block {
        std::string_view open;
        std::string_view close;
    };
    static constexpr Block kBlocks[] = {
        {"<script", "</script>"}, {"<style", "</style>"}, {"<!--", "-->"}};

    std::string result;
    result.reserve(html.size());
    size_t pos = 0;

    while (pos < html.size()) {
        size_t next = std::string::npos;
        const Block* which = nullptr;
        for (const auto& block : kBlocks) {
            size_t at = find_caseless(html, block.open, pos);
            if (at < next) {
                next = at;
                which = &block;
            }
        }
        if (which == nullptr) {
            result.append(html, pos, std::string::npos);
            break;
        }

        result.append(html, pos, next - pos);
        size_t end = find_caseless(html, which->close, next + which->open.size());
        // Unterminated block: keep scanning after the '<'
        pos = (end == std::string::npos) ? next + 1 : end + which->close.size();
    }
    return result;
}

std::string HtmlTextExtractor::convertBlockTagsToNewlines(const std::string& html) {
    static const std::unordered_set<std::string> kBlockTags = {
        "p",     "div",  "h1", "h2", "h3",     "h4",     "h5",     "h6",      "ul",
        "ol",    "li",   "dl", "dt", "dd",     "pre",    "hr",     "br",      "blockquote",
        "table", "tr",   "td", "th", "section", "article", "header", "footer", "nav",
        "aside", "main", "figure", "figcaption"};

    std::string result;
    result.reserve(html.size() + html.size() / 10);

    size_t pos = 0;
    while (pos < html.size()) {
        if (html[pos] != '<') {
            result += html[pos++];
            continue;
        }
        size_t tag_end = html.find('>', pos);
        if (tag_end == std::string::npos) {
            result += html[pos++];
            continue;
        }

        std::string tag = html.substr(pos + 1, tag_end - pos - 1);
        if (!tag.empty() && tag[0] == '/')
            tag.erase(0, 1);
        std::string name = lower(tag.substr(0, tag.find_first_of(" \t\n\r/")));

        if (kBlockTags.count(name) != 0) {
            result += '\n';
        } else {
            // Inline tags are left for stripHtmlTags
            result.append(html, pos, tag_end - pos + 1);
        }
        pos = tag_end + 1;
    }
    return result;
}

std::string HtmlTextExtractor::stripHtmlTags(const std::string& html) {
    std::string result;
    result.reserve(html.length());
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            result += c;
        }
    }
    return result;
}

std::string HtmlTextExtractor::decodeHtmlEntities(const std::string& text) {
    static const std::pair<std::string_view, std::string_view> kNamed[] = {
        {"&amp;", "&"},
        {"&lt;", "<"},
        {"&gt;", ">"},
        {"&quot;", "\""},
        {"&apos;", "'"},
        {"&nbsp;", " "},
        {"&ndash;", "\xE2\x80\x93"},
        {"&mdash;", "\xE2\x80\x94"},
        {"&copy;", "\xC2\xA9"},
        {"&reg;", "\xC2\xAE"},
        {"&trade;", "\xE2\x84\xA2"},
        {"&hellip;", "\xE2\x80\xA6"},
        {"&bull;", "\xE2\x80\xA2"},
        {"&ldquo;", "\xE2\x80\x9C"},
        {"&rdquo;", "\xE2\x80\x9D"},
        {"&lsquo;", "\xE2\x80\x98"},
        {"&rsquo;", "\xE2\x80\x99"},
        {"&euro;", "\xE2\x82\xAC"},
    };

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            result += text[pos++];
            continue;
        }

        bool decoded = false;
        for (const auto& [entity, replacement] : kNamed) {
            if (text.compare(pos, entity.size(), entity) == 0) {
                result += replacement;
                pos += entity.size();
                decoded = true;
                break;
            }
        }
        if (decoded)
            continue;

        // Numeric &#123; and hex &#x1F; references
        if (pos + 2 < text.size() && text[pos + 1] == '#') {
            bool hex = text[pos + 2] == 'x' || text[pos + 2] == 'X';
            size_t digits = pos + (hex ? 3 : 2);
            size_t end = text.find(';', digits);
            if (end != std::string::npos && end > digits && end - digits <= 8) {
                uint32_t cp = 0;
                auto [ptr, ec] =
                    std::from_chars(text.data() + digits, text.data() + end, cp, hex ? 16 : 10);
                if (ec == std::errc{} && ptr == text.data() + end && cp > 0 && cp <= 0x10FFFF &&
                    !(cp >= 0xD800 && cp <= 0xDFFF)) {
                    appendCodepoint(cp, result);
                    pos = end + 1;
                    continue;
                }
            }
        }

        // Unknown entity: kept verbatim
        result += text[pos++];
    }
    return result;
}

std::string HtmlTextExtractor::cleanWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool lastWasSpace = false;
    int newlines = 0;

    for (char c : text) {
        if (c == '\n' || c == '\r') {
            if (newlines < 2) {
                // Drop the space before a line break
                if (lastWasSpace && !result.empty())
                    result.pop_back();
                result += '\n';
            }
            ++newlines;
            lastWasSpace = false;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!lastWasSpace && newlines == 0) {
                result += ' ';
                lastWasSpace = true;
            }
        } else {
            result += c;
            lastWasSpace = false;
            newlines = 0;
        }
    }

    auto start = result.find_first_not_of(" \n\r\t");
    if (start == std::string::npos) {
        return "";
    }
    auto end = result.find_last_not_of(" \n\r\t");
    return result.substr(start, end - start + 1);
}

std::string HtmlTextExtractor::extractTitle(const std::string& html) {
    size_t title_start = find_caseless(html, "<title");
    if (title_start == std::string::npos) {
        return "";
    }
    size_t content_start = html.find('>', title_start);
    if (content_start == std::string::npos) {
        return "";
    }
    ++content_start;
    size_t content_end = find_caseless(html, "</title>", content_start);
    if (content_end == std::string::npos) {
        return "";
    }
    std::string title = html.substr(content_start, content_end - content_start);
    return cleanWhitespace(decodeHtmlEntities(stripHtmlTags(title)));
}

std::string HtmlTextExtractor::extractMetaDescription(const std::string& html) {
    size_t pos = 0;
    while (pos < html.size()) {
        size_t meta_start = find_caseless(html, "<meta", pos);
        if (meta_start == std::string::npos) {
            break;
        }
        size_t meta_end = html.find('>', meta_start);
        if (meta_end == std::string::npos) {
            break;
        }

        std::string tag = html.substr(meta_start, meta_end - meta_start + 1);
        std::string tag_lower = lower(tag);
        bool is_description = tag_lower.find("name=\"description\"") != std::string::npos ||
                              tag_lower.find("name='description'") != std::string::npos ||
                              tag_lower.find("property=\"og:description\"") != std::string::npos;

        size_t content_pos = tag_lower.find("content=");
        if (is_description && content_pos != std::string::npos) {
            content_pos += 8;
            while (content_pos < tag.size() &&
                   std::isspace(static_cast<unsigned char>(tag[content_pos]))) {
                ++content_pos;
            }
            if (content_pos < tag.size() && (tag[content_pos] == '"' || tag[content_pos] == '\'')) {
                char quote = tag[content_pos++];
                size_t end_quote = tag.find(quote, content_pos);
                if (end_quote != std::string::npos) {
                    return decodeHtmlEntities(tag.substr(content_pos, end_quote - content_pos));
                }
            }
        }
        pos = meta_end + 1;
    }
    return "";
}

} // namespace vellum::extraction
