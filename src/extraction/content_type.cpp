#include <vellum/extraction/content_type.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <utility>

namespace vellum::extraction {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool startsWith(std::span<const std::byte> data, std::string_view prefix) {
    return data.size() >= prefix.size() &&
           std::memcmp(data.data(), prefix.data(), prefix.size()) == 0;
}

bool isGenericType(const std::string& type) {
    return type.empty() || type == kOctetStream || type == "binary/octet-stream" ||
           type == "application/x-unknown";
}

} // namespace

std::string normalizeContentType(std::string_view declared) {
    auto semi = declared.find(';');
    std::string type = toLower(declared.substr(0, semi));
    auto first = type.find_first_not_of(" \t");
    auto last = type.find_last_not_of(" \t");
    if (first == std::string::npos)
        return {};
    return type.substr(first, last - first + 1);
}

std::string contentTypeForExtension(std::string_view filename) {
    static const std::array<std::pair<std::string_view, std::string_view>, 15> kByExtension = {{
        {".txt", kTextPlain},
        {".text", kTextPlain},
        {".log", kTextPlain},
        {".md", kTextMarkdown},
        {".markdown", kTextMarkdown},
        {".csv", kTextCsv},
        {".json", kJson},
        {".xml", kXml},
        {".html", kTextHtml},
        {".htm", kTextHtml},
        {".xhtml", kXhtml},
        {".pdf", kPdf},
        {".docx", kDocx},
        {".doc", kMsWord},
        {".zip", kZip},
    }};

    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos)
        return {};
    std::string ext = toLower(filename.substr(dot));
    for (const auto& [e, type] : kByExtension) {
        if (ext == e)
            return std::string(type);
    }
    return {};
}

std::string contentTypeFromMagic(std::span<const std::byte> data) {
    if (startsWith(data, "%PDF-"))
        return std::string(kPdf);
    if (startsWith(data, std::string_view("PK\x03\x04", 4)))
        return std::string(kZip);
    if (startsWith(data, std::string_view("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8)))
        return std::string(kMsWord);

    // Skip a UTF-8 BOM and leading whitespace before sniffing markup
    std::size_t i = 0;
    if (startsWith(data, "\xEF\xBB\xBF"))
        i = 3;
    while (i < data.size() && std::isspace(static_cast<unsigned char>(data[i])))
        ++i;
    std::size_t n = std::min<std::size_t>(data.size() - i, 64);
    std::string head = toLower(std::string_view(reinterpret_cast<const char*>(data.data()) + i, n));
    if (head.rfind("<!doctype html", 0) == 0 || head.rfind("<html", 0) == 0)
        return std::string(kTextHtml);
    return {};
}

bool looksLikeText(std::span<const std::byte> data) {
    std::size_t n = std::min<std::size_t>(data.size(), 8192);
    if (n == 0)
        return true;
    std::size_t control = 0;
    for (std::size_t i = 0; i < n; ++i) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c == 0)
            return false;
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t' && c != '\f')
            ++control;
    }
    return control * 10 <= n * 3;
}

std::string detectContentType(std::span<const std::byte> data, std::string_view filename,
                              std::string_view declaredType) {
    std::string declared = normalizeContentType(declaredType);
    std::string magic = contentTypeFromMagic(data);
    std::string byExtension = contentTypeForExtension(filename);

    if (!isGenericType(declared)) {
        // An OOXML container is only identifiable through its declared type or extension
        if (declared == kZip && byExtension == kDocx)
            return byExtension;
        return declared;
    }
    if (magic == kZip && byExtension == kDocx)
        return byExtension;
    if (!magic.empty())
        return magic;
    if (!byExtension.empty())
        return byExtension;
    if (looksLikeText(data))
        return std::string(kTextPlain);
    return std::string(kOctetStream);
}

} // namespace vellum::extraction
