#include <vellum/core/utf8.h>

namespace vellum::core {

bool isValidUtf8(std::string_view data) noexcept {
    std::size_t i = 0;
    const std::size_t n = data.size();
    while (i < n) {
        auto byte = static_cast<unsigned char>(data[i]);
        if (byte <= 0x7F) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((byte & 0xE0) == 0xC0) {
            len = 2;
            cp = byte & 0x1F;
        } else if ((byte & 0xF0) == 0xE0) {
            len = 3;
            cp = byte & 0x0F;
        } else if ((byte & 0xF8) == 0xF0) {
            len = 4;
            cp = byte & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto c = static_cast<unsigned char>(data[i + k]);
            if (!isUtf8Continuation(c)) {
                return false;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string latin1ToUtf8(std::string_view data) {
    std::string out;
    out.reserve(data.size() + data.size() / 4);
    for (unsigned char c : data) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace vellum::core
