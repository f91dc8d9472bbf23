#include "Utf8.hpp"

namespace mv {
namespace utf8 {

std::u32string decode(const std::string& text, std::vector<size_t>* byte_offsets) {
    std::u32string out;
    out.reserve(text.size());
    if (byte_offsets) {
        byte_offsets->clear();
        byte_offsets->reserve(text.size() + 1);
    }

    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const size_t start = i;
        unsigned char c = s[i];
        char32_t cp = 0xFFFD;
        size_t len = 1;

        if (c < 0x80) {
            cp = c;
        } else if ((c >> 5) == 0x6) {
            len = 2;
        } else if ((c >> 4) == 0xE) {
            len = 3;
        } else if ((c >> 3) == 0x1E) {
            len = 4;
        }

        if (len > 1) {
            bool ok = i + len <= n;
            for (size_t k = 1; ok && k < len; ++k) {
                ok = (s[i + k] & 0xC0) == 0x80;
            }
            if (ok) {
                cp = c & (0xFF >> (len + 1));
                for (size_t k = 1; k < len; ++k) {
                    cp = (cp << 6) | (s[i + k] & 0x3F);
                }
            } else {
                cp  = 0xFFFD;
                len = 1;
            }
        }

        if (byte_offsets) byte_offsets->push_back(start);
        out.push_back(cp);
        i += len;
    }
    if (byte_offsets) byte_offsets->push_back(n);
    return out;
}

std::string encode(char32_t cp) {
    std::string out;
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
    return out;
}

std::string encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size() * 3);
    for (char32_t cp : text) out += encode(cp);
    return out;
}

size_t length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool is_cjk(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // unified ideographs
           (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
           cp == 0x3007;                       // 〇
}

bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
           cp == U'\f' || cp == U'\v' || cp == 0x3000 || cp == 0x00A0;
}

bool is_punctuation(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 0x21 && cp <= 0x2F && cp != U'-' && cp != U'.') ||
               (cp >= 0x3A && cp <= 0x40) ||
               (cp >= 0x5B && cp <= 0x60) ||
               (cp >= 0x7B && cp <= 0x7E);
    }
    return (cp >= 0x3001 && cp <= 0x3003) ||   // 、。〃
           (cp >= 0x3008 && cp <= 0x3011) ||   // 〈〉《》「」『』【】
           (cp >= 0x3014 && cp <= 0x301F) ||
           (cp >= 0xFF01 && cp <= 0xFF0F) ||   // fullwidth ！＂＃…／
           (cp >= 0xFF1A && cp <= 0xFF20) ||   // ：；＜＝＞？＠
           (cp >= 0xFF3B && cp <= 0xFF40) ||
           (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0x2010 && cp <= 0x2027) ||   // dashes, quotes, ellipsis
           cp == 0x00B7;                       // ·
}

} // namespace utf8
} // namespace mv
