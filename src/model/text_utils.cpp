/**
 * @file text_utils.cpp
 * @brief Утилиты для нормализации UTF-8 строк (ASCII + кириллица)
 */

#include "text_utils.hpp"
#include <cctype>

namespace drilltrace::model {

namespace {

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Двухбайтовая кириллица: А-Я (U+0410..U+042F) и Ё (U+0401)
bool lowerCyrillic(unsigned char c0, unsigned char c1, std::string& out) {
    char32_t cp = static_cast<char32_t>(((c0 & 0x1F) << 6) | (c1 & 0x3F));
    char32_t lowered = cp;
    if (cp >= 0x410 && cp <= 0x42F) {
        lowered = cp + 0x20;
    } else if (cp == 0x401) {
        lowered = 0x451;
    } else {
        return false;
    }
    out.push_back(static_cast<char>(0xC0 | ((lowered >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (lowered & 0x3F)));
    return true;
}

} // namespace

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && isSpace(str[start])) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && isSpace(str[end - 1])) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string_view stripBom(std::string_view str) noexcept {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return str.substr(3);
    }
    return str;
}

std::string utf8ToLower(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if ((c & 0xE0) == 0xC0 && i + 1 < input.size()) {
            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            if ((c1 & 0xC0) == 0x80 && lowerCyrillic(c, c1, out)) {
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }

    return out;
}

} // namespace drilltrace::model
