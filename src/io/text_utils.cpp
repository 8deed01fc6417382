/**
 * @file text_utils.cpp
 * @brief Утилиты для разбора текстовых таблиц (UTF-8)
 */

#include "text_utils.hpp"
#include <cctype>
#include <cstddef>

namespace conic::io {

namespace {

void appendUtf8(char32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

/**
 * @brief Декодирование одного символа, возвращает длину последовательности
 *
 * Некорректная последовательность отдаётся как один байт.
 */
size_t decodeUtf8(std::string_view input, size_t offset, char32_t& cp) {
    const auto c0 = static_cast<unsigned char>(input[offset]);
    const size_t left = input.size() - offset;

    size_t length = 1;
    char32_t value = c0;
    if ((c0 & 0xE0) == 0xC0) {
        length = 2;
        value = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        length = 3;
        value = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        length = 4;
        value = c0 & 0x07;
    }

    if (length == 1 || length > left) {
        cp = c0;
        return 1;
    }
    for (size_t k = 1; k < length; ++k) {
        const auto ck = static_cast<unsigned char>(input[offset + k]);
        if (!isContinuation(ck)) {
            cp = c0;
            return 1;
        }
        value = (value << 6) | (ck & 0x3F);
    }
    cp = value;
    return length;
}

char32_t toLowerCp(char32_t cp) noexcept {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 32;
    }
    if (cp >= 0x410 && cp <= 0x42F) { // А-Я
        return cp + 0x20;
    }
    if (cp == 0x401) { // Ё
        return 0x451;
    }
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) { // Α-Ω
        return cp + 0x20;
    }
    return cp;
}

bool isSeparator(char c) noexcept {
    switch (c) {
        case ' ': case '\t': case '_': case '-': case '/':
        case '(': case ')': case '[': case ']': case '.':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string utf8ToLower(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size();) {
        char32_t cp = 0;
        const size_t length = decodeUtf8(input, i, cp);
        if (length == 1 && cp >= 0x80) {
            out.push_back(input[i]);
        } else {
            appendUtf8(toLowerCp(cp), out);
        }
        i += length;
    }
    return out;
}

std::string_view trimView(std::string_view str) noexcept {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
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

std::string normalizeColumnName(std::string_view name) {
    const auto lowered = utf8ToLower(trimView(stripBom(name)));

    std::string normalized;
    normalized.reserve(lowered.size());
    bool pending_sep = false;

    for (char c : lowered) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && isSeparator(c)) {
            pending_sep = !normalized.empty();
            continue;
        }
        if (uc < 0x80 && !std::isalnum(uc) && c != '%') {
            continue;
        }
        if (pending_sep) {
            normalized += '_';
            pending_sep = false;
        }
        normalized += c;
    }
    return normalized;
}

std::vector<std::string> splitCells(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];

        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter && !in_quotes) {
            result.emplace_back(trimView(current));
            current.clear();
        } else {
            current += c;
        }
    }

    result.emplace_back(trimView(current));
    return result;
}

std::string quoteCell(std::string_view cell, char delimiter) {
    if (cell.find_first_of(std::string{delimiter, '"', '\n', '\r'}) == std::string_view::npos) {
        return std::string(cell);
    }

    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted += '"';
    for (char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace conic::io
