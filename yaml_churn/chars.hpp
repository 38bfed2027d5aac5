/**
 * @file chars.hpp
 * @brief Byte classification used by the scanner.
 *
 * The scanner works on UTF-8 bytes. Every indicator and whitespace character in the
 * format is ASCII, so bytes of multi-byte sequences simply classify as ordinary
 * content. `'\0'` stands for end of input.
 */

#ifndef YAML_CHURN_CHARS_HPP
#define YAML_CHURN_CHARS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace Churn {
namespace Chars {

constexpr bool IsZ(char c) noexcept { return c == '\0'; }
constexpr bool IsBreak(char c) noexcept { return c == '\n' || c == '\r'; }
constexpr bool IsBreakZ(char c) noexcept { return IsBreak(c) || IsZ(c); }
constexpr bool IsBlank(char c) noexcept { return c == ' ' || c == '\t'; }
constexpr bool IsBlankOrBreakZ(char c) noexcept { return IsBlank(c) || IsBreakZ(c); }
constexpr bool IsDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/** @brief `[0-9a-zA-Z_-]`, the characters allowed in directive names and tag handles. */
constexpr bool IsAlpha(char c) noexcept {
    return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}

constexpr bool IsHex(char c) noexcept {
    return IsDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr std::uint32_t AsHex(char c) noexcept {
    if (IsDigit(c)) return static_cast<std::uint32_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint32_t>(c - 'a' + 10);
    return static_cast<std::uint32_t>(c - 'A' + 10);
}

/** @brief The flow indicators `,[]{}`. */
constexpr bool IsFlow(char c) noexcept {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

/** @brief Characters allowed in anchor and alias names. */
constexpr bool IsAnchorChar(char c) noexcept {
    return !IsBlankOrBreakZ(c) && !IsFlow(c);
}

constexpr bool IsWordChar(char c) noexcept { return IsAlpha(c) && c != '_'; }

constexpr bool IsUriChar(char c) noexcept {
    if (IsWordChar(c))
        return true;
    switch (c) {
        case '#': case ';': case '/': case '?': case ':': case '@': case '&': case '=':
        case '+': case '$': case ',': case '_': case '.': case '!': case '~': case '*':
        case '\'': case '(': case ')': case '[': case ']': case '%':
            return true;
        default:
            return false;
    }
}

constexpr bool IsTagChar(char c) noexcept { return IsUriChar(c) && !IsFlow(c) && c != '!'; }

/** @brief True for the second and later bytes of a UTF-8 sequence; they do not advance the column. */
constexpr bool IsContinuationByte(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/**
 * @brief Append the UTF-8 encoding of a code point.
 * @return false if `cp` is a surrogate or lies beyond U+10FFFF.
 */
inline bool AppendUtf8(std::string& out, std::uint32_t cp) {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
        return false;
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
    return true;
}

} // namespace Chars
} // namespace Churn

#endif // YAML_CHURN_CHARS_HPP
