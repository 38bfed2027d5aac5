/**
 * @file token.hpp
 * @brief Lexical tokens handed from the Scanner to the Parser, and the scalar style enum they share with events.
 */

#ifndef YAML_CHURN_TOKEN_HPP
#define YAML_CHURN_TOKEN_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "marker.hpp"
#include "text.hpp"

namespace Churn {

/** @brief How a scalar was written. Decides termination and escaping, never the scalar's type. */
enum class ScalarStyle {
    Plain,        ///< Unquoted.
    SingleQuoted, ///< `'...'`, only `''` is an escape.
    DoubleQuoted, ///< `"..."`, backslash escapes.
    Literal,      ///< `|` block scalar, line breaks kept.
    Folded        ///< `>` block scalar, line breaks folded to spaces.
};

inline std::string_view ScalarStyleName(ScalarStyle style) noexcept {
    switch (style) {
        case ScalarStyle::Plain:        return "plain";
        case ScalarStyle::SingleQuoted: return "single-quoted";
        case ScalarStyle::DoubleQuoted: return "double-quoted";
        case ScalarStyle::Literal:      return "literal";
        case ScalarStyle::Folded:       return "folded";
    }
    return "unknown";
}

/** @brief Kinds of token produced by the Scanner. */
enum class TokenType {
    StreamStart,
    StreamEnd,
    VersionDirective,   ///< `%YAML major.minor`
    TagDirective,       ///< `%TAG handle prefix`
    DocumentStart,      ///< `---`
    DocumentEnd,        ///< `...`
    BlockSequenceStart,
    BlockMappingStart,
    BlockEnd,           ///< Closes the innermost block collection.
    FlowSequenceStart,  ///< `[`
    FlowSequenceEnd,    ///< `]`
    FlowMappingStart,   ///< `{`
    FlowMappingEnd,     ///< `}`
    BlockEntry,         ///< `-`
    FlowEntry,          ///< `,`
    Key,                ///< `?`, or inserted in front of a simple key
    Value,              ///< `:`
    Alias,              ///< `*name`
    Anchor,             ///< `&name`
    Tag,                ///< `!handle!suffix`, `!suffix`, `!<verbatim>`
    Scalar
};

inline std::string_view TokenTypeName(TokenType type) noexcept {
    switch (type) {
        case TokenType::StreamStart:        return "StreamStart";
        case TokenType::StreamEnd:          return "StreamEnd";
        case TokenType::VersionDirective:   return "VersionDirective";
        case TokenType::TagDirective:       return "TagDirective";
        case TokenType::DocumentStart:      return "DocumentStart";
        case TokenType::DocumentEnd:        return "DocumentEnd";
        case TokenType::BlockSequenceStart: return "BlockSequenceStart";
        case TokenType::BlockMappingStart:  return "BlockMappingStart";
        case TokenType::BlockEnd:           return "BlockEnd";
        case TokenType::FlowSequenceStart:  return "FlowSequenceStart";
        case TokenType::FlowSequenceEnd:    return "FlowSequenceEnd";
        case TokenType::FlowMappingStart:   return "FlowMappingStart";
        case TokenType::FlowMappingEnd:     return "FlowMappingEnd";
        case TokenType::BlockEntry:         return "BlockEntry";
        case TokenType::FlowEntry:          return "FlowEntry";
        case TokenType::Key:                return "Key";
        case TokenType::Value:              return "Value";
        case TokenType::Alias:              return "Alias";
        case TokenType::Anchor:             return "Anchor";
        case TokenType::Tag:                return "Tag";
        case TokenType::Scalar:             return "Scalar";
    }
    return "Unknown";
}

/**
 * @struct Token
 * @brief One lexical unit with its source span.
 *
 * Only the fields relevant to `type` are meaningful:
 *   - Scalar: `style`, `value`
 *   - Alias, Anchor: `value` (the name)
 *   - Tag: `handle`, `suffix`; a verbatim tag has an empty handle
 *   - TagDirective: `handle`, `suffix` (holding the prefix)
 *   - VersionDirective: `major`, `minor`
 */
struct Token {
    TokenType type = TokenType::StreamStart;
    Span span;
    Text value;
    ScalarStyle style = ScalarStyle::Plain;
    std::string handle;
    std::string suffix;
    std::uint32_t major = 0;
    std::uint32_t minor = 0;

    Token() = default;
    Token(TokenType t, Span s) : type(t), span(s) {}
};

} // namespace Churn

#endif // YAML_CHURN_TOKEN_HPP
