/**
 * @file error.hpp
 * @brief The single exception type thrown by the scanner, parser, loader and input layers.
 */

#ifndef YAML_CHURN_ERROR_HPP
#define YAML_CHURN_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "marker.hpp"

namespace Churn {

/** @brief Which stage rejected the input. */
enum class ErrorKind {
    Lexical,      ///< Malformed token: bad escape, unterminated scalar, bad indentation, tab.
    Syntax,       ///< Valid token in an invalid place, or an unsupported directive.
    Anchor,       ///< Alias to an anchor that is not defined in the current document.
    DuplicateKey, ///< Mapping key collision under DuplicateKeyPolicy::Error.
    Source        ///< The underlying input could not be read or decoded.
};

/** @brief Human-readable name of an ErrorKind. */
inline std::string_view ErrorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Lexical:      return "LexicalError";
        case ErrorKind::Syntax:       return "SyntaxError";
        case ErrorKind::Anchor:       return "AnchorError";
        case ErrorKind::DuplicateKey: return "DuplicateKeyError";
        case ErrorKind::Source:       return "SourceError";
    }
    return "Error";
}

/**
 * @class Error
 * @brief A positioned parse failure.
 *
 * `what()` reads "<info> at byte <index> line <line> column <col + 1>" so that
 * messages match the usual editor convention, while `GetMarker()` keeps the raw
 * 0-based column.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, Marker mark, std::string info)
        : std::runtime_error(fmt::format("{} at byte {} line {} column {}",
                                         info, mark.index, mark.line, mark.col + 1)),
          kind_(kind), mark_(mark), info_(std::move(info)) {}

    /** @brief Stage that produced the error. */
    ErrorKind Kind() const noexcept { return kind_; }

    /** @brief Position of the offending character. */
    const Marker& GetMarker() const noexcept { return mark_; }

    /** @brief The message without positional suffix. */
    const std::string& Info() const noexcept { return info_; }

private:
    ErrorKind kind_;
    Marker mark_;
    std::string info_;
};

} // namespace Churn

#endif // YAML_CHURN_ERROR_HPP
