/**
 * @file marker.hpp
 * @brief Source positions (Marker) and ranges (Span) attached to tokens, events, nodes and errors.
 */

#ifndef YAML_CHURN_MARKER_HPP
#define YAML_CHURN_MARKER_HPP

#include <cstddef>

namespace Churn {

/**
 * @struct Marker
 * @brief A position in the source text.
 *
 * `index` is the 0-based byte offset, `line` is 1-based and `col` is the 0-based
 * column counted in characters. Markers are plain values and never change once produced.
 */
struct Marker {
    std::size_t index = 0; ///< Byte offset from the start of the input.
    std::size_t line = 1;  ///< Line number, starting at 1.
    std::size_t col = 0;   ///< Column, starting at 0.

    constexpr Marker() noexcept = default;
    constexpr Marker(std::size_t i, std::size_t l, std::size_t c) noexcept : index(i), line(l), col(c) {}

    friend constexpr bool operator==(const Marker&, const Marker&) noexcept = default;
};

/**
 * @struct Span
 * @brief A [start, end) range of Markers.
 *
 * Zero-width spans are used for things that have a position but no text, such as the
 * end of an indentation-delimited collection or an omitted mapping value.
 */
struct Span {
    Marker start; ///< First character covered.
    Marker end;   ///< One past the last character covered.

    constexpr Span() noexcept = default;
    constexpr Span(Marker s, Marker e) noexcept : start(s), end(e) {}

    /** @brief A zero-width span located at `m`. */
    static constexpr Span Empty(Marker m) noexcept { return Span(m, m); }

    /** @brief Number of bytes covered. */
    constexpr std::size_t Length() const noexcept { return end.index - start.index; }

    constexpr bool IsEmpty() const noexcept { return Length() == 0; }

    friend constexpr bool operator==(const Span&, const Span&) noexcept = default;
};

} // namespace Churn

#endif // YAML_CHURN_MARKER_HPP
