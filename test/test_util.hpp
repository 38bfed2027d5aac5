/**
 * @file test_util.hpp
 * @brief Helpers shared by the yaml_churn test programs.
 */

#ifndef YAML_CHURN_TEST_UTIL_HPP
#define YAML_CHURN_TEST_UTIL_HPP

// The tests are plain assert() programs; keep the checks in release builds too.
#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../yaml_churn.hpp"

namespace TestUtil {

/**
 * @brief One-line rendering of an event, in the notation of the YAML test suite.
 *
 * `+SEQ []`, `=VAL :plain`, `=VAL "quoted`, `=VAL |literal`, `=ALI *1`, `&1` for an
 * anchor, `<tag>` for a tag. Line breaks in values are shown as `\n`.
 */
inline std::string Describe(const Churn::Event& e) {
    auto props = [&e]() {
        std::string s;
        if (e.anchor != 0)
            s += " &" + std::to_string(e.anchor);
        if (e.tag)
            s += " <" + e.tag->Str() + ">";
        return s;
    };
    switch (e.type) {
        case Churn::EventType::StreamStart:   return "+STR";
        case Churn::EventType::StreamEnd:     return "-STR";
        case Churn::EventType::DocumentStart: return e.explicit_marker ? "+DOC ---" : "+DOC";
        case Churn::EventType::DocumentEnd:   return e.explicit_marker ? "-DOC ..." : "-DOC";
        case Churn::EventType::SequenceStart:
            return "+SEQ" + std::string(e.collection_style == Churn::CollectionStyle::Flow ? " []" : "") + props();
        case Churn::EventType::SequenceEnd:   return "-SEQ";
        case Churn::EventType::MappingStart:
            return "+MAP" + std::string(e.collection_style == Churn::CollectionStyle::Flow ? " {}" : "") + props();
        case Churn::EventType::MappingEnd:    return "-MAP";
        case Churn::EventType::Alias:         return "=ALI *" + std::to_string(e.anchor);
        case Churn::EventType::Scalar: {
            std::string s = "=VAL" + props() + " ";
            switch (e.style) {
                case Churn::ScalarStyle::Plain:        s += ':'; break;
                case Churn::ScalarStyle::SingleQuoted: s += '\''; break;
                case Churn::ScalarStyle::DoubleQuoted: s += '"'; break;
                case Churn::ScalarStyle::Literal:      s += '|'; break;
                case Churn::ScalarStyle::Folded:       s += '>'; break;
            }
            for (char c : e.value.View()) {
                if (c == '\n')
                    s += "\\n";
                else
                    s += c;
            }
            return s;
        }
    }
    return "?";
}

/** @brief Parse `yaml` completely and return every event, described. */
inline std::vector<std::string> Events(std::string_view yaml, Churn::ParserOptions options = {}) {
    std::vector<std::string> out;
    Churn::Parser parser = Churn::Parser::FromString(yaml, options);
    parser.Parse([&out](const Churn::Event& e) { out.push_back(Describe(e)); });
    return out;
}

/** @brief Parse `yaml` completely and return the events themselves. */
inline std::vector<Churn::Event> Collect(std::string_view yaml, Churn::ParserOptions options = {}) {
    std::vector<Churn::Event> out;
    Churn::Parser parser = Churn::Parser::FromString(yaml, options);
    while (!parser.Done())
        out.push_back(parser.Next());
    return out;
}

/** @brief Run `fn`, which must throw Churn::Error, and return the error. */
template<typename Fn>
Churn::Error ExpectError(Fn&& fn) {
    try {
        fn();
    } catch (const Churn::Error& e) {
        return e;
    }
    throw std::logic_error("expected a Churn::Error, but none was thrown");
}

/** @brief The error produced by parsing `yaml` to the end. */
inline Churn::Error ParseError(std::string_view yaml, Churn::ParserOptions options = {}) {
    return ExpectError([&]() { Events(yaml, options); });
}

/** @brief True when `error` has the given kind and position (`col` is 0-based). */
inline bool IsErrorAt(const Churn::Error& error, Churn::ErrorKind kind, std::size_t line, std::size_t col) {
    if (error.Kind() == kind && error.GetMarker().line == line && error.GetMarker().col == col)
        return true;
    std::cerr << "unexpected error: " << Churn::ErrorKindName(error.Kind()) << ": " << error.what() << "\n";
    return false;
}

inline void PrintEvents(const std::vector<std::string>& events) {
    for (const std::string& e : events)
        std::cout << "  " << e << "\n";
}

} // namespace TestUtil

#endif // YAML_CHURN_TEST_UTIL_HPP
