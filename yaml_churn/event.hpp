/**
 * @file event.hpp
 * @brief Parser output: the Event record, resolved tags, document directives and the push-style receiver interface.
 */

#ifndef YAML_CHURN_EVENT_HPP
#define YAML_CHURN_EVENT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "marker.hpp"
#include "text.hpp"
#include "token.hpp"

namespace Churn {

/** @brief Kinds of event produced by the Parser. */
enum class EventType {
    StreamStart,
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    Alias,
    Scalar,
    SequenceStart,
    SequenceEnd,
    MappingStart,
    MappingEnd
};

inline std::string_view EventTypeName(EventType type) noexcept {
    switch (type) {
        case EventType::StreamStart:   return "StreamStart";
        case EventType::StreamEnd:     return "StreamEnd";
        case EventType::DocumentStart: return "DocumentStart";
        case EventType::DocumentEnd:   return "DocumentEnd";
        case EventType::Alias:         return "Alias";
        case EventType::Scalar:        return "Scalar";
        case EventType::SequenceStart: return "SequenceStart";
        case EventType::SequenceEnd:   return "SequenceEnd";
        case EventType::MappingStart:  return "MappingStart";
        case EventType::MappingEnd:    return "MappingEnd";
    }
    return "Unknown";
}

/** @brief Whether a collection was written with indentation or with brackets. */
enum class CollectionStyle { Block, Flow };

/**
 * @brief Document-scoped anchor number. The first anchor of a document is 1; 0 means "no anchor".
 */
using AnchorId = std::size_t;

/**
 * @struct Tag
 * @brief A resolved tag: the prefix its handle stands for, plus the suffix.
 *
 * `!!str` resolves to {"tag:yaml.org,2002:", "str"}, `!local` to {"!", "local"},
 * a verbatim `!<uri>` to {"", "uri"} and the non-specific `!` to {"", "!"}.
 */
struct Tag {
    std::string handle; ///< Resolved prefix.
    std::string suffix;

    /** @brief The full tag text. */
    std::string Str() const { return handle + suffix; }

    /** @brief True for the non-specific tag `!`. */
    bool IsNonSpecific() const noexcept { return handle.empty() && suffix == "!"; }

    friend bool operator==(const Tag&, const Tag&) = default;
};

/** @brief Directives in force for one document. */
struct Directives {
    std::optional<std::pair<std::uint32_t, std::uint32_t>> version; ///< From `%YAML major.minor`.
    std::vector<std::pair<std::string, std::string>> tags;          ///< From `%TAG handle prefix`, in order.

    bool Empty() const noexcept { return !version && tags.empty(); }
};

/**
 * @struct Event
 * @brief One structural event.
 *
 * Fields that do not apply to `type` keep their defaults:
 *   - Scalar: `value`, `style`, `tag`, `anchor`
 *   - SequenceStart, MappingStart: `collection_style`, `tag`, `anchor`
 *   - Alias: `anchor` (the id it refers to)
 *   - DocumentStart: `explicit_marker`, `directives`
 *   - DocumentEnd: `explicit_marker`
 */
struct Event {
    EventType type = EventType::StreamStart;
    Span span;
    Text value;
    ScalarStyle style = ScalarStyle::Plain;
    CollectionStyle collection_style = CollectionStyle::Block;
    std::optional<Tag> tag;
    AnchorId anchor = 0;
    bool explicit_marker = false;
    Directives directives;

    Event() = default;
    Event(EventType t, Span s) : type(t), span(s) {}

    bool IsStart() const noexcept {
        return type == EventType::StreamStart || type == EventType::DocumentStart ||
               type == EventType::SequenceStart || type == EventType::MappingStart;
    }

    bool IsEnd() const noexcept {
        return type == EventType::StreamEnd || type == EventType::DocumentEnd ||
               type == EventType::SequenceEnd || type == EventType::MappingEnd;
    }
};

/**
 * @class EventReceiver
 * @brief Callback interface for Parser::Parse().
 */
class EventReceiver {
public:
    virtual ~EventReceiver() = default;

    /** @brief Called once per event, in document order. */
    virtual void OnEvent(const Event& event) = 0;
};

/** @brief Adapts a callable to EventReceiver. */
class FunctionReceiver : public EventReceiver {
public:
    explicit FunctionReceiver(std::function<void(const Event&)> fn) : fn_(std::move(fn)) {}

    void OnEvent(const Event& event) override { fn_(event); }

private:
    std::function<void(const Event&)> fn_;
};

} // namespace Churn

#endif // YAML_CHURN_EVENT_HPP
