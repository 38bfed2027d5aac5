/**
 * @file parser.hpp
 * @brief Grammar engine: an explicit-stack pushdown automaton that turns Tokens into Events.
 *
 * Every grammar production (document, block/flow collection, key, value, node) is a
 * State. Entering a nested production pushes the state to return to instead of
 * recursing, so native stack use is constant regardless of how deeply the input nests.
 * Nesting is still bounded by ParserOptions::max_depth so hostile input is rejected
 * with an ordinary error.
 */

#ifndef YAML_CHURN_PARSER_HPP
#define YAML_CHURN_PARSER_HPP

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "error.hpp"
#include "event.hpp"
#include "input.hpp"
#include "log.hpp"
#include "scanner.hpp"
#include "token.hpp"

namespace Churn {

/** @brief Parser tuning. */
struct ParserOptions {
    std::size_t max_depth = 256; ///< Deepest allowed collection nesting.
    bool borrow_text = true;     ///< Let scalars view the caller's buffer when possible.
};

/**
 * @class Parser
 * @brief Pull parser producing one Event per Next() call.
 *
 * The first error is remembered: every later call to Next() or Peek() throws it again.
 * Anchors are numbered per document, starting at 1, and forgotten at each DocumentStart.
 */
class Parser {
public:
    explicit Parser(Input input, ParserOptions options = {})
        : scanner_(std::move(input), options.max_depth, options.borrow_text), options_(options) {}

    /** @brief Parse a UTF-8 string. Borrowed scalars point into `text`. */
    static Parser FromString(std::string_view text, ParserOptions options = {}) {
        return Parser(Input::FromString(text), options);
    }

    /** @brief Parse a byte buffer in UTF-8 or UTF-16, with or without a BOM. */
    static Parser FromBytes(std::string_view bytes, const DecodeOptions& decode = {}, ParserOptions options = {}) {
        return Parser(Input::FromOwned(DecodeBytes(bytes, decode)), options);
    }

    /** @brief Parse characters from an iterator range. */
    template<typename It>
    static Parser FromRange(It first, It last, ParserOptions options = {}) {
        return Parser(Input::FromRange(first, last), options);
    }

    /** @brief Parse from a stream; the stream must outlive the parser. */
    static Parser FromStream(std::istream& is, ParserOptions options = {}) {
        return Parser(Input::FromStream(is), options);
    }

    /**
     * @brief Advance to the next event.
     * @throws Error on the first problem in the input, and on every call after it.
     */
    Event Next() {
        if (peeked_) {
            Event e = std::move(*peeked_);
            peeked_.reset();
            return e;
        }
        return Produce();
    }

    /** @brief The event the next Next() will return, without consuming it. */
    const Event& Peek() {
        if (!peeked_)
            peeked_ = Produce();
        return *peeked_;
    }

    /** @brief True once StreamEnd has been returned. */
    bool Done() const noexcept { return state_ == State::End && !peeked_; }

    /**
     * @brief Feed every remaining event to `receiver`, stopping after StreamEnd.
     * @throws Error as Next() does.
     */
    void Parse(EventReceiver& receiver) {
        while (!Done())
            receiver.OnEvent(Next());
    }

    void Parse(std::function<void(const Event&)> fn) {
        FunctionReceiver receiver(std::move(fn));
        Parse(receiver);
    }

    /** @brief Current collection nesting depth. */
    std::size_t Depth() const noexcept { return depth_; }

private:
    enum class State {
        StreamStart,
        ImplicitDocumentStart,
        DocumentStart,
        DocumentContent,
        DocumentEnd,
        BlockNode,
        BlockSequenceFirstEntry,
        BlockSequenceEntry,
        IndentlessSequenceEntry,
        BlockMappingFirstKey,
        BlockMappingKey,
        BlockMappingValue,
        FlowSequenceFirstEntry,
        FlowSequenceEntry,
        FlowSequenceEntryMappingKey,
        FlowSequenceEntryMappingValue,
        FlowSequenceEntryMappingEnd,
        FlowMappingFirstKey,
        FlowMappingKey,
        FlowMappingValue,
        FlowMappingEmptyValue,
        End
    };

    // A pushed return state. `mark` is only used by FlowSequenceEntryMappingEnd.
    struct Frame {
        State state;
        Marker mark;
    };

    [[noreturn]] static void Fail(Marker at, std::string info) {
        throw Error(ErrorKind::Syntax, at, std::move(info));
    }

    Event Produce() {
        if (error_)
            throw *error_;
        if (state_ == State::End)
            Fail(scanner_.Mark(), "no more events after the end of the stream");
        try {
            Event e = StateMachine();
            Track(e);
            if (Log::Enabled(Log::Level::Debug))
                Log::Debug("event {} at line {} column {}", EventTypeName(e.type), e.span.start.line,
                           e.span.start.col + 1);
            return e;
        } catch (const Error& e) {
            error_ = e;
            throw;
        }
    }

    void Track(const Event& e) {
        if (e.type == EventType::SequenceStart || e.type == EventType::MappingStart) {
            if (++depth_ > options_.max_depth)
                Fail(e.span.start, "recursion limit exceeded");
        } else if (e.type == EventType::SequenceEnd || e.type == EventType::MappingEnd) {
            --depth_;
        }
    }

    const Token& PeekToken() {
        if (!token_)
            token_ = scanner_.Next();
        return *token_;
    }

    Token FetchToken() {
        PeekToken();
        Token t = std::move(*token_);
        token_.reset();
        return t;
    }

    void SkipToken() { token_.reset(); }

    TokenType PeekType() { return PeekToken().type; }

    void PushState(State s, Marker mark = {}) { states_.push_back(Frame{s, mark}); }

    void PopState() {
        Frame f = states_.back();
        states_.pop_back();
        state_ = f.state;
        pending_mark_ = f.mark;
    }

    static Event EmptyScalar(Marker at) {
        Event e(EventType::Scalar, Span::Empty(at));
        e.style = ScalarStyle::Plain;
        return e;
    }

    Event StateMachine() {
        switch (state_) {
            case State::StreamStart:                   return StreamStart();
            case State::ImplicitDocumentStart:         return DocumentStart(true);
            case State::DocumentStart:                 return DocumentStart(false);
            case State::DocumentContent:               return DocumentContent();
            case State::DocumentEnd:                   return DocumentEnd();
            case State::BlockNode:                     return ParseNode(true, false);
            case State::BlockSequenceFirstEntry:       return BlockSequenceEntry(true);
            case State::BlockSequenceEntry:            return BlockSequenceEntry(false);
            case State::IndentlessSequenceEntry:       return IndentlessSequenceEntry();
            case State::BlockMappingFirstKey:          return BlockMappingKey(true);
            case State::BlockMappingKey:               return BlockMappingKey(false);
            case State::BlockMappingValue:             return BlockMappingValue();
            case State::FlowSequenceFirstEntry:        return FlowSequenceEntry(true);
            case State::FlowSequenceEntry:             return FlowSequenceEntry(false);
            case State::FlowSequenceEntryMappingKey:   return FlowSequenceEntryMappingKey();
            case State::FlowSequenceEntryMappingValue: return FlowSequenceEntryMappingValue();
            case State::FlowSequenceEntryMappingEnd:   return FlowSequenceEntryMappingEnd();
            case State::FlowMappingFirstKey:           return FlowMappingKey(true);
            case State::FlowMappingKey:                return FlowMappingKey(false);
            case State::FlowMappingValue:              return FlowMappingValue(false);
            case State::FlowMappingEmptyValue:         return FlowMappingValue(true);
            case State::End:                           break;
        }
        Fail(scanner_.Mark(), "no more events after the end of the stream");
    }

    Event StreamStart() {
        const Token& t = PeekToken();
        if (t.type != TokenType::StreamStart)
            Fail(t.span.start, "did not find expected <stream-start>");
        Event e(EventType::StreamStart, t.span);
        SkipToken();
        state_ = State::ImplicitDocumentStart;
        return e;
    }

    Event DocumentStart(bool implicit) {
        while (PeekType() == TokenType::DocumentEnd)
            SkipToken();

        const Token& t = PeekToken();
        if (t.type == TokenType::StreamEnd) {
            Event e(EventType::StreamEnd, t.span);
            SkipToken();
            state_ = State::End;
            return e;
        }
        if (implicit && t.type != TokenType::VersionDirective && t.type != TokenType::TagDirective &&
            t.type != TokenType::DocumentStart) {
            // A bare document: no directives, no `---`.
            BeginDocument();
            Event e(EventType::DocumentStart, Span::Empty(t.span.start));
            e.explicit_marker = false;
            PushState(State::DocumentEnd);
            state_ = State::BlockNode;
            return e;
        }
        return ExplicitDocumentStart();
    }

    Event ExplicitDocumentStart() {
        BeginDocument();
        ProcessDirectives();
        const Token& t = PeekToken();
        if (t.type != TokenType::DocumentStart)
            Fail(t.span.start, "did not find expected <document start>");
        Event e(EventType::DocumentStart, t.span);
        e.explicit_marker = true;
        e.directives = directives_;
        SkipToken();
        PushState(State::DocumentEnd);
        state_ = State::DocumentContent;
        return e;
    }

    void BeginDocument() {
        anchors_.clear();
        next_anchor_ = 1;
        tag_handles_.clear();
        directives_ = Directives{};
    }

    void ProcessDirectives() {
        for (;;) {
            const Token& t = PeekToken();
            if (t.type == TokenType::VersionDirective) {
                if (directives_.version)
                    Fail(t.span.start, "duplicate version directive");
                if (t.major != 1)
                    Fail(t.span.start, fmt::format("found incompatible YAML document (version {}.{})", t.major, t.minor));
                if (t.minor > 2)
                    Log::Warning("YAML version {}.{} is newer than 1.2; parsing as 1.2", t.major, t.minor);
                directives_.version = std::make_pair(t.major, t.minor);
            } else if (t.type == TokenType::TagDirective) {
                if (tag_handles_.count(t.handle))
                    Fail(t.span.start, "the TAG directive must only be given at most once per handle in the same document");
                tag_handles_.emplace(t.handle, t.suffix);
                directives_.tags.emplace_back(t.handle, t.suffix);
            } else {
                break;
            }
            SkipToken();
        }
    }

    Event DocumentContent() {
        switch (PeekType()) {
            case TokenType::VersionDirective:
            case TokenType::TagDirective:
            case TokenType::DocumentStart:
            case TokenType::DocumentEnd:
            case TokenType::StreamEnd: {
                Marker at = PeekToken().span.start;
                PopState();
                return EmptyScalar(at);
            }
            default:
                return ParseNode(true, false);
        }
    }

    Event DocumentEnd() {
        const Token& t = PeekToken();
        Event e(EventType::DocumentEnd, Span::Empty(t.span.start));
        if (t.type == TokenType::DocumentEnd) {
            e.span = t.span;
            e.explicit_marker = true;
            SkipToken();
            state_ = State::ImplicitDocumentStart;
        } else {
            TokenType next = t.type;
            if (next == TokenType::VersionDirective || next == TokenType::TagDirective)
                Fail(t.span.start, "missing explicit document end marker before directive");
            state_ = State::DocumentStart;
        }
        return e;
    }

    AnchorId RegisterAnchor(const Text& name) {
        // Redefinition shadows the earlier anchor for later aliases.
        AnchorId id = next_anchor_++;
        anchors_[name.Str()] = id;
        return id;
    }

    Tag ResolveTag(const Token& t) {
        if (t.handle.empty())
            return Tag{"", t.suffix};
        auto it = tag_handles_.find(t.handle);
        if (it != tag_handles_.end())
            return Tag{it->second, t.suffix};
        if (t.handle == "!!")
            return Tag{"tag:yaml.org,2002:", t.suffix};
        if (t.handle == "!")
            return Tag{"!", t.suffix};
        Fail(t.span.start, fmt::format("the tag handle '{}' was not declared", t.handle));
    }

    Event ParseNode(bool block, bool indentless_sequence) {
        if (PeekType() == TokenType::Alias) {
            PopState();
            Token t = FetchToken();
            auto it = anchors_.find(t.value.Str());
            if (it == anchors_.end())
                throw Error(ErrorKind::Anchor, t.span.start,
                            fmt::format("while parsing node, found unknown anchor '{}'", t.value.View()));
            Event e(EventType::Alias, t.span);
            e.anchor = it->second;
            return e;
        }

        AnchorId anchor = 0;
        std::optional<Tag> tag;
        std::optional<Marker> props_start;
        Marker props_end;
        for (int i = 0; i < 2; ++i) {
            TokenType type = PeekType();
            if (type == TokenType::Anchor && anchor == 0) {
                Token t = FetchToken();
                if (!props_start)
                    props_start = t.span.start;
                props_end = t.span.end;
                anchor = RegisterAnchor(t.value);
            } else if (type == TokenType::Tag && !tag) {
                Token t = FetchToken();
                if (!props_start)
                    props_start = t.span.start;
                props_end = t.span.end;
                tag = ResolveTag(t);
            } else {
                break;
            }
        }

        auto start_event = [&](EventType type, CollectionStyle style, const Token& t) {
            Event e(type, Span(props_start.value_or(t.span.start), t.span.end));
            e.collection_style = style;
            e.tag = tag;
            e.anchor = anchor;
            return e;
        };

        const Token& t = PeekToken();
        switch (t.type) {
            case TokenType::BlockEntry:
                if (!indentless_sequence)
                    break;
                state_ = State::IndentlessSequenceEntry;
                return start_event(EventType::SequenceStart, CollectionStyle::Block, t);
            case TokenType::Scalar: {
                PopState();
                Token s = FetchToken();
                Event e(EventType::Scalar, Span(props_start.value_or(s.span.start), s.span.end));
                e.value = std::move(s.value);
                e.style = s.style;
                e.tag = std::move(tag);
                e.anchor = anchor;
                return e;
            }
            case TokenType::FlowSequenceStart:
                state_ = State::FlowSequenceFirstEntry;
                return start_event(EventType::SequenceStart, CollectionStyle::Flow, t);
            case TokenType::FlowMappingStart:
                state_ = State::FlowMappingFirstKey;
                return start_event(EventType::MappingStart, CollectionStyle::Flow, t);
            case TokenType::BlockSequenceStart:
                if (!block)
                    break;
                state_ = State::BlockSequenceFirstEntry;
                return start_event(EventType::SequenceStart, CollectionStyle::Block, t);
            case TokenType::BlockMappingStart:
                if (!block)
                    break;
                state_ = State::BlockMappingFirstKey;
                return start_event(EventType::MappingStart, CollectionStyle::Block, t);
            default:
                break;
        }

        if (props_start) {
            // Properties with no content, e.g. `!!str` followed by a line break.
            PopState();
            Event e(EventType::Scalar, Span(*props_start, props_end));
            e.tag = std::move(tag);
            e.anchor = anchor;
            return e;
        }
        Fail(t.span.start, "while parsing a node, did not find expected node content");
    }

    Event BlockSequenceEntry(bool first) {
        if (first)
            SkipToken();
        const Token& t = PeekToken();
        if (t.type == TokenType::BlockEnd) {
            Event e(EventType::SequenceEnd, t.span);
            PopState();
            SkipToken();
            return e;
        }
        if (t.type != TokenType::BlockEntry)
            Fail(t.span.start, "while parsing a block collection, did not find expected '-' indicator");
        SkipToken();
        const Token& n = PeekToken();
        if (n.type == TokenType::BlockEntry || n.type == TokenType::BlockEnd) {
            state_ = State::BlockSequenceEntry;
            return EmptyScalar(n.span.start);
        }
        PushState(State::BlockSequenceEntry);
        return ParseNode(true, false);
    }

    Event IndentlessSequenceEntry() {
        const Token& t = PeekToken();
        if (t.type != TokenType::BlockEntry) {
            Event e(EventType::SequenceEnd, Span::Empty(t.span.start));
            PopState();
            return e;
        }
        SkipToken();
        const Token& n = PeekToken();
        if (n.type == TokenType::BlockEntry || n.type == TokenType::Key || n.type == TokenType::Value ||
            n.type == TokenType::BlockEnd) {
            state_ = State::IndentlessSequenceEntry;
            return EmptyScalar(n.span.start);
        }
        PushState(State::IndentlessSequenceEntry);
        return ParseNode(true, false);
    }

    Event BlockMappingKey(bool first) {
        if (first)
            SkipToken();
        const Token& t = PeekToken();
        switch (t.type) {
            case TokenType::Key: {
                SkipToken();
                const Token& n = PeekToken();
                if (n.type == TokenType::Key || n.type == TokenType::Value || n.type == TokenType::BlockEnd) {
                    state_ = State::BlockMappingValue;
                    return EmptyScalar(n.span.start);
                }
                PushState(State::BlockMappingValue);
                return ParseNode(true, true);
            }
            case TokenType::Value:
                // `: v` with the key omitted.
                state_ = State::BlockMappingValue;
                return EmptyScalar(t.span.start);
            case TokenType::BlockEnd: {
                Event e(EventType::MappingEnd, t.span);
                PopState();
                SkipToken();
                return e;
            }
            default:
                Fail(t.span.start, "while parsing a block mapping, did not find expected key");
        }
    }

    Event BlockMappingValue() {
        const Token& t = PeekToken();
        if (t.type != TokenType::Value) {
            state_ = State::BlockMappingKey;
            return EmptyScalar(t.span.start);
        }
        Marker at = t.span.start;
        SkipToken();
        TokenType n = PeekType();
        if (n == TokenType::Key || n == TokenType::Value || n == TokenType::BlockEnd) {
            state_ = State::BlockMappingKey;
            return EmptyScalar(at);
        }
        PushState(State::BlockMappingKey);
        return ParseNode(true, true);
    }

    Event FlowSequenceEntry(bool first) {
        if (first)
            SkipToken();
        const Token* t = &PeekToken();
        if (t->type != TokenType::FlowSequenceEnd && !first) {
            if (t->type != TokenType::FlowEntry)
                Fail(t->span.start, "while parsing a flow sequence, expected ',' or ']'");
            SkipToken();
            t = &PeekToken();
        }
        if (t->type == TokenType::FlowSequenceEnd) {
            Event e(EventType::SequenceEnd, t->span);
            PopState();
            SkipToken();
            return e;
        }
        if (t->type == TokenType::Key) {
            // `[? k : v]`, a single-pair mapping inside the sequence.
            Event e(EventType::MappingStart, t->span);
            e.collection_style = CollectionStyle::Flow;
            SkipToken();
            state_ = State::FlowSequenceEntryMappingKey;
            return e;
        }
        PushState(State::FlowSequenceEntry);
        return ParseNode(false, false);
    }

    Event FlowSequenceEntryMappingKey() {
        const Token& t = PeekToken();
        if (t.type == TokenType::Value || t.type == TokenType::FlowEntry || t.type == TokenType::FlowSequenceEnd) {
            state_ = State::FlowSequenceEntryMappingValue;
            return EmptyScalar(t.span.start);
        }
        PushState(State::FlowSequenceEntryMappingValue);
        return ParseNode(false, false);
    }

    Event FlowSequenceEntryMappingValue() {
        const Token& t = PeekToken();
        if (t.type != TokenType::Value) {
            state_ = State::FlowSequenceEntryMappingEnd;
            pending_mark_ = t.span.start;
            return EmptyScalar(t.span.start);
        }
        SkipToken();
        const Token& n = PeekToken();
        if (n.type == TokenType::FlowEntry || n.type == TokenType::FlowSequenceEnd) {
            state_ = State::FlowSequenceEntryMappingEnd;
            pending_mark_ = n.span.start;
            return EmptyScalar(n.span.start);
        }
        PushState(State::FlowSequenceEntryMappingEnd, n.span.start);
        return ParseNode(false, false);
    }

    Event FlowSequenceEntryMappingEnd() {
        state_ = State::FlowSequenceEntry;
        return Event(EventType::MappingEnd, Span::Empty(pending_mark_));
    }

    Event FlowMappingKey(bool first) {
        if (first)
            SkipToken();
        const Token* t = &PeekToken();
        if (t->type != TokenType::FlowMappingEnd) {
            if (!first) {
                if (t->type != TokenType::FlowEntry)
                    Fail(t->span.start, "while parsing a flow mapping, did not find expected ',' or '}'");
                SkipToken();
                t = &PeekToken();
            }
            if (t->type == TokenType::Key) {
                SkipToken();
                const Token& n = PeekToken();
                if (n.type == TokenType::Value || n.type == TokenType::FlowEntry || n.type == TokenType::FlowMappingEnd) {
                    state_ = State::FlowMappingValue;
                    return EmptyScalar(n.span.start);
                }
                PushState(State::FlowMappingValue);
                return ParseNode(false, false);
            }
            if (t->type == TokenType::Value) {
                state_ = State::FlowMappingValue;
                return EmptyScalar(t->span.start);
            }
            if (t->type != TokenType::FlowMappingEnd) {
                // `{a, b: c}`: an entry without `:` has an empty value.
                PushState(State::FlowMappingEmptyValue);
                return ParseNode(false, false);
            }
        }
        Event e(EventType::MappingEnd, t->span);
        PopState();
        SkipToken();
        return e;
    }

    Event FlowMappingValue(bool empty) {
        const Token& t = PeekToken();
        if (empty) {
            state_ = State::FlowMappingKey;
            return EmptyScalar(t.span.start);
        }
        if (t.type == TokenType::Value) {
            Marker at = t.span.end;
            SkipToken();
            TokenType n = PeekType();
            if (n != TokenType::FlowEntry && n != TokenType::FlowMappingEnd) {
                PushState(State::FlowMappingKey);
                return ParseNode(false, false);
            }
            state_ = State::FlowMappingKey;
            return EmptyScalar(at);
        }
        state_ = State::FlowMappingKey;
        return EmptyScalar(t.span.start);
    }

    Scanner scanner_;
    ParserOptions options_;

    State state_ = State::StreamStart;
    std::vector<Frame> states_;
    Marker pending_mark_;
    std::optional<Token> token_;
    std::optional<Event> peeked_;
    std::optional<Error> error_;
    std::size_t depth_ = 0;

    std::unordered_map<std::string, AnchorId> anchors_;
    AnchorId next_anchor_ = 1;
    std::unordered_map<std::string, std::string> tag_handles_;
    Directives directives_;
};

} // namespace Churn

#endif // YAML_CHURN_PARSER_HPP
