/**
 * @file scanner.hpp
 * @brief Lexical analysis: turns the characters of an Input into Tokens.
 *
 * The scanner tracks indentation, flow nesting and quoting, and decides whether a
 * scalar is a mapping key once it sees the following `:` ("simple keys"). It has no
 * notion of the document grammar; that is the Parser's job.
 */

#ifndef YAML_CHURN_SCANNER_HPP
#define YAML_CHURN_SCANNER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "chars.hpp"
#include "error.hpp"
#include "input.hpp"
#include "log.hpp"
#include "marker.hpp"
#include "text.hpp"
#include "token.hpp"

namespace Churn {

/**
 * @class Scanner
 * @brief Pull-based tokenizer.
 *
 * Tokens are buffered internally while a potential simple key is unresolved, so a
 * single Next() may read ahead over several tokens. Any lexical problem is reported
 * by throwing Error with ErrorKind::Lexical; the scanner is unusable afterwards.
 */
class Scanner {
public:
    /**
     * @param input Character source.
     * @param max_flow_level Deepest allowed `[`/`{` nesting.
     * @param borrow_text Hand out views into the input for scalars that appear verbatim,
     *        when the input allows it.
     */
    explicit Scanner(Input input, std::size_t max_flow_level = 256, bool borrow_text = true)
        : input_(std::move(input)),
          mark_(input_.Position(), 1, 0),
          max_flow_level_(max_flow_level),
          borrow_text_(borrow_text) {}

    /**
     * @brief Return the next token.
     * @throws Error on malformed input.
     */
    Token Next() {
        if (stream_end_produced_)
            return Token(TokenType::StreamEnd, Span::Empty(mark_));
        if (!token_available_)
            FetchMoreTokens();
        Token t = std::move(tokens_.front());
        tokens_.pop_front();
        token_available_ = false;
        ++tokens_parsed_;
        if (t.type == TokenType::StreamEnd)
            stream_end_produced_ = true;
        if (Log::Enabled(Log::Level::Trace))
            Log::Trace("token {} at line {} column {}: '{}'", TokenTypeName(t.type),
                       t.span.start.line, t.span.start.col + 1, t.value.View());
        return t;
    }

    bool StreamStarted() const noexcept { return stream_start_produced_; }
    bool StreamEnded() const noexcept { return stream_end_produced_; }

    /** @brief Current read position. */
    Marker Mark() const noexcept { return mark_; }

private:
    struct SimpleKey {
        bool possible = false;
        bool required = false;
        std::size_t token_number = 0;
        Marker mark;
    };

    // Indentation level saved on the stack; one-column levels pushed for sequence
    // entries and values produce no BlockEnd when popped.
    struct Indent {
        std::ptrdiff_t indent;
        bool needs_block_end;
    };

    enum class ImplicitMapping { Possible, Inside };

    struct WhitespaceSkipped {
        bool found_tabs = false;
        bool found_spaces = false;
    };

    enum class Chomping { Strip, Clip, Keep };

    [[noreturn]] static void Fail(Marker at, std::string info) {
        throw Error(ErrorKind::Lexical, at, std::move(info));
    }

    std::ptrdiff_t Col() const noexcept { return static_cast<std::ptrdiff_t>(mark_.col); }

    // Consume one byte without touching the leading-whitespace state.
    void Advance() {
        if (!Chars::IsContinuationByte(input_.Peek()))
            ++mark_.col;
        ++mark_.index;
        input_.Skip();
    }

    void SkipBlank() { Advance(); }

    void SkipNonBlank() {
        Advance();
        leading_whitespace_ = false;
    }

    void SkipNonBlank(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i)
            SkipNonBlank();
    }

    void SkipNewline() {
        input_.Skip();
        ++mark_.index;
        mark_.col = 0;
        ++mark_.line;
        leading_whitespace_ = true;
    }

    // Consume CR, LF or CRLF if present.
    void SkipLinebreak() {
        if (input_.Peek() == '\r' && input_.Peek(1) == '\n') {
            SkipBlank();
            SkipNewline();
        } else if (Chars::IsBreak(input_.Peek())) {
            SkipNewline();
        }
    }

    void SkipBreak() {
        if (input_.Peek() == '\r' && input_.Peek(1) == '\n')
            SkipBlank();
        SkipNewline();
    }

    void ReadBreak(std::string& s) {
        SkipBreak();
        s.push_back('\n');
    }

    bool NextIsDocumentIndicator(char c) {
        return input_.Peek() == c && input_.Peek(1) == c && input_.Peek(2) == c &&
               Chars::IsBlankOrBreakZ(input_.Peek(3));
    }

    bool NextIsDocumentStart() { return NextIsDocumentIndicator('-'); }
    bool NextIsDocumentEnd() { return NextIsDocumentIndicator('.'); }
    bool NextIsAnyDocumentIndicator() { return NextIsDocumentStart() || NextIsDocumentEnd(); }

    static bool CanBePlain(char c, char nc, bool in_flow) noexcept {
        if (c == ':' && (Chars::IsBlankOrBreakZ(nc) || (in_flow && Chars::IsFlow(nc))))
            return false;
        return !(in_flow && Chars::IsFlow(c));
    }

    Text MakeText(std::string&& built, bool verbatim, std::size_t begin, std::size_t end) const {
        if (verbatim && borrow_text_ && input_.CanBorrow())
            return Text::Borrow(input_.Slice(begin, end));
        return Text(std::move(built));
    }

    void Push(Token t) { tokens_.push_back(std::move(t)); }

    void Insert(std::size_t pos, Token t) {
        tokens_.insert(tokens_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(t));
    }

    void FetchMoreTokens() {
        for (;;) {
            bool need_more = tokens_.empty();
            if (!need_more) {
                StaleSimpleKeys();
                for (const SimpleKey& sk : simple_keys_) {
                    if (sk.possible && sk.token_number == tokens_parsed_) {
                        need_more = true;
                        break;
                    }
                }
            }
            if (!need_more)
                break;
            FetchNextToken();
        }
        token_available_ = true;
    }

    void FetchNextToken() {
        if (!stream_start_produced_) {
            FetchStreamStart();
            return;
        }
        SkipToNextToken();
        StaleSimpleKeys();
        UnrollIndentAtToken();

        if (Chars::IsZ(input_.Peek())) {
            if (!input_.AtEnd())
                Fail(mark_, "unexpected NUL character");
            FetchStreamEnd();
            return;
        }

        if (mark_.col == 0) {
            if (input_.Peek() == '%') {
                FetchDirective();
                return;
            }
            if (NextIsDocumentStart()) {
                FetchDocumentIndicator(TokenType::DocumentStart);
                return;
            }
            if (NextIsDocumentEnd()) {
                FetchDocumentIndicator(TokenType::DocumentEnd);
                SkipWsToEol(true);
                if (!Chars::IsBreakZ(input_.Peek()))
                    Fail(mark_, "invalid content after document end marker");
                return;
            }
        }

        if (Col() < indent_)
            Fail(mark_, "invalid indentation");

        char c = input_.Peek();
        char nc = input_.Peek(1);
        switch (c) {
            case '[': FetchFlowCollectionStart(TokenType::FlowSequenceStart); return;
            case '{': FetchFlowCollectionStart(TokenType::FlowMappingStart); return;
            case ']': FetchFlowCollectionEnd(TokenType::FlowSequenceEnd); return;
            case '}': FetchFlowCollectionEnd(TokenType::FlowMappingEnd); return;
            case ',': FetchFlowEntry(); return;
            case '*': FetchAnchor(true); return;
            case '&': FetchAnchor(false); return;
            case '!': FetchTag(); return;
            case '\'': FetchFlowScalar(true); return;
            case '"': FetchFlowScalar(false); return;
            default: break;
        }
        if (c == '-' && Chars::IsBlankOrBreakZ(nc)) {
            FetchBlockEntry();
        } else if (c == '?' && Chars::IsBlankOrBreakZ(nc)) {
            FetchKey();
        } else if (c == ':' && Chars::IsBlankOrBreakZ(nc)) {
            FetchValue();
        } else if (c == ':' && flow_level_ > 0 && (Chars::IsFlow(nc) || mark_.index == adjacent_value_allowed_at_)) {
            FetchFlowValue();
        } else if ((c == '|' || c == '>') && flow_level_ == 0) {
            FetchBlockScalar(c == '|');
        } else if (c == '%' || c == '@' || c == '`') {
            Fail(mark_, fmt::format("unexpected character: '{}'", c));
        } else {
            FetchPlainScalar();
        }
    }

    void StaleSimpleKeys() {
        for (SimpleKey& sk : simple_keys_) {
            // Outside flow collections a simple key cannot span lines.
            if (sk.possible && flow_level_ == 0 &&
                (sk.mark.line < mark_.line || sk.mark.index + 1024 < mark_.index)) {
                if (sk.required)
                    Fail(mark_, "simple key expected ':'");
                sk.possible = false;
            }
        }
    }

    void SkipToNextToken() {
        for (;;) {
            char c = input_.Peek();
            if (c == '\t' && IsWithinBlock() && leading_whitespace_ && Col() < indent_) {
                // Tabs may pad an otherwise empty line but never indent content.
                SkipWsToEol(true);
                if (!Chars::IsBreakZ(input_.Peek()))
                    Fail(mark_, "tabs disallowed within this context (block indentation)");
            } else if (c == '\t' || c == ' ') {
                SkipBlank();
            } else if (Chars::IsBreak(c)) {
                SkipLinebreak();
                if (flow_level_ == 0)
                    simple_key_allowed_ = true;
            } else if (c == '#') {
                while (!Chars::IsBreakZ(input_.Peek()))
                    Advance();
            } else {
                break;
            }
        }
    }

    // Skip spaces, line breaks and comments after `?`. At least one is required.
    void SkipYamlWhitespace() {
        bool need_whitespace = true;
        for (;;) {
            char c = input_.Peek();
            if (c == ' ') {
                SkipBlank();
                need_whitespace = false;
            } else if (Chars::IsBreak(c)) {
                SkipLinebreak();
                if (flow_level_ == 0)
                    simple_key_allowed_ = true;
                need_whitespace = false;
            } else if (c == '#') {
                while (!Chars::IsBreakZ(input_.Peek()))
                    Advance();
            } else {
                break;
            }
        }
        if (need_whitespace)
            Fail(mark_, "expected whitespace");
    }

    WhitespaceSkipped SkipWsToEol(bool skip_tabs) {
        WhitespaceSkipped r;
        for (;;) {
            char c = input_.Peek();
            if (c == ' ') {
                r.found_spaces = true;
                SkipBlank();
            } else if (c == '\t' && skip_tabs) {
                r.found_tabs = true;
                SkipBlank();
            } else {
                break;
            }
        }
        if (input_.Peek() == '#') {
            if (!r.found_tabs && !r.found_spaces)
                Fail(mark_, "comments must be separated from other tokens by whitespace");
            while (!Chars::IsBreakZ(input_.Peek()))
                Advance();
        }
        return r;
    }

    void FetchStreamStart() {
        indent_ = -1;
        stream_start_produced_ = true;
        simple_key_allowed_ = true;
        Push(Token(TokenType::StreamStart, Span::Empty(mark_)));
        simple_keys_.push_back(SimpleKey{});
    }

    void FetchStreamEnd() {
        if (mark_.col != 0) {
            mark_.col = 0;
            ++mark_.line;
        }
        for (SimpleKey& sk : simple_keys_) {
            if (sk.required && sk.possible)
                Fail(mark_, "simple key expected");
            sk.possible = false;
        }
        UnrollIndent(-1);
        RemoveSimpleKey();
        simple_key_allowed_ = false;
        Push(Token(TokenType::StreamEnd, Span::Empty(mark_)));
    }

    void FetchDirective() {
        UnrollIndent(-1);
        RemoveSimpleKey();
        simple_key_allowed_ = false;
        ScanDirective();
    }

    void ScanDirective() {
        Marker start = mark_;
        SkipNonBlank();
        std::string name = ScanDirectiveName();
        bool known = true;
        Token tok;
        if (name == "YAML") {
            tok = ScanVersionDirectiveValue(start);
        } else if (name == "TAG") {
            tok = ScanTagDirectiveValue(start);
        } else {
            Log::Warning("ignoring unknown directive '%{}' at line {}", name, start.line);
            known = false;
            while (!Chars::IsBreakZ(input_.Peek()))
                Advance();
        }
        SkipWsToEol(true);
        if (!Chars::IsBreakZ(input_.Peek()))
            Fail(start, "while scanning a directive, did not find expected comment or line break");
        SkipLinebreak();
        if (known)
            Push(std::move(tok));
    }

    std::string ScanDirectiveName() {
        Marker start = mark_;
        std::string name;
        while (Chars::IsAlpha(input_.Peek())) {
            name.push_back(input_.Peek());
            SkipNonBlank();
        }
        if (name.empty())
            Fail(start, "while scanning a directive, could not find expected directive name");
        if (!Chars::IsBlankOrBreakZ(input_.Peek()))
            Fail(start, "while scanning a directive, found unexpected non-alphabetical character");
        return name;
    }

    void SkipBlanks() {
        while (Chars::IsBlank(input_.Peek()))
            SkipBlank();
    }

    Token ScanVersionDirectiveValue(Marker start) {
        SkipBlanks();
        std::uint32_t major = ScanVersionNumber(start);
        if (input_.Peek() != '.')
            Fail(start, "while scanning a YAML directive, did not find expected digit or '.' character");
        SkipNonBlank();
        std::uint32_t minor = ScanVersionNumber(start);
        Token t(TokenType::VersionDirective, Span(start, mark_));
        t.major = major;
        t.minor = minor;
        return t;
    }

    std::uint32_t ScanVersionNumber(Marker start) {
        std::uint32_t value = 0;
        std::size_t length = 0;
        while (Chars::IsDigit(input_.Peek())) {
            if (++length > 9)
                Fail(start, "while scanning a YAML directive, found extremely long version number");
            value = value * 10 + static_cast<std::uint32_t>(input_.Peek() - '0');
            SkipNonBlank();
        }
        if (length == 0)
            Fail(start, "while scanning a YAML directive, did not find expected version number");
        return value;
    }

    Token ScanTagDirectiveValue(Marker start) {
        SkipBlanks();
        std::string handle = ScanTagHandle(true, start);
        SkipBlanks();
        std::string prefix = ScanTagPrefix(start);
        if (!Chars::IsBlankOrBreakZ(input_.Peek()))
            Fail(start, "while scanning TAG, did not find expected whitespace or line break");
        Token t(TokenType::TagDirective, Span(start, mark_));
        t.handle = std::move(handle);
        t.suffix = std::move(prefix);
        return t;
    }

    void FetchTag() {
        SaveSimpleKey();
        simple_key_allowed_ = false;
        Push(ScanTag());
    }

    Token ScanTag() {
        Marker start = mark_;
        std::string handle;
        std::string suffix;
        if (input_.Peek(1) == '<') {
            suffix = ScanVerbatimTag(start);
        } else {
            handle = ScanTagHandle(false, start);
            if (handle.size() >= 2 && handle.front() == '!' && handle.back() == '!') {
                suffix = ScanTagShorthandSuffix("", start);
            } else {
                // Not a handle after all: `!foo` is the primary handle with suffix "foo".
                suffix = ScanTagShorthandSuffix(handle, start);
                handle = "!";
                if (suffix.empty()) {
                    // The non-specific tag `!`.
                    handle.clear();
                    suffix = "!";
                }
            }
        }
        if (!(Chars::IsBlankOrBreakZ(input_.Peek()) || (flow_level_ > 0 && Chars::IsFlow(input_.Peek()))))
            Fail(start, "while scanning a tag, did not find expected whitespace or line break");
        Token t(TokenType::Tag, Span(start, mark_));
        t.handle = std::move(handle);
        t.suffix = std::move(suffix);
        return t;
    }

    std::string ScanTagHandle(bool directive, Marker start) {
        if (input_.Peek() != '!')
            Fail(start, "while scanning a tag, did not find expected '!'");
        std::string handle(1, '!');
        SkipNonBlank();
        while (Chars::IsAlpha(input_.Peek())) {
            handle.push_back(input_.Peek());
            SkipNonBlank();
        }
        if (input_.Peek() == '!') {
            handle.push_back('!');
            SkipNonBlank();
        } else if (directive && handle != "!") {
            Fail(start, "while parsing a tag directive, did not find expected '!'");
        }
        return handle;
    }

    std::string ScanTagPrefix(Marker start) {
        std::string prefix;
        char c = input_.Peek();
        if (c == '!') {
            prefix.push_back(c);
            SkipNonBlank();
        } else if (!Chars::IsTagChar(c)) {
            Fail(start, "invalid global tag character");
        } else if (c == '%') {
            ScanUriEscapes(prefix, start);
        } else {
            prefix.push_back(c);
            SkipNonBlank();
        }
        ScanUriChars(prefix, start);
        return prefix;
    }

    void ScanUriChars(std::string& out, Marker start) {
        while (Chars::IsUriChar(input_.Peek())) {
            if (input_.Peek() == '%') {
                ScanUriEscapes(out, start);
            } else {
                out.push_back(input_.Peek());
                SkipNonBlank();
            }
        }
    }

    std::string ScanVerbatimTag(Marker start) {
        SkipNonBlank(2);
        std::string uri;
        ScanUriChars(uri, start);
        if (input_.Peek() != '>')
            Fail(start, "while scanning a verbatim tag, did not find the expected '>'");
        SkipNonBlank();
        return uri;
    }

    std::string ScanTagShorthandSuffix(const std::string& head, Marker start) {
        std::size_t length = head.size();
        std::string suffix;
        // The leading '!' of the head is not part of the suffix.
        if (length > 1)
            suffix.append(head, 1);
        while (Chars::IsTagChar(input_.Peek())) {
            if (input_.Peek() == '%') {
                ScanUriEscapes(suffix, start);
            } else {
                suffix.push_back(input_.Peek());
                SkipNonBlank();
            }
            ++length;
        }
        if (length == 0)
            Fail(start, "while parsing a tag, did not find expected tag URI");
        return suffix;
    }

    // Decode one UTF-8 character written as `%xx` escapes.
    void ScanUriEscapes(std::string& out, Marker start) {
        std::size_t width = 0;
        std::string bytes;
        do {
            char c = input_.Peek(1);
            char nc = input_.Peek(2);
            if (!(input_.Peek() == '%' && Chars::IsHex(c) && Chars::IsHex(nc)))
                Fail(start, "while parsing a tag, found an invalid escape sequence");
            auto byte = static_cast<unsigned char>((Chars::AsHex(c) << 4) + Chars::AsHex(nc));
            if (width == 0) {
                if ((byte & 0x80) == 0x00)      width = 1;
                else if ((byte & 0xE0) == 0xC0) width = 2;
                else if ((byte & 0xF0) == 0xE0) width = 3;
                else if ((byte & 0xF8) == 0xF0) width = 4;
                else Fail(start, "while parsing a tag, found an incorrect leading UTF-8 byte");
            } else if ((byte & 0xC0) != 0x80) {
                Fail(start, "while parsing a tag, found an incorrect trailing UTF-8 byte");
            }
            bytes.push_back(static_cast<char>(byte));
            SkipNonBlank(3);
        } while (--width > 0);
        out += bytes;
    }

    void FetchAnchor(bool alias) {
        SaveSimpleKey();
        simple_key_allowed_ = false;
        Marker start = mark_;
        SkipNonBlank();
        std::string name;
        while (Chars::IsAnchorChar(input_.Peek())) {
            name.push_back(input_.Peek());
            SkipNonBlank();
        }
        if (name.empty())
            Fail(start, "while scanning an anchor or alias, did not find expected alphabetic or numeric character");
        Token t(alias ? TokenType::Alias : TokenType::Anchor, Span(start, mark_));
        t.value = Text(std::move(name));
        Push(std::move(t));
    }

    void FetchFlowCollectionStart(TokenType type) {
        // `[` and `{` may start a simple key.
        SaveSimpleKey();
        RollOneColIndent();
        IncreaseFlowLevel();
        simple_key_allowed_ = true;
        Marker start = mark_;
        SkipNonBlank();
        Marker end = mark_;
        if (type == TokenType::FlowMappingStart)
            flow_mapping_started_ = true;
        else
            implicit_flow_mapping_states_.push_back(ImplicitMapping::Possible);
        SkipWsToEol(true);
        Push(Token(type, Span(start, end)));
    }

    void FetchFlowCollectionEnd(TokenType type) {
        RemoveSimpleKey();
        DecreaseFlowLevel();
        simple_key_allowed_ = false;
        if (type == TokenType::FlowSequenceEnd) {
            EndImplicitMapping(mark_);
            if (!implicit_flow_mapping_states_.empty())
                implicit_flow_mapping_states_.pop_back();
        }
        Marker start = mark_;
        SkipNonBlank();
        Marker end = mark_;
        SkipWsToEol(true);
        // A flow collection used as a key may be followed directly by `:`.
        if (flow_level_ > 0)
            adjacent_value_allowed_at_ = mark_.index;
        Push(Token(type, Span(start, end)));
    }

    void FetchFlowEntry() {
        RemoveSimpleKey();
        simple_key_allowed_ = true;
        EndImplicitMapping(mark_);
        Marker start = mark_;
        SkipNonBlank();
        Marker end = mark_;
        SkipWsToEol(true);
        Push(Token(TokenType::FlowEntry, Span(start, end)));
    }

    void IncreaseFlowLevel() {
        if (flow_level_ >= max_flow_level_)
            Fail(mark_, "recursion limit exceeded");
        simple_keys_.push_back(SimpleKey{});
        ++flow_level_;
    }

    void DecreaseFlowLevel() {
        if (flow_level_ > 0) {
            --flow_level_;
            simple_keys_.pop_back();
        }
    }

    void FetchBlockEntry() {
        if (flow_level_ > 0)
            Fail(mark_, "'-' is only valid inside a block");
        if (!simple_key_allowed_)
            Fail(mark_, "block sequence entries are not allowed in this context");
        // A property alone on a line at column 0 cannot own a nested sequence.
        if (!tokens_.empty()) {
            const Token& back = tokens_.back();
            if ((back.type == TokenType::Anchor || back.type == TokenType::Tag) &&
                mark_.col == 0 && back.span.start.col == 0 && indent_ > -1)
                Fail(back.span.start, "invalid indentation for anchor");
        }

        Marker mark = mark_;
        SkipNonBlank();
        RollIndent(mark.col, false, 0, TokenType::BlockSequenceStart, mark);
        bool found_tabs = SkipWsToEol(true).found_tabs;
        if (found_tabs && input_.Peek() == '-' && Chars::IsBlankOrBreakZ(input_.Peek(1)))
            Fail(mark_, "'-' must be followed by a valid YAML whitespace");
        SkipWsToEol(false);
        if (Chars::IsBreak(input_.Peek()) || Chars::IsFlow(input_.Peek()))
            RollOneColIndent();
        RemoveSimpleKey();
        simple_key_allowed_ = true;
        Push(Token(TokenType::BlockEntry, Span::Empty(mark_)));
    }

    void FetchDocumentIndicator(TokenType type) {
        UnrollIndent(-1);
        RemoveSimpleKey();
        simple_key_allowed_ = false;
        Marker start = mark_;
        SkipNonBlank(3);
        Push(Token(type, Span(start, mark_)));
    }

    void FetchBlockScalar(bool literal) {
        SaveSimpleKey();
        simple_key_allowed_ = true;
        Push(ScanBlockScalar(literal));
    }

    Token ScanBlockScalar(bool literal) {
        Marker start = mark_;
        Chomping chomping = Chomping::Clip;
        std::size_t increment = 0;
        std::size_t indent = 0;
        bool leading_blank = false;
        ScalarStyle style = literal ? ScalarStyle::Literal : ScalarStyle::Folded;

        std::string string;
        std::string leading_break;
        std::string trailing_breaks;
        std::string chomping_break;

        SkipNonBlank();
        UnrollNonBlockIndents();

        auto read_increment = [&] {
            if (input_.Peek() == '0')
                Fail(mark_, "while scanning a block scalar, found an indentation indicator equal to 0");
            increment = static_cast<std::size_t>(input_.Peek() - '0');
            SkipNonBlank();
        };

        if (input_.Peek() == '+' || input_.Peek() == '-') {
            chomping = input_.Peek() == '+' ? Chomping::Keep : Chomping::Strip;
            SkipNonBlank();
            if (Chars::IsDigit(input_.Peek()))
                read_increment();
        } else if (Chars::IsDigit(input_.Peek())) {
            read_increment();
            if (input_.Peek() == '+' || input_.Peek() == '-') {
                chomping = input_.Peek() == '+' ? Chomping::Keep : Chomping::Strip;
                SkipNonBlank();
            }
        }

        SkipWsToEol(true);
        if (!Chars::IsBreakZ(input_.Peek()))
            Fail(start, "while scanning a block scalar, did not find expected comment or line break");
        if (Chars::IsBreak(input_.Peek()))
            ReadBreak(chomping_break);
        if (input_.Peek() == '\t')
            Fail(mark_, "a block scalar content cannot start with a tab");

        if (increment > 0)
            indent = indent_ >= 0 ? static_cast<std::size_t>(indent_) + increment : increment;

        if (indent == 0)
            SkipBlockScalarFirstLineIndent(indent, trailing_breaks);
        else
            SkipBlockScalarIndent(indent, trailing_breaks);

        // End of stream with no content, e.g. `- |+`.
        if (Chars::IsZ(input_.Peek())) {
            std::string contents;
            if (chomping == Chomping::Strip || mark_.line == start.line)
                contents.clear();
            else if (chomping == Chomping::Clip)
                contents = chomping_break;
            else if (trailing_breaks.empty())
                contents = chomping_break;
            else
                contents = trailing_breaks;
            Token t(TokenType::Scalar, Span(start, mark_));
            t.style = style;
            t.value = Text(std::move(contents));
            return t;
        }

        if (mark_.col < indent && Col() > indent_)
            Fail(mark_, "wrongly indented line in block scalar");

        while (mark_.col == indent && !Chars::IsZ(input_.Peek())) {
            if (indent == 0 && NextIsDocumentEnd())
                break;

            bool trailing_blank = Chars::IsBlank(input_.Peek());
            if (!literal && !leading_break.empty() && !leading_blank && !trailing_blank) {
                string += trailing_breaks;
                if (trailing_breaks.empty())
                    string.push_back(' ');
            } else {
                string += leading_break;
                string += trailing_breaks;
            }
            leading_break.clear();
            trailing_breaks.clear();

            leading_blank = Chars::IsBlank(input_.Peek());

            while (!Chars::IsBreakZ(input_.Peek())) {
                string.push_back(input_.Peek());
                Advance();
            }
            if (Chars::IsZ(input_.Peek()))
                break;

            ReadBreak(leading_break);
            SkipBlockScalarIndent(indent, trailing_breaks);
        }

        if (chomping != Chomping::Strip) {
            string += leading_break;
            // A final line without a line break still counts as terminated.
            if (Chars::IsZ(input_.Peek()) && mark_.col >= std::max<std::size_t>(indent, 1))
                string.push_back('\n');
        }
        if (chomping == Chomping::Keep)
            string += trailing_breaks;

        Token t(TokenType::Scalar, Span(start, mark_));
        t.style = style;
        t.value = Text(std::move(string));
        return t;
    }

    void SkipBlockScalarIndent(std::size_t indent, std::string& breaks) {
        for (;;) {
            while (mark_.col < indent && input_.Peek() == ' ')
                SkipBlank();
            if (!Chars::IsBreak(input_.Peek()))
                break;
            ReadBreak(breaks);
        }
    }

    // Indentation of an auto-detected block scalar: the longest run of leading spaces
    // among the leading empty lines and the first content line.
    void SkipBlockScalarFirstLineIndent(std::size_t& indent, std::string& breaks) {
        std::size_t max_indent = 0;
        for (;;) {
            while (input_.Peek() == ' ')
                SkipBlank();
            max_indent = std::max(max_indent, mark_.col);
            if (!Chars::IsBreak(input_.Peek()))
                break;
            ReadBreak(breaks);
        }
        indent = std::max(max_indent, static_cast<std::size_t>(indent_ + 1));
        if (indent_ > 0)
            indent = std::max<std::size_t>(indent, 1);
    }

    void FetchFlowScalar(bool single) {
        SaveSimpleKey();
        simple_key_allowed_ = false;
        Token t = ScanFlowScalar(single);
        // JSON-like keys may be followed directly by `:`.
        SkipToNextToken();
        adjacent_value_allowed_at_ = mark_.index;
        Push(std::move(t));
    }

    Token ScanFlowScalar(bool single) {
        Marker start = mark_;
        std::string string;
        std::string leading_break;
        std::string trailing_breaks;
        std::string whitespaces;
        bool verbatim = true;

        SkipNonBlank();
        std::size_t content_begin = mark_.index;

        for (;;) {
            if (mark_.col == 0 && NextIsAnyDocumentIndicator())
                Fail(start, "while scanning a quoted scalar, found unexpected document indicator");
            if (Chars::IsZ(input_.Peek()))
                Fail(start, "while scanning a quoted scalar, found unexpected end of stream");
            if (Col() < indent_)
                Fail(mark_, "invalid indentation in quoted scalar");

            bool leading_blanks = false;
            ConsumeFlowScalarNonWhitespace(single, string, leading_blanks, verbatim);

            char c = input_.Peek();
            if ((single && c == '\'') || (!single && c == '"'))
                break;

            while (Chars::IsBlank(input_.Peek()) || Chars::IsBreak(input_.Peek())) {
                if (Chars::IsBlank(input_.Peek())) {
                    if (leading_blanks) {
                        if (input_.Peek() == '\t' && Col() < indent_)
                            Fail(mark_, "tab cannot be used as indentation");
                        SkipBlank();
                    } else {
                        whitespaces.push_back(input_.Peek());
                        SkipBlank();
                    }
                } else {
                    verbatim = false;
                    if (leading_blanks) {
                        ReadBreak(trailing_breaks);
                    } else {
                        whitespaces.clear();
                        ReadBreak(leading_break);
                        leading_blanks = true;
                    }
                }
            }

            // Join the whitespace or fold the line breaks.
            if (leading_blanks) {
                if (leading_break.empty()) {
                    string += trailing_breaks;
                    trailing_breaks.clear();
                } else {
                    if (trailing_breaks.empty()) {
                        string.push_back(' ');
                    } else {
                        string += trailing_breaks;
                        trailing_breaks.clear();
                    }
                    leading_break.clear();
                }
            } else {
                string += whitespaces;
                whitespaces.clear();
            }
        }

        std::size_t content_end = mark_.index;
        SkipNonBlank();
        SkipWsToEol(true);
        char c = input_.Peek();
        bool ok = Chars::IsBreakZ(c) ||
                  (flow_level_ > 0 && (c == ',' || c == '}' || c == ']' || c == ':')) ||
                  (flow_level_ == 0 && c == ':' && start.line == mark_.line);
        if (!ok)
            Fail(mark_, "invalid trailing content after quoted scalar");

        Token t(TokenType::Scalar, Span(start, mark_));
        t.style = single ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted;
        t.value = MakeText(std::move(string), verbatim, content_begin, content_end);
        return t;
    }

    void ConsumeFlowScalarNonWhitespace(bool single, std::string& string, bool& leading_blanks, bool& verbatim) {
        while (!Chars::IsBlankOrBreakZ(input_.Peek())) {
            char c = input_.Peek();
            char nc = input_.Peek(1);
            if (single && c == '\'' && nc == '\'') {
                string.push_back('\'');
                SkipNonBlank(2);
                verbatim = false;
            } else if ((single && c == '\'') || (!single && c == '"')) {
                break;
            } else if (!single && c == '\\' && Chars::IsBreak(nc)) {
                // Escaped line break: the break and leading blanks of the next line vanish.
                SkipNonBlank();
                SkipLinebreak();
                leading_blanks = true;
                verbatim = false;
                break;
            } else if (!single && c == '\\') {
                ResolveEscape(string);
                verbatim = false;
            } else {
                string.push_back(c);
                SkipNonBlank();
            }
        }
    }

    void ResolveEscape(std::string& out) {
        Marker at = mark_;
        std::size_t code_length = 0;
        std::uint32_t code = 0;
        switch (input_.Peek(1)) {
            case '0': code = 0x00; break;
            case 'a': code = 0x07; break;
            case 'b': code = 0x08; break;
            case 't':
            case '\t': code = 0x09; break;
            case 'n': code = 0x0A; break;
            case 'v': code = 0x0B; break;
            case 'f': code = 0x0C; break;
            case 'r': code = 0x0D; break;
            case 'e': code = 0x1B; break;
            case ' ': code = 0x20; break;
            case '"': code = '"'; break;
            case '/': code = '/'; break;
            case '\\': code = '\\'; break;
            case 'N': code = 0x85; break;
            case '_': code = 0xA0; break;
            case 'L': code = 0x2028; break;
            case 'P': code = 0x2029; break;
            case 'x': code_length = 2; break;
            case 'u': code_length = 4; break;
            case 'U': code_length = 8; break;
            default:
                Fail(at, "while parsing a quoted scalar, found unknown escape character");
        }
        SkipNonBlank(2);

        if (code_length > 0) {
            for (std::size_t i = 0; i < code_length; ++i) {
                char c = input_.Peek(i);
                if (!Chars::IsHex(c))
                    Fail(at, "while parsing a quoted scalar, did not find expected hexadecimal number");
                code = (code << 4) + Chars::AsHex(c);
            }
            SkipNonBlank(code_length);
        }
        if (!Chars::AppendUtf8(out, code))
            Fail(at, "while parsing a quoted scalar, found invalid Unicode character escape code");
    }

    void FetchPlainScalar() {
        SaveSimpleKey();
        simple_key_allowed_ = false;
        Push(ScanPlainScalar());
    }

    Token ScanPlainScalar() {
        UnrollNonBlockIndents();
        std::ptrdiff_t indent = indent_ + 1;
        Marker start = mark_;
        bool in_flow = flow_level_ > 0;

        if (in_flow && Col() < indent)
            Fail(start, "invalid indentation in flow construct");

        std::string string;
        std::string whitespaces;
        std::string leading_break;
        std::string trailing_breaks;
        Marker end = mark_;

        for (;;) {
            if ((leading_whitespace_ && NextIsAnyDocumentIndicator()) || input_.Peek() == '#')
                break;
            if (in_flow && input_.Peek() == '-' && Chars::IsFlow(input_.Peek(1)))
                Fail(mark_, "plain scalar cannot start with '-' followed by ,[]{}");

            if (!Chars::IsBlankOrBreakZ(input_.Peek()) && CanBePlain(input_.Peek(), input_.Peek(1), in_flow)) {
                if (leading_whitespace_) {
                    if (leading_break.empty()) {
                        string += trailing_breaks;
                        trailing_breaks.clear();
                    } else {
                        if (trailing_breaks.empty()) {
                            string.push_back(' ');
                        } else {
                            string += trailing_breaks;
                            trailing_breaks.clear();
                        }
                        leading_break.clear();
                    }
                    leading_whitespace_ = false;
                } else if (!whitespaces.empty()) {
                    string += whitespaces;
                    whitespaces.clear();
                }

                string.push_back(input_.Peek());
                SkipNonBlank();
                while (!Chars::IsBlankOrBreakZ(input_.Peek()) && CanBePlain(input_.Peek(), input_.Peek(1), in_flow)) {
                    string.push_back(input_.Peek());
                    SkipNonBlank();
                }
                end = mark_;
            }

            // Ends at end of input, `: `, or a flow indicator in flow context.
            if (!(Chars::IsBlank(input_.Peek()) || Chars::IsBreak(input_.Peek())))
                break;

            while (Chars::IsBlank(input_.Peek()) || Chars::IsBreak(input_.Peek())) {
                if (Chars::IsBlank(input_.Peek())) {
                    if (!leading_whitespace_) {
                        whitespaces.push_back(input_.Peek());
                        SkipBlank();
                    } else if (Col() < indent && input_.Peek() == '\t') {
                        // Tabs in the indentation are only allowed on otherwise empty lines.
                        SkipWsToEol(true);
                        if (!Chars::IsBreakZ(input_.Peek()))
                            Fail(start, "while scanning a plain scalar, found a tab");
                    } else {
                        SkipBlank();
                    }
                } else if (leading_whitespace_) {
                    SkipBreak();
                    trailing_breaks.push_back('\n');
                } else {
                    whitespaces.clear();
                    SkipBreak();
                    leading_break.push_back('\n');
                    leading_whitespace_ = true;
                }
            }

            if (flow_level_ == 0 && Col() < indent)
                break;
        }

        if (leading_whitespace_)
            simple_key_allowed_ = true;

        // An empty plain scalar would never advance the input, e.g. "{...".
        if (string.empty())
            Fail(start, "unexpected end of plain scalar");

        bool verbatim = end.line == start.line;
        Token t(TokenType::Scalar, Span(start, end));
        t.style = ScalarStyle::Plain;
        t.value = MakeText(std::move(string), verbatim, start.index, end.index);
        return t;
    }

    void FetchKey() {
        Marker start = mark_;
        if (flow_level_ == 0) {
            if (!simple_key_allowed_)
                Fail(mark_, "mapping keys are not allowed in this context");
            RollIndent(start.col, false, 0, TokenType::BlockMappingStart, start);
        } else {
            flow_mapping_started_ = true;
        }
        RemoveSimpleKey();
        simple_key_allowed_ = flow_level_ == 0;
        SkipNonBlank();
        SkipYamlWhitespace();
        if (input_.Peek() == '\t')
            Fail(mark_, "tabs disallowed in this context");
        Push(Token(TokenType::Key, Span(start, mark_)));
    }

    void FetchFlowValue() {
        char nc = input_.Peek(1);
        // `[a:[]]` is invalid unless the key is JSON-like; `[a:]` has an empty value.
        if (mark_.index != adjacent_value_allowed_at_ && (nc == '[' || nc == '{'))
            Fail(mark_, "':' may not precede any of `[{` in flow mapping");
        FetchValue();
    }

    void FetchValue() {
        SimpleKey sk = simple_keys_.back();
        Marker start = mark_;
        bool implicit_flow_mapping = !implicit_flow_mapping_states_.empty() && !flow_mapping_started_;
        if (implicit_flow_mapping)
            implicit_flow_mapping_states_.back() = ImplicitMapping::Inside;

        SkipNonBlank();
        if (input_.Peek() == '\t' && !SkipWsToEol(true).found_spaces &&
            (input_.Peek() == '-' || Chars::IsAlpha(input_.Peek())))
            Fail(mark_, "':' must be followed by a valid YAML whitespace");

        if (sk.possible) {
            // The saved token turns out to be a key.
            Insert(sk.token_number - tokens_parsed_, Token(TokenType::Key, Span::Empty(sk.mark)));
            if (implicit_flow_mapping) {
                if (sk.mark.line < start.line)
                    Fail(start, "illegal placement of ':' indicator");
                Insert(sk.token_number - tokens_parsed_, Token(TokenType::FlowMappingStart, Span::Empty(sk.mark)));
            }
            RollIndent(sk.mark.col, true, sk.token_number, TokenType::BlockMappingStart, sk.mark);
            RollOneColIndent();
            simple_keys_.back().possible = false;
            simple_key_allowed_ = false;
        } else {
            if (implicit_flow_mapping)
                Push(Token(TokenType::FlowMappingStart, Span::Empty(start)));
            // The ':' follows a complex key, or there is no key at all.
            if (flow_level_ == 0) {
                if (!simple_key_allowed_)
                    Fail(start, "mapping values are not allowed in this context");
                RollIndent(start.col, false, 0, TokenType::BlockMappingStart, start);
            }
            RollOneColIndent();
            simple_key_allowed_ = flow_level_ == 0;
        }
        Push(Token(TokenType::Value, Span::Empty(start)));
    }

    // Push a block indentation level and its start token when `col` is deeper than the current one.
    void RollIndent(std::size_t col, bool at_number, std::size_t number, TokenType type, Marker mark) {
        if (flow_level_ > 0)
            return;
        auto c = static_cast<std::ptrdiff_t>(col);
        // A one-column level that turns out to start a block is replaced.
        if (indent_ <= c && !indents_.empty() && !indents_.back().needs_block_end) {
            indent_ = indents_.back().indent;
            indents_.pop_back();
        }
        if (indent_ < c) {
            indents_.push_back(Indent{indent_, true});
            indent_ = c;
            if (at_number)
                Insert(number - tokens_parsed_, Token(type, Span::Empty(mark)));
            else
                Push(Token(type, Span::Empty(mark)));
        }
    }

    // Pop levels deeper than `col`, emitting BlockEnd for each block level.
    // Returns whether any block level was closed.
    bool UnrollIndent(std::ptrdiff_t col) {
        if (flow_level_ > 0)
            return false;
        bool closed = false;
        while (indent_ > col) {
            Indent top = indents_.back();
            indents_.pop_back();
            indent_ = top.indent;
            if (top.needs_block_end) {
                Push(Token(TokenType::BlockEnd, Span::Empty(mark_)));
                closed = true;
            }
        }
        return closed;
    }

    // Dedent at the first token of a line must land exactly on an enclosing block level.
    void UnrollIndentAtToken() {
        bool at_line_start = leading_whitespace_ && flow_level_ == 0;
        bool closed = UnrollIndent(Col());
        if (at_line_start && closed && indent_ >= 0 && indent_ < Col())
            Fail(mark_, "inconsistent indentation");
    }

    void RollOneColIndent() {
        if (flow_level_ == 0 && !indents_.empty() && indents_.back().needs_block_end) {
            indents_.push_back(Indent{indent_, false});
            ++indent_;
        }
    }

    void UnrollNonBlockIndents() {
        while (!indents_.empty() && !indents_.back().needs_block_end) {
            indent_ = indents_.back().indent;
            indents_.pop_back();
        }
    }

    void SaveSimpleKey() {
        if (!simple_key_allowed_)
            return;
        SimpleKey sk;
        sk.possible = true;
        sk.required = flow_level_ == 0 && indent_ == Col() && !indents_.empty() && indents_.back().needs_block_end;
        sk.token_number = tokens_parsed_ + tokens_.size();
        sk.mark = mark_;
        simple_keys_.back() = sk;
    }

    void RemoveSimpleKey() {
        SimpleKey& last = simple_keys_.back();
        if (last.possible && last.required)
            Fail(mark_, "simple key expected");
        last.possible = false;
    }

    bool IsWithinBlock() const noexcept { return !indents_.empty(); }

    void EndImplicitMapping(Marker mark) {
        if (!implicit_flow_mapping_states_.empty() && implicit_flow_mapping_states_.back() == ImplicitMapping::Inside) {
            flow_mapping_started_ = false;
            implicit_flow_mapping_states_.back() = ImplicitMapping::Possible;
            Push(Token(TokenType::FlowMappingEnd, Span::Empty(mark)));
        }
    }

    Input input_;
    Marker mark_;
    std::size_t max_flow_level_;
    bool borrow_text_;

    std::deque<Token> tokens_;
    bool stream_start_produced_ = false;
    bool stream_end_produced_ = false;
    std::size_t adjacent_value_allowed_at_ = 0;
    bool simple_key_allowed_ = true;
    std::vector<SimpleKey> simple_keys_;
    std::ptrdiff_t indent_ = -1;
    std::vector<Indent> indents_;
    std::size_t flow_level_ = 0;
    std::size_t tokens_parsed_ = 0;
    bool token_available_ = false;
    bool leading_whitespace_ = true;
    bool flow_mapping_started_ = false;
    std::vector<ImplicitMapping> implicit_flow_mapping_states_;
};

} // namespace Churn

#endif // YAML_CHURN_SCANNER_HPP
