/**
 * @file emitter.hpp
 * @brief Writes a Document or Stream back out as block-style YAML text.
 *
 * The output is structural: scalar text, tags, nesting and node sharing survive a
 * Load() of the result, while styles, comments and the source anchor names do not.
 * Nodes reachable more than once get generated anchors (`&a1`, `&a2`, ...) at their
 * first occurrence and aliases afterwards, which also covers cyclic graphs.
 *
 * Usage Example:
 * @code
 * Churn::Stream docs = Churn::Load("a: [1, 2]\n");
 * std::string text = Churn::Emit(docs);   // "---\na:\n  - 1\n  - 2\n"
 * @endcode
 */

#ifndef YAML_CHURN_EMITTER_HPP
#define YAML_CHURN_EMITTER_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "chars.hpp"
#include "node.hpp"

namespace Churn {

/** @brief Emitter tuning. */
struct EmitterOptions {
    std::size_t indent = 2;         ///< Spaces per nesting level.
    bool multiline_strings = false; ///< Write multi-line scalars as literal blocks where possible.
    std::size_t max_depth = 256;    ///< Deepest collection nesting written before giving up.
};

/**
 * @class Emitter
 * @brief Appends documents to an output string.
 *
 * Nesting is written recursively, so EmitDocument() throws std::runtime_error for a
 * tree whose collections nest deeper than EmitterOptions::max_depth. Trees built by
 * the Loader with the same limit always fit.
 */
class Emitter {
public:
    explicit Emitter(EmitterOptions options = {}) : options_(options) {}

    /** @brief Write `---` followed by the document's root node. */
    void EmitDocument(const Document& doc) {
        refs_.clear();
        anchors_.clear();
        next_anchor_ = 1;
        level_ = -1;

        out_ += "---\n";
        if (!doc.Root())
            return;
        CountReferences(*doc.Root());

        const Node& root = *doc.Root();
        std::string props = Properties(root);
        if (IsNonEmptyCollection(root)) {
            if (!props.empty()) {
                out_ += props;
                out_ += '\n';
            }
            EmitCollection(root);
        } else {
            if (!props.empty()) {
                out_ += props;
                out_ += ' ';
            }
            EmitLeaf(root, true);
        }
        out_ += '\n';
    }

    /** @brief Everything written so far. */
    const std::string& Str() const noexcept { return out_; }

    /** @brief Move the output out, leaving the emitter empty. */
    std::string Take() {
        std::string s = std::move(out_);
        out_.clear();
        return s;
    }

private:
    static bool IsNonEmptyCollection(const Node& n) noexcept { return !n.IsScalar() && n.Size() > 0; }

    // Number of incoming references per node; a node counted twice needs an anchor.
    void CountReferences(const Node& root) {
        std::vector<const Node*> work{&root};
        while (!work.empty()) {
            const Node* n = work.back();
            work.pop_back();
            if (++refs_[n] > 1)
                continue;
            if (n->IsSequence()) {
                for (const Node* item : n->AsSequence())
                    work.push_back(item);
            } else if (n->IsMapping()) {
                for (const Node::Pair& p : n->AsMapping()) {
                    work.push_back(p.first);
                    work.push_back(p.second);
                }
            }
        }
    }

    // Anchor name given to `n` at its first occurrence, or nullptr.
    const std::string* EmittedAnchor(const Node& n) const {
        auto it = anchors_.find(&n);
        return it == anchors_.end() ? nullptr : &it->second;
    }

    // Anchor and tag for the first occurrence of `n`.
    std::string Properties(const Node& n) {
        std::string props;
        if (refs_[&n] > 1) {
            std::string name = fmt::format("a{}", next_anchor_++);
            props = "&" + name;
            anchors_.emplace(&n, std::move(name));
        }
        if (n.GetTag() && !n.GetTag()->Str().empty()) {
            if (!props.empty())
                props += ' ';
            props += "!<";
            AppendUriEscaped(props, n.GetTag()->Str());
            props += '>';
        }
        return props;
    }

    static void AppendUriEscaped(std::string& to, std::string_view tag) {
        for (char c : tag) {
            if (Chars::IsUriChar(c) && c != '%')
                to += c;
            else
                fmt::format_to(std::back_inserter(to), "%{:02X}", static_cast<unsigned char>(c));
        }
    }

    void WriteIndent(int level) {
        if (level > 0)
            out_.append(static_cast<std::size_t>(level) * options_.indent, ' ');
    }

    void EmitCollection(const Node& n) {
        if (static_cast<std::size_t>(level_ + 1) >= options_.max_depth)
            throw std::runtime_error(
                fmt::format("Churn::Emitter: collections nest deeper than {} levels", options_.max_depth));
        if (n.IsSequence())
            EmitSequence(n);
        else
            EmitMapping(n);
    }

    void EmitSequence(const Node& n) {
        ++level_;
        bool first = true;
        for (const Node* item : n.AsSequence()) {
            if (!first) {
                out_ += '\n';
                WriteIndent(level_);
            }
            first = false;
            out_ += '-';
            EmitValue(*item, true);
        }
        --level_;
    }

    void EmitMapping(const Node& n) {
        ++level_;
        bool first = true;
        for (const Node::Pair& p : n.AsMapping()) {
            if (!first) {
                out_ += '\n';
                WriteIndent(level_);
            }
            first = false;
            if (NeedsComplexKey(*p.first)) {
                out_ += '?';
                EmitValue(*p.first, true);
                out_ += '\n';
                WriteIndent(level_);
                out_ += ':';
                EmitValue(*p.second, true);
            } else {
                EmitSimpleKey(*p.first);
                out_ += ':';
                EmitValue(*p.second, false);
            }
        }
        --level_;
    }

    // Implicit keys must fit on one line and stay under the 1024 character lookahead.
    bool NeedsComplexKey(const Node& key) const {
        if (EmittedAnchor(key))
            return false;
        if (!key.IsScalar())
            return true;
        return key.Value().Size() > 1000;
    }

    void EmitSimpleKey(const Node& key) {
        if (const std::string* name = EmittedAnchor(key)) {
            // ':' is a valid anchor character, so the alias needs a separating space.
            out_ += '*';
            out_ += *name;
            out_ += ' ';
            return;
        }
        std::string props = Properties(key);
        if (!props.empty()) {
            out_ += props;
            out_ += ' ';
        }
        EmitLeaf(key, false);
    }

    // Write `n` after an indicator (`-`, `?`, `:`). Inline values may start on the indicator's line.
    void EmitValue(const Node& n, bool inline_value) {
        if (const std::string* name = EmittedAnchor(n)) {
            out_ += " *";
            out_ += *name;
            return;
        }
        std::string props = Properties(n);
        if (IsNonEmptyCollection(n)) {
            if (!props.empty()) {
                out_ += ' ';
                out_ += props;
                out_ += '\n';
                WriteIndent(level_ + 1);
            } else if (inline_value) {
                out_ += ' ';
            } else {
                out_ += '\n';
                WriteIndent(level_ + 1);
            }
            EmitCollection(n);
            return;
        }
        out_ += ' ';
        if (!props.empty()) {
            out_ += props;
            out_ += ' ';
        }
        EmitLeaf(n, true);
    }

    // Scalars and empty collections.
    void EmitLeaf(const Node& n, bool allow_block) {
        if (n.IsSequence()) {
            out_ += "[]";
        } else if (n.IsMapping()) {
            out_ += "{}";
        } else {
            std::string_view s = n.Value().View();
            if (allow_block && options_.multiline_strings && FitsLiteralBlock(s))
                EmitLiteralBlock(s);
            else if (NeedsQuotes(s))
                EmitDoubleQuoted(s);
            else
                out_ += s;
        }
    }

    /**
     * @brief False when `s` can be written plain and read back as the same text.
     */
    static bool NeedsQuotes(std::string_view s) noexcept {
        if (s.empty() || s.front() == ' ' || s.back() == ' ')
            return true;
        switch (s.front()) {
            case '&': case '*': case '?': case '|': case '-': case '<': case '>':
            case '=': case '!': case '%': case '@': case '.':
                return true;
            default:
                break;
        }
        for (char c : s) {
            switch (c) {
                case ':': case '{': case '}': case '[': case ']': case ',': case '#':
                case '`': case '"': case '\'': case '\\': case '\x7f':
                    return true;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                        return true;
            }
        }
        return false;
    }

    // Literal blocks keep text verbatim, but only text that auto-detected indentation and clip/strip chomping reproduce.
    static bool FitsLiteralBlock(std::string_view s) noexcept {
        if (s.find('\n') == std::string_view::npos || s.front() == ' ' || s.front() == '\n')
            return false;
        if (s.size() >= 2 && s.substr(s.size() - 2) == "\n\n")
            return false;
        std::size_t line_start = 0;
        for (std::size_t i = 0; i <= s.size(); ++i) {
            if (i < s.size() && s[i] != '\n') {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if ((c < 0x20 && c != '\t') || c == 0x7f)
                    return false;
                continue;
            }
            std::string_view line = s.substr(line_start, i - line_start);
            if (!line.empty() && (line.front() == '\t' || line.find_first_not_of(" \t") == std::string_view::npos))
                return false;
            line_start = i + 1;
        }
        return true;
    }

    void EmitLiteralBlock(std::string_view s) {
        bool keep_newline = s.back() == '\n';
        out_ += keep_newline ? "|" : "|-";
        if (keep_newline)
            s.remove_suffix(1);
        int level = std::max(level_ + 1, 1);
        std::size_t pos = 0;
        while (pos <= s.size()) {
            std::size_t nl = s.find('\n', pos);
            std::string_view line = s.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
            out_ += '\n';
            if (!line.empty()) {
                WriteIndent(level);
                out_ += line;
            }
            if (nl == std::string_view::npos)
                break;
            pos = nl + 1;
        }
    }

    void EmitDoubleQuoted(std::string_view s) {
        out_ += '"';
        for (char c : s) {
            switch (c) {
                case '"':  out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\b': out_ += "\\b"; break;
                case '\t': out_ += "\\t"; break;
                case '\n': out_ += "\\n"; break;
                case '\f': out_ += "\\f"; break;
                case '\r': out_ += "\\r"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20 || c == '\x7f')
                        fmt::format_to(std::back_inserter(out_), "\\u{:04x}", static_cast<unsigned char>(c));
                    else
                        out_ += c;
            }
        }
        out_ += '"';
    }

    EmitterOptions options_;
    std::string out_;
    int level_ = -1;
    std::unordered_map<const Node*, std::size_t> refs_;
    std::unordered_map<const Node*, std::string> anchors_;
    std::size_t next_anchor_ = 1;
};

/** @brief Serialize one document. */
inline std::string Emit(const Document& doc, const EmitterOptions& options = {}) {
    Emitter emitter(options);
    emitter.EmitDocument(doc);
    return emitter.Take();
}

/** @brief Serialize every document of a stream, each introduced by `---`. */
inline std::string Emit(const Stream& stream, const EmitterOptions& options = {}) {
    Emitter emitter(options);
    for (const Document& doc : stream)
        emitter.EmitDocument(doc);
    return emitter.Take();
}

} // namespace Churn

#endif // YAML_CHURN_EMITTER_HPP
