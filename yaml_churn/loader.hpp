/**
 * @file loader.hpp
 * @brief Folds parser events into Documents of Nodes, resolving aliases to shared nodes.
 *
 * Usage Example:
 * @code
 * #include "yaml_churn.hpp"
 * Churn::Stream docs = Churn::Load("server:\n  host: localhost\n");
 * std::string host = docs[0]["server"]["host"].AsString();
 * @endcode
 */

#ifndef YAML_CHURN_LOADER_HPP
#define YAML_CHURN_LOADER_HPP

#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "error.hpp"
#include "event.hpp"
#include "input.hpp"
#include "log.hpp"
#include "node.hpp"
#include "parser.hpp"

namespace Churn {

/** @brief What to do when a mapping receives a key it already has. */
enum class DuplicateKeyPolicy {
    Error,     ///< Throw ErrorKind::DuplicateKey at the second key.
    KeepFirst, ///< Ignore the later pair.
    KeepLast   ///< Overwrite the earlier pair's value, keeping its position.
};

/** @brief Whether loaded scalars may keep pointing into the caller's input buffer. */
enum class TextOwnership {
    Copy,  ///< Every scalar owns its text; the tree is independent of the input.
    Borrow ///< Verbatim scalars view the input, which must outlive the tree.
};

/** @brief Loader tuning. */
struct LoaderOptions {
    DuplicateKeyPolicy duplicate_keys = DuplicateKeyPolicy::Error;
    TextOwnership text = TextOwnership::Copy;
    ParserOptions parser;
};

/**
 * @class Loader
 * @brief EventReceiver that builds one Document per DocumentStart/DocumentEnd pair.
 *
 * Building is iterative: open collections live on an explicit stack. An anchored
 * collection is registered when it starts, so an alias inside it refers back to it
 * and forms a cycle. If an error interrupts loading, Documents() still holds every
 * document completed before it.
 */
class Loader : public EventReceiver {
public:
    explicit Loader(LoaderOptions options = {}) : options_(std::move(options)) {}

    void OnEvent(const Event& event) override {
        switch (event.type) {
            case EventType::StreamStart:
            case EventType::StreamEnd:
                break;
            case EventType::DocumentStart:
                current_.emplace();
                current_->SetExplicitStart(event.explicit_marker);
                current_->SetDirectives(event.directives);
                anchors_.clear();
                stack_.clear();
                break;
            case EventType::DocumentEnd:
                current_->SetExplicitEnd(event.explicit_marker);
                docs_.push_back(std::move(*current_));
                current_.reset();
                break;
            case EventType::Alias: {
                auto it = anchors_.find(event.anchor);
                if (it == anchors_.end())
                    throw Error(ErrorKind::Anchor, event.span.start, "alias to an anchor that is not defined");
                Complete(it->second, event.span);
                break;
            }
            case EventType::Scalar: {
                Text value = event.value;
                if (options_.text == TextOwnership::Copy)
                    value.MakeOwned();
                Node* n = current_->Arena().NewScalar(std::move(value), event.style);
                n->SetTag(event.tag);
                n->SetAnchor(event.anchor);
                n->SetSpan(event.span);
                Bind(event.anchor, n);
                Complete(n, event.span);
                break;
            }
            case EventType::SequenceStart:
            case EventType::MappingStart: {
                Node* n = event.type == EventType::SequenceStart
                              ? current_->Arena().NewSequence(event.collection_style)
                              : current_->Arena().NewMapping(event.collection_style);
                n->SetTag(event.tag);
                n->SetAnchor(event.anchor);
                n->SetSpan(event.span);
                Bind(event.anchor, n);
                stack_.push_back(Frame{n});
                break;
            }
            case EventType::SequenceEnd:
            case EventType::MappingEnd: {
                Node* n = stack_.back().node;
                stack_.pop_back();
                n->SetSpan(Span(n->GetSpan().start, event.span.end));
                Complete(n, n->GetSpan());
                break;
            }
        }
    }

    /** @brief Documents completed so far. */
    const std::vector<Document>& Documents() const noexcept { return docs_; }

    /** @brief Move the completed documents out as a Stream. */
    Stream TakeStream() {
        Stream s(std::move(docs_));
        docs_.clear();
        return s;
    }

    /** @brief Run `parser` to the end of its stream and return the documents. */
    Stream Load(Parser& parser) {
        parser.Parse(*this);
        return TakeStream();
    }

private:
    // An open collection. For mappings, `key` holds a key still waiting for its value
    // and `duplicate_of` the index of the earlier pair it collides with.
    struct Frame {
        explicit Frame(Node* n) : node(n) {}

        Node* node;
        Node* key = nullptr;
        std::optional<std::size_t> duplicate_of;
        std::unordered_map<std::string_view, std::size_t> scalar_keys;
        std::vector<std::size_t> collection_keys;
    };

    void Bind(AnchorId id, Node* n) {
        if (id != 0)
            anchors_[id] = n;
    }

    // Attach a finished node to its parent, or make it the document root.
    void Complete(Node* n, const Span& span) {
        if (stack_.empty()) {
            current_->SetRoot(n);
            return;
        }
        Frame& f = stack_.back();
        if (f.node->IsSequence()) {
            f.node->Append(n);
            return;
        }
        if (!f.key) {
            f.key = n;
            f.duplicate_of = FindKey(f, *n);
            if (f.duplicate_of) {
                std::string shown = n->IsScalar() ? n->AsString() : Node::KindToStr(n->Type());
                if (options_.duplicate_keys == DuplicateKeyPolicy::Error)
                    throw Error(ErrorKind::DuplicateKey, span.start, fmt::format("duplicate mapping key '{}'", shown));
                Log::Info("duplicate mapping key '{}' at line {}: keeping the {} value", shown, span.start.line,
                          options_.duplicate_keys == DuplicateKeyPolicy::KeepFirst ? "first" : "last");
            }
            return;
        }

        Node* key = f.key;
        f.key = nullptr;
        if (f.duplicate_of) {
            if (options_.duplicate_keys == DuplicateKeyPolicy::KeepLast)
                f.node->ReplaceValue(*f.duplicate_of, n);
            f.duplicate_of.reset();
            return;
        }
        std::size_t idx = f.node->Size();
        f.node->Insert(key, n);
        if (key->IsScalar())
            f.scalar_keys.emplace(key->Value().View(), idx);
        else
            f.collection_keys.push_back(idx);
    }

    // Index of an existing pair whose key equals `key`: raw text for scalars, structure for collections.
    static std::optional<std::size_t> FindKey(const Frame& f, const Node& key) {
        if (key.IsScalar()) {
            auto it = f.scalar_keys.find(key.Value().View());
            if (it != f.scalar_keys.end())
                return it->second;
            return std::nullopt;
        }
        for (std::size_t idx : f.collection_keys)
            if (StructurallyEqual(*f.node->AsMapping()[idx].first, key))
                return idx;
        return std::nullopt;
    }

    LoaderOptions options_;
    std::vector<Document> docs_;
    std::optional<Document> current_;
    std::vector<Frame> stack_;
    std::unordered_map<AnchorId, Node*> anchors_;
};

/**
 * @brief Load every document of a UTF-8 string.
 * @throws Error on the first problem in the input.
 */
inline Stream Load(std::string_view text, const LoaderOptions& options = {}) {
    Parser parser = Parser::FromString(text, options.parser);
    Loader loader(options);
    return loader.Load(parser);
}

/**
 * @brief Load every document of a byte buffer in UTF-8 or UTF-16.
 *
 * The decoded text is owned by the parser, so scalars are always copied.
 */
inline Stream LoadBytes(std::string_view bytes, const DecodeOptions& decode = {}, const LoaderOptions& options = {}) {
    Parser parser = Parser::FromBytes(bytes, decode, options.parser);
    Loader loader(options);
    return loader.Load(parser);
}

/** @brief Load every document read from a stream. */
inline Stream LoadStream(std::istream& is, const LoaderOptions& options = {}) {
    Parser parser = Parser::FromStream(is, options.parser);
    Loader loader(options);
    return loader.Load(parser);
}

/**
 * @brief Load every document of a file, detecting its encoding.
 * @throws Error (ErrorKind::Source) if the file cannot be read.
 */
inline Stream LoadFile(const std::string& path, const LoaderOptions& options = {}, const DecodeOptions& decode = {}) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw Error(ErrorKind::Source, Marker(), "could not open file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad())
        throw Error(ErrorKind::Source, Marker(), "could not read file: " + path);
    return LoadBytes(ss.str(), decode, options);
}

} // namespace Churn

#endif // YAML_CHURN_LOADER_HPP
