/**
 * @file node.hpp
 * @brief The generic tree built by the Loader: Node, the arena that owns nodes, Document and Stream.
 *
 * Nodes never own each other. Every node of a document lives in that document's
 * NodeArena and collections hold plain pointers to their children, so an alias is
 * just a second pointer to the same node and a cycle (an alias to an ancestor) costs
 * nothing extra.
 */

#ifndef YAML_CHURN_NODE_HPP
#define YAML_CHURN_NODE_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "event.hpp"
#include "marker.hpp"
#include "text.hpp"
#include "token.hpp"

namespace Churn {

/**
 * @class Node
 * @brief A scalar, sequence or mapping.
 *
 * Scalars keep their raw text; no type is assigned to it. Mappings keep their pairs
 * in insertion order.
 */
class Node {
public:
    /** Enumeration of node kinds. */
    enum class Kind {
        Scalar,   ///< Leaf text.
        Sequence, ///< Ordered list of nodes.
        Mapping   ///< Ordered list of key/value pairs.
    };

    using Pair = std::pair<Node*, Node*>;

    /** @brief Construct a scalar. */
    Node(Churn::Text value, ScalarStyle style) : kind_(Kind::Scalar), value_(std::move(value)), style_(style) {}

    /** @brief Construct an empty collection. */
    Node(Kind kind, CollectionStyle style) : kind_(kind), collection_style_(style) {}

    /** @brief Returns the runtime kind of this node. */
    Kind Type() const noexcept { return kind_; }

    bool IsScalar() const noexcept { return kind_ == Kind::Scalar; }
    bool IsSequence() const noexcept { return kind_ == Kind::Sequence; }
    bool IsMapping() const noexcept { return kind_ == Kind::Mapping; }

    /** @brief Returns true for a plain scalar with empty text, which is how omitted values are represented. */
    bool IsEmptyScalar() const noexcept {
        return kind_ == Kind::Scalar && style_ == ScalarStyle::Plain && value_.Empty();
    }

    /** @brief The scalar text. Throws on wrong kind. */
    const Churn::Text& Value() const {
        AssertKind(Kind::Scalar);
        return value_;
    }

    /** @brief The scalar text as a std::string. Throws on wrong kind. */
    std::string AsString() const { return Value().Str(); }

    /** @brief The children of a sequence. Throws on wrong kind. */
    const std::vector<Node*>& AsSequence() const {
        AssertKind(Kind::Sequence);
        return items_;
    }

    /** @brief The pairs of a mapping. Throws on wrong kind. */
    const std::vector<Pair>& AsMapping() const {
        AssertKind(Kind::Mapping);
        return entries_;
    }

    /** @brief Number of items or pairs; 0 for a scalar. */
    std::size_t Size() const noexcept {
        switch (kind_) {
            case Kind::Sequence: return items_.size();
            case Kind::Mapping:  return entries_.size();
            default:             return 0;
        }
    }

    /**
     * @brief Value of the first pair whose key is a scalar with text `key`.
     * @return nullptr if there is none or this is not a mapping.
     */
    const Node* Find(std::string_view key) const noexcept {
        if (kind_ != Kind::Mapping)
            return nullptr;
        for (const Pair& p : entries_)
            if (p.first->IsScalar() && p.first->value_.View() == key)
                return p.second;
        return nullptr;
    }

    /** @brief Access mapping value by key. Throws if not a mapping or the key is missing. */
    const Node& operator[](std::string_view key) const {
        AssertKind(Kind::Mapping);
        const Node* n = Find(key);
        if (!n)
            throw std::out_of_range("Churn::Node: key not found: " + std::string(key));
        return *n;
    }

    const Node& operator[](const char* key) const { return (*this)[std::string_view(key)]; }

    /** @brief Access sequence item by index. Throws if not a sequence or out of range. */
    const Node& operator[](std::size_t idx) const {
        AssertKind(Kind::Sequence);
        return *items_.at(idx);
    }

    const Node& operator[](int idx) const {
        if (idx < 0)
            throw std::out_of_range("Churn::Node: negative sequence index");
        return (*this)[static_cast<std::size_t>(idx)];
    }

    /** @brief Append an item to a sequence. Throws if not a sequence. */
    void Append(Node* item) {
        AssertKind(Kind::Sequence);
        items_.push_back(item);
    }

    /** @brief Append a pair to a mapping, without any duplicate check. Throws if not a mapping. */
    void Insert(Node* key, Node* value) {
        AssertKind(Kind::Mapping);
        entries_.emplace_back(key, value);
    }

    /** @brief Replace the value of the pair at `idx`. Throws if not a mapping. */
    void ReplaceValue(std::size_t idx, Node* value) {
        AssertKind(Kind::Mapping);
        entries_.at(idx).second = value;
    }

    /** @brief Tag attached in the source, if any. */
    const std::optional<Churn::Tag>& GetTag() const noexcept { return tag_; }
    void SetTag(std::optional<Churn::Tag> tag) { tag_ = std::move(tag); }

    ScalarStyle Style() const noexcept { return style_; }
    CollectionStyle GetCollectionStyle() const noexcept { return collection_style_; }

    /** @brief Anchor id from the source, or 0. */
    AnchorId Anchor() const noexcept { return anchor_; }
    void SetAnchor(AnchorId id) noexcept { anchor_ = id; }

    /** @brief Source extent; collections span from their first to their last character. */
    const Span& GetSpan() const noexcept { return span_; }
    void SetSpan(Span span) noexcept { span_ = span; }

    /** @brief Copy borrowed scalar text into the node. */
    void MakeOwned() { value_.MakeOwned(); }

    /** @brief Human-readable name of a Kind. */
    static std::string KindToStr(Kind k) {
        switch (k) {
            case Kind::Scalar:   return "Scalar";
            case Kind::Sequence: return "Sequence";
            case Kind::Mapping:  return "Mapping";
        }
        return "Unknown";
    }

private:
    void AssertKind(Kind expected) const {
        if (kind_ != expected)
            throw std::runtime_error("Churn::Node: type mismatch (expected " + KindToStr(expected) +
                                     ", got " + KindToStr(kind_) + ")");
    }

    Kind kind_;
    Churn::Text value_;
    ScalarStyle style_ = ScalarStyle::Plain;
    CollectionStyle collection_style_ = CollectionStyle::Block;
    std::vector<Node*> items_;
    std::vector<Pair> entries_;
    std::optional<Churn::Tag> tag_;
    AnchorId anchor_ = 0;
    Span span_;
};

/**
 * @brief Compare two graphs by shape, scalar text and tags.
 *
 * Styles, spans and anchor ids are ignored. Node pairs already under comparison are
 * assumed equal, so cyclic graphs terminate.
 */
inline bool StructurallyEqual(const Node& a, const Node& b) {
    auto tag_text = [](const Node& n) { return n.GetTag() ? n.GetTag()->Str() : std::string(); };

    std::set<std::pair<const Node*, const Node*>> seen;
    std::vector<std::pair<const Node*, const Node*>> work{{&a, &b}};
    while (!work.empty()) {
        auto [x, y] = work.back();
        work.pop_back();
        if (x == y || !seen.insert({x, y}).second)
            continue;
        if (x->Type() != y->Type() || x->Size() != y->Size() || tag_text(*x) != tag_text(*y))
            return false;
        switch (x->Type()) {
            case Node::Kind::Scalar:
                if (x->Value() != y->Value())
                    return false;
                break;
            case Node::Kind::Sequence:
                for (std::size_t i = 0; i < x->Size(); ++i)
                    work.emplace_back(x->AsSequence()[i], y->AsSequence()[i]);
                break;
            case Node::Kind::Mapping:
                for (std::size_t i = 0; i < x->Size(); ++i) {
                    work.emplace_back(x->AsMapping()[i].first, y->AsMapping()[i].first);
                    work.emplace_back(x->AsMapping()[i].second, y->AsMapping()[i].second);
                }
                break;
        }
    }
    return true;
}

/**
 * @class NodeArena
 * @brief Owns every node of one document. Node addresses stay valid for the arena's lifetime.
 */
class NodeArena {
public:
    Node* NewScalar(Text value, ScalarStyle style = ScalarStyle::Plain) {
        return &nodes_.emplace_back(std::move(value), style);
    }

    Node* NewSequence(CollectionStyle style = CollectionStyle::Block) {
        return &nodes_.emplace_back(Node::Kind::Sequence, style);
    }

    Node* NewMapping(CollectionStyle style = CollectionStyle::Block) {
        return &nodes_.emplace_back(Node::Kind::Mapping, style);
    }

    std::size_t Size() const noexcept { return nodes_.size(); }

    /** @brief Detach every scalar from borrowed input. */
    void MakeOwned() {
        for (Node& n : nodes_)
            if (n.IsScalar())
                n.MakeOwned();
    }

private:
    std::deque<Node> nodes_;
};

/**
 * @class Document
 * @brief One root node plus the document's boundary markers and directives.
 */
class Document {
public:
    Document() : arena_(std::make_unique<NodeArena>()) {}

    /** @brief Root node; null only for a Document that was never filled. */
    const Node* Root() const noexcept { return root_; }
    Node* Root() noexcept { return root_; }
    void SetRoot(Node* root) noexcept { root_ = root; }

    /** @brief Whether the document began with `---`. */
    bool ExplicitStart() const noexcept { return explicit_start_; }
    /** @brief Whether the document ended with `...`. */
    bool ExplicitEnd() const noexcept { return explicit_end_; }
    void SetExplicitStart(bool v) noexcept { explicit_start_ = v; }
    void SetExplicitEnd(bool v) noexcept { explicit_end_ = v; }

    const Churn::Directives& GetDirectives() const noexcept { return directives_; }
    void SetDirectives(Churn::Directives d) { directives_ = std::move(d); }

    NodeArena& Arena() noexcept { return *arena_; }
    const NodeArena& Arena() const noexcept { return *arena_; }

    /** @brief Access the root mapping by key. */
    const Node& operator[](std::string_view key) const { return RootRef()[key]; }
    const Node& operator[](const char* key) const { return RootRef()[std::string_view(key)]; }

private:
    const Node& RootRef() const {
        if (!root_)
            throw std::runtime_error("Churn::Document: document has no root");
        return *root_;
    }

    std::unique_ptr<NodeArena> arena_;
    Node* root_ = nullptr;
    bool explicit_start_ = false;
    bool explicit_end_ = false;
    Churn::Directives directives_;
};

/**
 * @class Stream
 * @brief Every document of one input, in order.
 */
class Stream {
public:
    Stream() = default;
    explicit Stream(std::vector<Document> docs) : docs_(std::move(docs)) {}

    std::size_t Size() const noexcept { return docs_.size(); }
    bool Empty() const noexcept { return docs_.empty(); }

    const Document& operator[](std::size_t idx) const { return docs_.at(idx); }
    Document& operator[](std::size_t idx) { return docs_.at(idx); }

    auto begin() const noexcept { return docs_.begin(); }
    auto end() const noexcept { return docs_.end(); }

    void Add(Document doc) { docs_.push_back(std::move(doc)); }

private:
    std::vector<Document> docs_;
};

} // namespace Churn

#endif // YAML_CHURN_NODE_HPP
