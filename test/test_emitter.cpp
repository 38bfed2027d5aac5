#include "test_util.hpp"

#include <string>
#include <vector>

namespace {

// Load `yaml`, emit it, load the output again and compare the two streams.
bool RoundTrips(std::string_view yaml, const Churn::EmitterOptions& options = {}) {
    Churn::Stream first = Churn::Load(yaml);
    std::string text = Churn::Emit(first, options);
    Churn::Stream second = Churn::Load(text);
    if (first.Size() != second.Size()) {
        std::cout << "document count changed for:\n" << text;
        return false;
    }
    for (std::size_t i = 0; i < first.Size(); ++i) {
        const Churn::Node* a = first[i].Root();
        const Churn::Node* b = second[i].Root();
        if (!a || !b || !Churn::StructurallyEqual(*a, *b)) {
            std::cout << "tree changed for:\n" << text;
            return false;
        }
    }
    return true;
}

std::string EmitText(std::string_view yaml, const Churn::EmitterOptions& options = {}) {
    return Churn::Emit(Churn::Load(yaml), options);
}

} // namespace

int main() {
    //
    // 1. Exact output
    //
    assert(EmitText("a: [1, 2]\n") == "---\na:\n  - 1\n  - 2\n");
    assert(EmitText("- a\n- b\n") == "---\n- a\n- b\n");
    assert(EmitText("- [1, 2]\n- x\n") == "---\n- - 1\n  - 2\n- x\n");
    assert(EmitText("- {a: 1, b: 2}\n") == "---\n- a: 1\n  b: 2\n");
    assert(EmitText("x") == "---\nx\n");
    assert(EmitText("a: []\nb: {}\n") == "---\na: []\nb: {}\n");
    assert(EmitText("a\n---\nb\n") == "---\na\n---\nb\n");
    assert(EmitText("---\n") == "---\n\"\"\n");
    assert(EmitText("? [1, 2]\n: a\n") == "---\n? - 1\n  - 2\n: a\n");

    Churn::EmitterOptions wide;
    wide.indent = 4;
    assert(EmitText("a:\n  b: [1]\n", wide) == "---\na:\n    b:\n        - 1\n");
    std::cout << "exact output ok\n";

    //
    // 2. Quoting
    //
    assert(EmitText("k: 'a: b'") == "---\nk: \"a: b\"\n");
    assert(EmitText("k: '-1'") == "---\nk: \"-1\"\n");
    assert(EmitText("k: ' x '") == "---\nk: \" x \"\n");
    assert(EmitText("k: \"a\\tb\\nc\"") == "---\nk: \"a\\tb\\nc\"\n");
    assert(EmitText("k: \"\\x01\"") == "---\nk: \"\\u0001\"\n");
    assert(EmitText("k: 'say \"hi\"'") == "---\nk: \"say \\\"hi\\\"\"\n");
    assert(EmitText("k: \"\xC3\xA9t\xC3\xA9\"") == "---\nk: \xC3\xA9t\xC3\xA9\n");
    assert(EmitText("'a b:': 1") == "---\n\"a b:\": 1\n");
    assert(RoundTrips("plain: value\n"
                      "quoted: 'a: b'\n"
                      "hash: '#x'\n"
                      "dash: '-1'\n"
                      "doc: '---'\n"
                      "dots: '...'\n"
                      "empty: ''\n"
                      "spaces: ' x '\n"
                      "tab: \"a\\tb\"\n"
                      "nl: \"a\\nb\"\n"
                      "ctl: \"\\x01\\x7f\"\n"
                      "bs: 'back\\slash'\n"
                      "quote: '\"q\"'\n"
                      "flow: '[a, b]'\n"
                      "tag: '!x'\n"
                      "anchor: '&x'\n"));
    std::cout << "quoting ok\n";

    //
    // 3. Tags
    //
    assert(EmitText("!!str x") == "---\n!<tag:yaml.org,2002:str> x\n");
    assert(EmitText("a: !local [1]") == "---\na: !<!local>\n  - 1\n");
    assert(RoundTrips("- !!str 1\n- !local x\n- ! y\n- !<tag:example.com,2000:a%20b> z\n- !!map {a: 1}\n"));
    std::cout << "tags ok\n";

    //
    // 4. Shared and cyclic nodes
    //
    assert(EmitText("a: &x [1, 2]\nb: *x\n") == "---\na: &a1\n  - 1\n  - 2\nb: *a1\n");
    assert(EmitText("&a [*a, x]") == "---\n&a1\n- *a1\n- x\n");
    assert(EmitText("&k a: 1\nb: *k\n") == "---\n&a1 a: 1\nb: *a1\n");
    assert(EmitText("a: &k x\n*k : y\n") == "---\na: &a1 x\n*a1 : y\n");
    {
        // Sharing survives the trip, not just the text.
        Churn::Stream again = Churn::Load(EmitText("a: &x {k: v}\nb: *x\n"));
        assert(&again[0]["a"] == &again[0]["b"]);

        Churn::Stream cycle = Churn::Load(EmitText("&m\nself: *m\n"));
        const Churn::Node* root = cycle[0].Root();
        assert(&(*root)["self"] == root);
    }
    assert(RoundTrips("base: &b {x: 1}\nlist: [*b, *b, &c [*c]]\n"));
    std::cout << "shared nodes ok\n";

    //
    // 5. Keys that need the explicit form
    //
    {
        std::string long_key(1100, 'k');
        std::string text = EmitText("? " + long_key + "\n: v\n");
        assert(text == "---\n? " + long_key + "\n: v\n");
        assert(RoundTrips("? " + long_key + "\n: v\n"));
    }
    assert(RoundTrips("? {a: 1}\n: map key\n? [x]\n: seq key\n"));
    std::cout << "complex keys ok\n";

    //
    // 6. Literal blocks
    //
    {
        Churn::EmitterOptions blocks;
        blocks.multiline_strings = true;
        assert(EmitText("text: |\n  line1\n  line2\n", blocks) == "---\ntext: |\n  line1\n  line2\n");
        assert(EmitText("|-\n  a\n\n  b\n", blocks) == "---\n|-\n  a\n\n  b\n");
        assert(EmitText("- \"a\\nb\\n\"\n", blocks) == "---\n- |\n  a\n  b\n");
        // Text a literal block cannot reproduce falls back to quotes.
        assert(EmitText("k: \" lead\\nx\"\n", blocks) == "---\nk: \" lead\\nx\"\n");
        assert(EmitText("k: \"a\\n\\n\"\n", blocks) == "---\nk: \"a\\n\\n\"\n");
        assert(RoundTrips("a: |\n  one\n    two\n  three\nb:\n  - |-\n    x\n    y\n", blocks));
    }
    std::cout << "literal blocks ok\n";

    //
    // 7. Trees built by hand
    //
    {
        Churn::Document doc;
        Churn::NodeArena& arena = doc.Arena();
        Churn::Node* root = arena.NewMapping();
        Churn::Node* list = arena.NewSequence();
        list->Append(arena.NewScalar("one"));
        list->Append(arena.NewScalar("two words"));
        root->Insert(arena.NewScalar("items"), list);
        root->Insert(arena.NewScalar("note"), arena.NewScalar("x: y"));
        doc.SetRoot(root);
        assert(Churn::Emit(doc) == "---\nitems:\n  - one\n  - two words\nnote: \"x: y\"\n");

        Churn::Emitter emitter;
        emitter.EmitDocument(doc);
        emitter.EmitDocument(Churn::Document());
        assert(emitter.Str().ends_with("---\n"));
        std::string taken = emitter.Take();
        assert(emitter.Str().empty());
        Churn::Stream loaded = Churn::Load(taken);
        assert(loaded.Size() == 2);
        assert(Churn::StructurallyEqual(*loaded[0].Root(), *root));
        assert(loaded[1].Root()->IsEmptyScalar());
    }
    std::cout << "hand-built trees ok\n";

    //
    // 8. Nesting limit
    //
    {
        // Nested sequences with a scalar at the bottom, `levels` collections deep.
        auto nested = [](Churn::Document& doc, int levels) {
            Churn::NodeArena& arena = doc.Arena();
            Churn::Node* n = arena.NewSequence();
            n->Append(arena.NewScalar("x"));
            for (int i = 1; i < levels; ++i) {
                Churn::Node* outer = arena.NewSequence();
                outer->Append(n);
                n = outer;
            }
            doc.SetRoot(n);
        };

        Churn::Document fits;
        nested(fits, 256);
        Churn::Stream loaded = Churn::Load(Churn::Emit(fits));
        assert(Churn::StructurallyEqual(*loaded[0].Root(), *fits.Root()));

        Churn::Document too_deep;
        nested(too_deep, 257);
        bool threw = false;
        try {
            Churn::Emit(too_deep);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        Churn::EmitterOptions shallow;
        shallow.max_depth = 2;
        Churn::Document three;
        nested(three, 3);
        threw = false;
        try {
            Churn::Emit(three, shallow);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(EmitText("- - x\n", shallow) == "---\n- - x\n");
    }
    std::cout << "nesting limit ok\n";

    std::cout << "All emitter features tested successfully!\n";
    return 0;
}
