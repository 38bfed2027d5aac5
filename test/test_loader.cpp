#include "test_util.hpp"

#include <string>
#include <vector>

namespace {

Churn::LoaderOptions WithPolicy(Churn::DuplicateKeyPolicy policy) {
    Churn::LoaderOptions options;
    options.duplicate_keys = policy;
    return options;
}

} // namespace

int main() {
    using Churn::DuplicateKeyPolicy;
    using Churn::ErrorKind;
    using Churn::Node;

    //
    // 1. Building a tree
    //
    {
        Churn::Stream s = Churn::Load("server:\n  host: localhost\n  ports: [80, 443]\nname: demo\n");
        assert(s.Size() == 1);
        const Node* root = s[0].Root();
        assert(root->IsMapping() && root->Size() == 2);
        assert(s[0]["server"]["host"].AsString() == "localhost");
        assert(s[0]["server"]["ports"].Size() == 2);
        assert(s[0]["server"]["ports"][1].AsString() == "443");
        assert(s[0]["server"]["ports"].GetCollectionStyle() == Churn::CollectionStyle::Flow);
        assert(s[0]["name"].Style() == Churn::ScalarStyle::Plain);

        // Pairs keep their source order.
        assert(root->AsMapping()[0].first->AsString() == "server");
        assert(root->AsMapping()[1].first->AsString() == "name");

        // Scalars stay raw text.
        Churn::Stream raw = Churn::Load("a: 1\nb: true\nc: ~\nd: '1'\n");
        assert(raw[0]["a"].AsString() == "1");
        assert(raw[0]["b"].AsString() == "true");
        assert(raw[0]["c"].AsString() == "~");
        assert(raw[0]["d"].Style() == Churn::ScalarStyle::SingleQuoted);
    }
    std::cout << "tree building ok\n";

    //
    // 2. Documents
    //
    {
        assert(Churn::Load("").Empty());
        assert(Churn::Load("# nothing\n").Size() == 0);

        Churn::Stream s = Churn::Load("%YAML 1.2\n--- a\n...\nb\n---\n");
        assert(s.Size() == 3);
        assert(s[0].ExplicitStart() && s[0].ExplicitEnd());
        assert(s[0].GetDirectives().version == std::make_pair(1u, 2u));
        assert(s[0].Root()->AsString() == "a");
        assert(!s[1].ExplicitStart() && !s[1].ExplicitEnd());
        assert(s[1].GetDirectives().Empty());
        assert(s[2].ExplicitStart());
        assert(s[2].Root()->IsEmptyScalar());

        Churn::Stream two = Churn::Load("---\na: &x 1\n---\nb: 2\n");
        assert(two.Size() == 2);
        assert(two[0].Root()->Size() == 1 && two[0]["a"].AsString() == "1");
        assert(two[1].Root()->Size() == 1 && two[1]["b"].AsString() == "2");
        assert(two[1]["b"].Anchor() == 0);

        std::size_t count = 0;
        for (const Churn::Document& doc : s) {
            assert(doc.Root() != nullptr);
            ++count;
        }
        assert(count == 3);
    }
    std::cout << "documents ok\n";

    //
    // 3. Empty values and access errors
    //
    {
        Churn::Stream s = Churn::Load("a:\nb: ~\nc: ''\nseq:\n- \n- x\n");
        assert(s[0]["a"].IsEmptyScalar());
        assert(!s[0]["b"].IsEmptyScalar());
        assert(!s[0]["c"].IsEmptyScalar() && s[0]["c"].Value().Empty());
        assert(s[0]["seq"][0].IsEmptyScalar());

        bool threw = false;
        try {
            s[0]["a"].AsSequence();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            s[0]["missing"];
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            s[0]["seq"][5];
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);

        assert(s[0].Root()->Find("missing") == nullptr);
        assert(s[0]["seq"].Find("x") == nullptr);
    }
    std::cout << "empty values ok\n";

    //
    // 4. Aliases share nodes
    //
    {
        Churn::Stream s = Churn::Load("a: &x [1, 2]\nb: *x\n");
        assert(&s[0]["a"] == &s[0]["b"]);
        assert(s[0]["a"].Anchor() == 1);

        Churn::Stream cycle = Churn::Load("&a [*a, x]");
        const Node* root = cycle[0].Root();
        assert(root->AsSequence()[0] == root);
        assert(root->AsSequence()[1]->AsString() == "x");

        Churn::Stream map_cycle = Churn::Load("&m\nself: *m\n");
        const Node* m = map_cycle[0].Root();
        assert(&(*m)["self"] == m);

        // A redefined anchor applies to later aliases only.
        Churn::Stream shadow = Churn::Load("- &a one\n- *a\n- &a two\n- *a\n");
        assert(shadow[0].Root()->AsSequence()[1]->AsString() == "one");
        assert(shadow[0].Root()->AsSequence()[3]->AsString() == "two");
        assert(shadow[0].Root()->AsSequence()[1] == shadow[0].Root()->AsSequence()[0]);
    }
    {
        Churn::Error e = TestUtil::ExpectError([] { Churn::Load("- *missing\n"); });
        assert(TestUtil::IsErrorAt(e, ErrorKind::Anchor, 1, 2));

        // Anchors do not reach into the next document; the first one is still kept.
        Churn::Parser parser = Churn::Parser::FromString("--- &a x\n--- *a\n");
        Churn::Loader loader;
        Churn::Error across = TestUtil::ExpectError([&] { loader.Load(parser); });
        assert(TestUtil::IsErrorAt(across, ErrorKind::Anchor, 2, 4));
        assert(across.GetMarker().index == 13);
        assert(loader.Documents().size() == 1);
        assert(loader.Documents()[0].Root()->AsString() == "x");
    }
    std::cout << "aliases ok\n";

    //
    // 5. Duplicate keys
    //
    {
        Churn::Error e = TestUtil::ExpectError([] { Churn::Load("{a: 1, a: 2}"); });
        assert(TestUtil::IsErrorAt(e, ErrorKind::DuplicateKey, 1, 7));
        assert(e.GetMarker().index == 7);
        assert(e.Info() == "duplicate mapping key 'a'");

        Churn::Stream last = Churn::Load("{a: 1, b: 0, a: 2}", WithPolicy(DuplicateKeyPolicy::KeepLast));
        assert(last[0].Root()->Size() == 2);
        assert(last[0]["a"].AsString() == "2");
        assert(last[0].Root()->AsMapping()[0].first->AsString() == "a");

        Churn::Stream first = Churn::Load("a: 1\na: 2\n", WithPolicy(DuplicateKeyPolicy::KeepFirst));
        assert(first[0].Root()->Size() == 1);
        assert(first[0]["a"].AsString() == "1");

        // Keys compare by raw text, whatever their style.
        assert(TestUtil::ExpectError([] { Churn::Load("'a': 1\na: 2\n"); }).Kind() == ErrorKind::DuplicateKey);
        assert(Churn::Load("1: x\n01: y\n")[0].Root()->Size() == 2);

        // Collection keys compare by structure.
        Churn::Error coll = TestUtil::ExpectError([] { Churn::Load("? [1, 2]\n: a\n? [1, 2]\n: b\n"); });
        assert(TestUtil::IsErrorAt(coll, ErrorKind::DuplicateKey, 3, 2));
        Churn::Stream coll_last =
            Churn::Load("? [1, 2]\n: a\n? [1, 2]\n: b\n", WithPolicy(DuplicateKeyPolicy::KeepLast));
        assert(coll_last[0].Root()->Size() == 1);
        assert(coll_last[0].Root()->AsMapping()[0].second->AsString() == "b");
        assert(Churn::Load("? [1, 2]\n: a\n? [2, 1]\n: b\n")[0].Root()->Size() == 2);

        // An alias key naming an existing key is a duplicate too.
        Churn::Error alias_key = TestUtil::ExpectError([] { Churn::Load("&k a: 1\n*k : 2\n"); });
        assert(TestUtil::IsErrorAt(alias_key, ErrorKind::DuplicateKey, 2, 0));

        // Nested mappings track their keys separately.
        Churn::Stream nested = Churn::Load("a: {a: 1}\nb: {a: 2}\n");
        assert(nested[0]["b"]["a"].AsString() == "2");
    }
    {
        std::vector<std::string> infos;
        Churn::Log::SetThreshold(Churn::Log::Level::Info);
        Churn::Log::SetSink([&infos](Churn::Log::Level level, std::string_view msg) {
            if (level == Churn::Log::Level::Info)
                infos.emplace_back(msg);
        });
        Churn::Load("x: 1\nx: 2\n", WithPolicy(DuplicateKeyPolicy::KeepFirst));
        Churn::Log::SetSink({});
        Churn::Log::SetThreshold(Churn::Log::Level::Warning);
        assert(infos.size() == 1);
        assert(infos[0] == "duplicate mapping key 'x' at line 2: keeping the first value");
    }
    std::cout << "duplicate keys ok\n";

    //
    // 6. Text ownership
    //
    {
        std::string source = "key: value\n";
        Churn::LoaderOptions borrow;
        borrow.text = Churn::TextOwnership::Borrow;
        Churn::Stream borrowed = Churn::Load(source, borrow);
        assert(borrowed[0]["key"].Value().IsBorrowed());
        assert(borrowed[0]["key"].Value().View().data() == source.data() + 5);
        borrowed[0].Arena().MakeOwned();
        assert(!borrowed[0]["key"].Value().IsBorrowed());

        Churn::Stream copied = Churn::Load(source);
        assert(!copied[0]["key"].Value().IsBorrowed());
        source.assign(source.size(), 'z');
        assert(copied[0]["key"].AsString() == "value");
        assert(borrowed[0]["key"].AsString() == "value");
    }
    std::cout << "text ownership ok\n";

    //
    // 7. Spans and properties
    //
    {
        Churn::Stream s = Churn::Load("k: {x: 1, y: [2]}\nt: !!str &n v\n");
        const Node& flow_map = s[0]["k"];
        assert(flow_map.GetSpan().start.index == 3);
        assert(flow_map.GetSpan().end.index == 17);
        assert(flow_map["y"].GetSpan().start.index == 13);
        assert(flow_map["y"].GetSpan().end.index == 16);

        const Node& t = s[0]["t"];
        assert(t.GetTag() && t.GetTag()->Str() == "tag:yaml.org,2002:str");
        assert(t.Anchor() == 1);
        assert(t.GetSpan().start.line == 2 && t.GetSpan().start.col == 3);
        assert(!s[0]["k"].GetTag());
    }
    std::cout << "spans ok\n";

    //
    // 8. Structural equality
    //
    {
        Churn::Stream a = Churn::Load("{x: [1, 2], y: 'z'}");
        Churn::Stream b = Churn::Load("x:\n- 1\n- 2\ny: z\n");
        Churn::Stream c = Churn::Load("x: [1, 3]\ny: z\n");
        Churn::Stream d = Churn::Load("x: [1, 2]\ny: !!str z\n");
        assert(Churn::StructurallyEqual(*a[0].Root(), *b[0].Root()));
        assert(!Churn::StructurallyEqual(*a[0].Root(), *c[0].Root()));
        assert(!Churn::StructurallyEqual(*a[0].Root(), *d[0].Root()));

        Churn::Stream c1 = Churn::Load("&a [*a]");
        Churn::Stream c2 = Churn::Load("&b [*b]");
        assert(Churn::StructurallyEqual(*c1[0].Root(), *c2[0].Root()));
    }
    std::cout << "structural equality ok\n";

    //
    // 9. Driving a Loader by hand
    //
    {
        Churn::Loader loader(WithPolicy(DuplicateKeyPolicy::KeepLast));
        Churn::Parser parser = Churn::Parser::FromString("a: 1\n---\nb: 2\n");
        while (!parser.Done())
            loader.OnEvent(parser.Next());
        assert(loader.Documents().size() == 2);
        Churn::Stream s = loader.TakeStream();
        assert(s.Size() == 2);
        assert(s[1]["b"].AsString() == "2");
        assert(loader.Documents().empty());
    }
    std::cout << "manual loading ok\n";

    std::cout << "All loader features tested successfully!\n";
    return 0;
}
