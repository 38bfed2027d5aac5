#include "test_util.hpp"

#include <fstream>
#include <string>

int main() {
    // Load every document of the fixture
    Churn::Stream stream = Churn::LoadFile("test.yml");
    assert(stream.Size() == 2);
    const Churn::Document& config = stream[0];

    //
    // 1. Directives and document markers
    //
    assert(config.ExplicitStart() && config.ExplicitEnd());
    assert(config.GetDirectives().version == std::make_pair(1u, 2u));
    assert(config.GetDirectives().tags.size() == 1);
    assert(config.GetDirectives().tags[0].first == "!app!");
    assert(stream[1].ExplicitStart() && !stream[1].ExplicitEnd());
    assert(stream[1].GetDirectives().Empty());

    //
    // 2. Block mapping with block scalars
    //
    const Churn::Node& defaults = config["defaults"];
    assert(defaults["retries"].AsString() == "3");
    assert(defaults["timeout"].AsString() == "30");
    assert(defaults["greeting"].AsString() == "Hello,\nWorld!\n");
    assert(defaults["greeting"].Style() == Churn::ScalarStyle::Literal);
    assert(defaults["note"].AsString() == "folded lines become one\n");
    assert(defaults["note"].Style() == Churn::ScalarStyle::Folded);

    std::cout << "defaults.greeting:\n" << defaults["greeting"].AsString();
    std::cout << "defaults.note: " << defaults["note"].AsString();

    //
    // 3. Aliases resolve to the anchored node
    //
    const Churn::Node& server1 = config["server1"];
    assert(&server1["settings"] == &defaults);
    assert(server1["settings"]["retries"].AsString() == "3");
    assert(&config["copy_of_list"] == &config["list"]);
    std::cout << "server1.host: " << server1["host"].AsString() << "\n";
    std::cout << "server1.settings.timeout (via alias): " << server1["settings"]["timeout"].AsString() << "\n";

    //
    // 4. Flow collections and quoted scalars
    //
    const Churn::Node& ports = server1["ports"];
    assert(ports.Size() == 2);
    assert(ports[0].AsString() == "80" && ports[1].AsString() == "443");
    assert(server1["labels"]["tier"].AsString() == "front end");
    assert(server1["labels"]["tier"].Style() == Churn::ScalarStyle::DoubleQuoted);

    const Churn::Node& list = config["list"];
    assert(list.Size() == 3);
    assert(list[1].AsString() == "second item");
    assert(list[1].Style() == Churn::ScalarStyle::SingleQuoted);
    assert(list[2].AsString() == "third\titem");
    std::cout << "list:\n";
    for (const Churn::Node* item : list.AsSequence())
        std::cout << "  - " << item->AsString() << "\n";

    //
    // 5. Tags, empty values and compound keys
    //
    const Churn::Node& typed = config["typed"];
    assert(typed.GetTag() && typed.GetTag()->Str() == "tag:example.com,2026:app/service");
    assert(typed["name"].AsString() == "churn");
    assert(config["empty"].IsEmptyScalar());

    const Churn::Node::Pair& compound = config.Root()->AsMapping().back();
    assert(compound.first->IsSequence());
    assert((*compound.first)[0].AsString() == "compound");
    assert(compound.second->AsString() == "compound value");

    //
    // 6. Positions
    //
    const Churn::Span& host = server1["host"].GetSpan();
    assert(host.start.line == 16 && host.start.col == 8);
    std::cout << "server1.host is at line " << host.start.line << ", column " << host.start.col + 1 << "\n";

    //
    // 7. Second document
    //
    const Churn::Node* items = stream[1].Root();
    assert(items->IsSequence() && items->Size() == 3);
    assert((*items)[0].AsString() == "plain");
    assert((*items)[1].AsString() == "42");
    assert((*items)[1].GetTag()->Str() == "tag:yaml.org,2002:str");
    assert((*items)[2][1].AsString() == "sequence");

    //
    // 8. Streaming the same file through the event interface
    //
    {
        std::ifstream file("test.yml", std::ios::binary);
        assert(file);
        Churn::Parser parser = Churn::Parser::FromStream(file);
        int anchors = 0;
        int aliases = 0;
        int documents = 0;
        parser.Parse([&](const Churn::Event& e) {
            if (e.type == Churn::EventType::Alias)
                ++aliases;
            else if (e.anchor != 0)
                ++anchors;
            if (e.type == Churn::EventType::DocumentStart)
                ++documents;
        });
        assert(anchors == 2 && aliases == 2 && documents == 2);
    }

    //
    // 9. Emitting and loading again keeps the structure
    //
    {
        std::string text = Churn::Emit(stream);
        Churn::Stream again = Churn::Load(text);
        assert(again.Size() == 2);
        assert(Churn::StructurallyEqual(*again[0].Root(), *config.Root()));
        assert(Churn::StructurallyEqual(*again[1].Root(), *stream[1].Root()));
        assert(&again[0]["server1"]["settings"] == &again[0]["defaults"]);
    }

    std::cout << "All YAML features tested successfully!\n";
    return 0;
}
