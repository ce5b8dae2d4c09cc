#include "patch/PatchJson.hpp"

#include <doctest/doctest.h>

using namespace TS;
using nlohmann::json;

TEST_SUITE("patch.json") {
    TEST_CASE("Decodes the wire shape") {
        auto patch = PatchJson::parse(R"({
            "removed": ["old", {"object": 12}],
            "added": {
                "model": {
                    "Id": "model", "Parent": "root", "Name": "Car", "ClassName": "Model",
                    "Properties": {
                        "PrimaryPart": {"Ref": "body"},
                        "Attributes": {"Composite": {"Speed": {"Float64": 12.5}}}
                    },
                    "Children": ["body"]
                },
                "body": { "Parent": "model", "ClassName": "Part" }
            },
            "updated": [
                { "id": "sign", "changedName": "Sign", "changedProperties": { "Text": {"String": "hi"}, "Owner": {"Ref": null} },
                  "changedMetadata": {"ignoreUnknownInstances": true} }
            ]
        })");
        REQUIRE(patch.has_value());

        REQUIRE(patch->removed.size() == 2);
        CHECK(patch->removed[0] == RemovedTarget{Id{"old"}});
        CHECK(patch->removed[1] == RemovedTarget{ObjectHandle{12}});

        auto const& model = patch->added.at("model");
        CHECK(model.className == "Model");
        CHECK(model.name == "Car");
        CHECK(model.parent == std::optional<Id>{"root"});
        CHECK(model.children == std::vector<Id>{"body"});
        CHECK(model.properties.at("PrimaryPart") == VirtualValue::ref("body"));
        auto const* attributes = model.properties.at("Attributes").asComposite();
        REQUIRE(attributes != nullptr);
        CHECK(attributes->entries.at("Speed") == Values::float64(12.5));

        // Name defaults to the class name.
        CHECK(patch->added.at("body").name == "Part");

        REQUIRE(patch->updated.size() == 1);
        auto const& update = patch->updated.front();
        CHECK(update.id == "sign");
        CHECK(update.changedName == std::optional<std::string>{"Sign"});
        CHECK_FALSE(update.changedClassName.has_value());
        CHECK(update.changedProperties.at("Text") == Values::string("hi"));
        CHECK(update.changedProperties.at("Owner") == VirtualValue::nullRef());
        CHECK(update.changedMetadata == std::optional<json>{json{{"ignoreUnknownInstances", true}}});
    }

    TEST_CASE("Encoding and decoding agree") {
        PatchSet patch;
        patch.removed.emplace_back(Id{"x"});
        patch.removed.emplace_back(ObjectHandle{3});
        patch.added.emplace("a", VirtualInstance{.className  = "Part",
                                                 .name       = "A",
                                                 .parent     = Id{"root"},
                                                 .properties = {{"Size", VirtualValue::primitive("Vector3", {1, 2, 3})}},
                                                 .children   = {}});
        auto& update            = patch.updateFor("b");
        update.changedClassName = "Model";
        update.changedProperties.emplace("Bag", VirtualValue::composite({{"Ref", VirtualValue::ref("a")}}));

        auto encoded = PatchJson::encode(patch);
        CHECK(encoded["removed"] == json::parse(R"(["x", {"object": 3}])"));
        CHECK(encoded["added"]["a"]["ClassName"] == "Part");
        CHECK(encoded["updated"][0]["changedProperties"]["Bag"]
              == json::parse(R"({"Composite": {"Ref": {"Ref": "a"}}})"));
        CHECK_FALSE(encoded["updated"][0].contains("changedName"));

        auto decoded = PatchJson::decode(encoded);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == patch);
    }

    TEST_CASE("describePatch renders JSON") {
        PatchSet patch;
        patch.removed.emplace_back(Id{"x"});
        CHECK(PatchJson::describePatch(patch, -1) == R"({"added":{},"removed":["x"],"updated":[]})");
    }

    TEST_CASE("Malformed input") {
        auto code = [](char const* text) {
            auto result = PatchJson::parse(text);
            REQUIRE_FALSE(result.has_value());
            return result.error().code;
        };

        CHECK(code("not json") == Error::Code::MalformedInput);
        CHECK(code("[]") == Error::Code::MalformedInput);
        CHECK(code(R"({"removed": [1]})") == Error::Code::MalformedInput);
        CHECK(code(R"({"added": {"a": {"Name": "NoClass"}}})") == Error::Code::MalformedInput);
        CHECK(code(R"({"added": {"a": {"ClassName": "Part", "Children": "b"}}})") == Error::Code::MalformedInput);
        CHECK(code(R"({"updated": [{"changedName": "x"}]})") == Error::Code::MalformedInput);
        CHECK(code(R"({"updated": [{"id": "a", "changedProperties": {"P": {"Bool": true, "Int64": 1}}}]})")
              == Error::Code::MalformedInput);
        CHECK(code(R"({"updated": [{"id": "a", "changedProperties": {"P": {"Ref": 5}}}]})")
              == Error::Code::MalformedInput);

        CHECK(PatchJson::parse("{}").has_value());
    }
}
