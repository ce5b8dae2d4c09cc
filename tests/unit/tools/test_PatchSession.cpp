#include "patch/PatchJson.hpp"
#include "tools/PatchSession.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

using namespace TS;

namespace {

auto const FolderSchema = nlohmann::json::parse(R"({
    "classes": {
        "Instance": { "properties": { "Archivable": { "kind": "Bool" } } },
        "Folder": { "superclass": "Instance" },
        "StringValue": { "superclass": "Instance", "properties": { "Value": { "kind": "String" } } }
    }
})");

constexpr char const* SeedPatch = R"({
    "added": {
        "a": { "ClassName": "Folder", "Name": "A", "Parent": "root", "Children": ["v"] },
        "v": { "ClassName": "StringValue", "Parent": "a", "Properties": { "Value": {"String": "hi"} } }
    }
})";

} // namespace

TEST_SUITE("tools.patch_session") {
    TEST_CASE("Top-level additions attach to the bound root") {
        auto session = PatchSession::fromSchemaJson(FolderSchema);
        REQUIRE(session.has_value());
        auto& tool = **session;
        CHECK(tool.identities().byId("root") == std::optional<ObjectHandle>{tool.tree().root()});

        auto seed = PatchJson::parse(SeedPatch);
        REQUIRE(seed.has_value());
        auto seeded = tool.apply(*seed);
        REQUIRE(seeded.has_value());
        CHECK(seeded->isEmpty());

        auto a = tool.identities().byId("a");
        REQUIRE(a.has_value());
        CHECK(tool.tree().parent(*a) == std::optional<ObjectHandle>{tool.tree().root()});
        auto v = tool.identities().byId("v");
        REQUIRE(v.has_value());
        CHECK(tool.tree().getProperty(*v, "Value") == NativeValue{"hi"});

        // A later patch sees the seeded ids.
        auto patch = PatchJson::parse(R"({
            "removed": ["missing"],
            "updated": [ { "id": "v", "changedProperties": { "Value": {"String": "bye"} } } ]
        })");
        REQUIRE(patch.has_value());
        auto unapplied = tool.apply(*patch);
        REQUIRE(unapplied.has_value());
        REQUIRE(unapplied->removed.size() == 1);
        CHECK(unapplied->removed.front() == RemovedTarget{Id{"missing"}});
        CHECK(unapplied->updated.empty());
        CHECK(tool.tree().getProperty(*v, "Value") == NativeValue{"bye"});
        CHECK(tool.history().entries().size() == 2);
    }

    TEST_CASE("The root id can be chosen") {
        auto session = PatchSession::fromSchemaJson(FolderSchema, "game");
        REQUIRE(session.has_value());

        auto patch = PatchJson::parse(R"({ "added": { "a": { "ClassName": "Folder", "Parent": "game" } } })");
        REQUIRE(patch.has_value());
        auto unapplied = (*session)->apply(*patch);
        REQUIRE(unapplied.has_value());
        CHECK(unapplied->isEmpty());

        auto wrongRoot = PatchJson::parse(R"({ "added": { "b": { "ClassName": "Folder", "Parent": "root" } } })");
        REQUIRE(wrongRoot.has_value());
        auto aborted = (*session)->apply(*wrongRoot);
        REQUIRE_FALSE(aborted.has_value());
        CHECK(aborted.error().code == Error::Code::MalformedPatch);
    }

    TEST_CASE("Invalid setup is reported") {
        CHECK(PatchSession::fromSchemaJson(FolderSchema, "").error().code == Error::Code::InvalidValue);
        CHECK_FALSE(PatchSession::fromSchemaJson(nlohmann::json::parse(R"({"classes": 3})")).has_value());
    }
}
