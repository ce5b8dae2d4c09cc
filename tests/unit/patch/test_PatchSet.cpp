#include "patch/PatchSet.hpp"

#include <doctest/doctest.h>

using namespace TS;

TEST_SUITE("patch.set") {
    TEST_CASE("isEmpty and countChanges") {
        PatchSet patch;
        CHECK(patch.isEmpty());
        CHECK(patch.countChanges() == 0);

        patch.removed.emplace_back(Id{"gone"});
        patch.added.emplace("new", VirtualInstance{.className = "Part", .name = "Part"});
        auto& update       = patch.updateFor("changed");
        update.changedName = "Renamed";
        update.changedProperties.emplace("Anchored", Values::boolean(true));
        update.changedProperties.emplace("Transparency", Values::float64(1));

        CHECK_FALSE(patch.isEmpty());
        CHECK(patch.countChanges() == 5);
    }

    TEST_CASE("updateFor keeps one record per id") {
        PatchSet patch;
        patch.updateFor("a").changedName = "A";
        patch.updateFor("a").changedClassName = "Model";
        patch.updateFor("b");
        REQUIRE(patch.updated.size() == 2);
        CHECK(patch.updated[0].changedName == std::optional<std::string>{"A"});
        CHECK(patch.updated[0].changedClassName == std::optional<std::string>{"Model"});
        CHECK(patch.updated[1].isEmpty());
    }

    TEST_CASE("containsId looks at every section") {
        PatchSet patch;
        patch.removed.emplace_back(Id{"removed"});
        patch.removed.emplace_back(ObjectHandle{5});
        patch.added.emplace("added", VirtualInstance{.className = "Folder", .name = "Folder"});
        patch.updateFor("updated");

        CHECK(patch.containsId("removed"));
        CHECK(patch.containsId("added"));
        CHECK(patch.containsId("updated"));
        CHECK_FALSE(patch.containsId("other"));
        CHECK(patch.findUpdate("updated") != nullptr);
        CHECK(patch.findUpdate("added") == nullptr);
    }

    TEST_CASE("mergeUpdate takes the most recent value per property") {
        Update into{.id = "x"};
        into.changedName = "Old";
        into.changedProperties.emplace("A", Values::int64(1));
        into.changedProperties.emplace("B", Values::int64(2));

        Update from{.id = "x"};
        from.changedProperties.emplace("B", Values::int64(20));
        from.changedProperties.emplace("C", VirtualValue::ref("target"));
        from.changedMetadata = nlohmann::json::object();

        mergeUpdate(into, from);
        CHECK(into.changedName == std::optional<std::string>{"Old"});
        CHECK(into.changedMetadata.has_value());
        CHECK(into.changedProperties.size() == 3);
        CHECK(into.changedProperties.at("A") == Values::int64(1));
        CHECK(into.changedProperties.at("B") == Values::int64(20));
        CHECK(into.changedProperties.at("C") == VirtualValue::ref("target"));
    }

    TEST_CASE("mergeUpdate unions metadata objects") {
        Update into{.id = "x"};
        into.changedMetadata = nlohmann::json{{"ignoreUnknownInstances", true}, {"tag", "first"}};

        Update from{.id = "x"};
        from.changedMetadata = nlohmann::json{{"tag", "second"}};

        mergeUpdate(into, from);
        REQUIRE(into.changedMetadata.has_value());
        CHECK(into.changedMetadata->at("ignoreUnknownInstances") == true);
        CHECK(into.changedMetadata->at("tag") == "second");

        Update scalar{.id = "x"};
        scalar.changedMetadata = nlohmann::json(3);
        mergeUpdate(into, scalar);
        CHECK(into.changedMetadata == std::optional<nlohmann::json>{nlohmann::json(3)});
    }

    TEST_CASE("assign appends removals, merges additions and coalesces updates") {
        PatchSet first;
        first.removed.emplace_back(Id{"r1"});
        first.added.emplace("a", VirtualInstance{.className = "Part", .name = "Old"});
        first.updateFor("u").changedProperties.emplace("P", Values::int64(1));

        PatchSet second;
        second.removed.emplace_back(Id{"r2"});
        second.added.emplace("a", VirtualInstance{.className = "Part", .name = "New"});
        second.updateFor("u").changedProperties.emplace("Q", Values::int64(2));
        second.updateFor("v").changedName = "V";

        first.assign(second);
        CHECK(first.removed == std::vector<RemovedTarget>{Id{"r1"}, Id{"r2"}});
        CHECK(first.added.at("a").name == "New");
        REQUIRE(first.updated.size() == 2);
        CHECK(first.updated[0].changedProperties.size() == 2);
        CHECK(first.updated[1].id == "v");
    }

    TEST_CASE("Value helpers") {
        auto null = VirtualValue::nullRef();
        REQUIRE(null.asRef() != nullptr);
        CHECK(null.asRef()->isNull());
        CHECK_FALSE(VirtualValue::ref("x").asRef()->isNull());

        auto composite = VirtualValue::composite({{"Inner", Values::string("s")}});
        CHECK(composite.isComposite());
        CHECK_FALSE(composite.isRef());
        CHECK(composite.asPrimitive() == nullptr);

        auto primitive = Values::string("s");
        REQUIRE(primitive.asPrimitive() != nullptr);
        CHECK(primitive.asPrimitive()->type == "String");
        CHECK(primitive.asPrimitive()->raw == "s");
    }
}
