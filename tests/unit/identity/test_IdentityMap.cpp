#include "identity/IdentityMap.hpp"
#include "tree/MemoryTree.hpp"

#include <doctest/doctest.h>

using namespace TS;

TEST_SUITE("identity.map") {
    TEST_CASE("insert binds both directions") {
        MemoryTree  tree;
        IdentityMap map(tree);
        auto        part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());

        REQUIRE(map.insert("a", *part).has_value());
        CHECK(map.byId("a") == *part);
        CHECK(map.byObject(*part) == Id{"a"});
        CHECK(map.size() == 1);

        SUBCASE("Rebinding the same pair is accepted") {
            CHECK(map.insert("a", *part).has_value());
            CHECK(map.size() == 1);
        }

        SUBCASE("An id cannot be bound to a second object") {
            auto other = tree.create("Part", tree.root());
            REQUIRE(other.has_value());
            auto result = map.insert("a", *other);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::AlreadyBound);
            CHECK(map.byId("a") == *part);
            CHECK_FALSE(map.byObject(*other).has_value());
        }

        SUBCASE("An object cannot be bound to a second id") {
            auto result = map.insert("b", *part);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::AlreadyBound);
            CHECK_FALSE(map.byId("b").has_value());
        }
    }

    TEST_CASE("repoint moves an id and drops the old reverse entry") {
        MemoryTree  tree;
        IdentityMap map(tree);
        auto        first  = tree.create("Part", tree.root());
        auto        second = tree.create("Part", tree.root());
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(map.insert("a", *first).has_value());

        REQUIRE(map.repoint("a", *second).has_value());
        CHECK(map.byId("a") == *second);
        CHECK(map.byObject(*second) == Id{"a"});
        CHECK_FALSE(map.byObject(*first).has_value());
        CHECK(map.size() == 1);

        REQUIRE(map.insert("b", *first).has_value());
        auto stolen = map.repoint("a", *first);
        REQUIRE_FALSE(stolen.has_value());
        CHECK(stolen.error().code == Error::Code::AlreadyBound);
    }

    TEST_CASE("removeId and removeObject only touch the map") {
        MemoryTree  tree;
        IdentityMap map(tree);
        auto        part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());
        REQUIRE(map.insert("a", *part).has_value());

        CHECK(map.removeId("a"));
        CHECK_FALSE(map.removeId("a"));
        CHECK_FALSE(map.byObject(*part).has_value());
        CHECK(tree.exists(*part));

        REQUIRE(map.insert("a", *part).has_value());
        CHECK(map.removeObject(*part));
        CHECK_FALSE(map.byId("a").has_value());
    }

    TEST_CASE("destroyObject removes the subtree and its bindings") {
        MemoryTree  tree;
        IdentityMap map(tree);
        auto        model = tree.create("Model", tree.root());
        REQUIRE(model.has_value());
        auto part = tree.create("Part", *model);
        REQUIRE(part.has_value());
        auto unrelated = tree.create("Part", tree.root());
        REQUIRE(unrelated.has_value());

        REQUIRE(map.insert("model", *model).has_value());
        REQUIRE(map.insert("part", *part).has_value());
        REQUIRE(map.insert("other", *unrelated).has_value());
        map.suppress(*part);

        REQUIRE(map.destroyId("model").has_value());
        CHECK_FALSE(tree.exists(*model));
        CHECK_FALSE(tree.exists(*part));
        CHECK_FALSE(map.byId("model").has_value());
        CHECK_FALSE(map.byId("part").has_value());
        CHECK_FALSE(map.isSuppressed(*part));
        CHECK(map.byId("other") == *unrelated);
    }

    TEST_CASE("destroy reports unknown ids and objects") {
        MemoryTree  tree;
        IdentityMap map(tree);

        auto byId = map.destroyId("missing");
        REQUIRE_FALSE(byId.has_value());
        CHECK(byId.error().code == Error::Code::UnknownId);

        auto byObject = map.destroyObject(ObjectHandle{999});
        REQUIRE_FALSE(byObject.has_value());
        CHECK(byObject.error().code == Error::Code::UnknownObject);
    }

    TEST_CASE("A failed destroy keeps the binding") {
        MemoryTree  tree;
        IdentityMap map(tree);
        REQUIRE(map.insert("root", tree.root()).has_value());

        auto result = map.destroyId("root");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::DestroyFailed);
        CHECK(map.byId("root") == tree.root());
    }

    TEST_CASE("Suppression lasts until the cycle ends") {
        MemoryTree  tree;
        IdentityMap map(tree);
        auto        part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());

        {
            IdentityMap::CycleGuard cycle(map);
            map.suppress(*part);
            CHECK(map.isSuppressed(*part));
        }
        CHECK_FALSE(map.isSuppressed(*part));
    }

    TEST_CASE("clear drops everything") {
        MemoryTree  tree;
        IdentityMap map(tree);
        REQUIRE(map.insert("root", tree.root()).has_value());
        map.suppress(tree.root());
        map.clear();
        CHECK(map.size() == 0);
        CHECK_FALSE(map.byObject(tree.root()).has_value());
        CHECK_FALSE(map.isSuppressed(tree.root()));
    }
}
