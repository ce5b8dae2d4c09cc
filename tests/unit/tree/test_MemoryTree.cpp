#include "core/ChangeSink.hpp"
#include "tree/MemoryTree.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TS;

namespace {

struct CollectingSink : ChangeSink {
    void notify(ObjectHandle object, std::string const& what) override { events.emplace_back(object, what); }

    std::vector<std::pair<ObjectHandle, std::string>> events;
};

} // namespace

TEST_SUITE("tree.memory") {
    TEST_CASE("Root object") {
        MemoryTree tree;
        CHECK(tree.exists(tree.root()));
        CHECK(tree.className(tree.root()) == std::string{MemoryTree::RootClassName});
        CHECK(tree.name(tree.root()) == std::string{MemoryTree::RootName});
        auto parent = tree.parent(tree.root());
        REQUIRE(parent.has_value());
        CHECK_FALSE(parent->has_value());
        CHECK(tree.objectCount() == 1);
        CHECK_FALSE(tree.exists(ObjectHandle{}));
    }

    TEST_CASE("create parents the new object and names it after its class") {
        MemoryTree tree;
        auto       part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());
        CHECK(tree.name(*part) == std::string{"Part"});
        CHECK(tree.parent(*part) == std::optional<ObjectHandle>{tree.root()});
        auto children = tree.children(tree.root());
        REQUIRE(children.has_value());
        CHECK(*children == std::vector<ObjectHandle>{*part});
        CHECK(tree.findChild(tree.root(), "Part") == *part);
    }

    TEST_CASE("create fails for uncreatable classes and unknown parents") {
        MemoryTree tree;
        tree.addUncreatableClass("Workspace");

        auto service = tree.create("Workspace", tree.root());
        REQUIRE_FALSE(service.has_value());
        CHECK(service.error().code == Error::Code::CreateFailed);

        auto orphan = tree.create("Part", ObjectHandle{42});
        REQUIRE_FALSE(orphan.has_value());
        CHECK(orphan.error().code == Error::Code::UnknownObject);

        auto unnamed = tree.create("", tree.root());
        CHECK_FALSE(unnamed.has_value());
    }

    TEST_CASE("destroy removes descendants") {
        MemoryTree tree;
        auto       model = tree.create("Model", tree.root());
        REQUIRE(model.has_value());
        auto part = tree.create("Part", *model);
        REQUIRE(part.has_value());

        REQUIRE(tree.destroy(*model).has_value());
        CHECK_FALSE(tree.exists(*model));
        CHECK_FALSE(tree.exists(*part));
        CHECK(tree.children(tree.root())->empty());
        CHECK(tree.objectCount() == 1);
    }

    TEST_CASE("Locked objects refuse structural changes") {
        MemoryTree tree;
        auto       folder = tree.create("Folder", tree.root());
        REQUIRE(folder.has_value());
        tree.lock(*folder);

        CHECK(tree.destroy(*folder).error().code == Error::Code::DestroyFailed);
        CHECK(tree.setName(*folder, "Renamed").error().code == Error::Code::RenameFailed);
        CHECK(tree.setParent(*folder, std::nullopt).error().code == Error::Code::ReparentFailed);
        CHECK(tree.exists(*folder));
    }

    TEST_CASE("setParent moves and detaches") {
        MemoryTree tree;
        auto       a = tree.create("Folder", tree.root());
        auto       b = tree.create("Folder", tree.root());
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        auto part = tree.create("Part", *a);
        REQUIRE(part.has_value());

        REQUIRE(tree.setParent(*part, *b).has_value());
        CHECK(tree.children(*a)->empty());
        CHECK(*tree.children(*b) == std::vector<ObjectHandle>{*part});

        REQUIRE(tree.setParent(*part, std::nullopt).has_value());
        CHECK(tree.children(*b)->empty());
        CHECK_FALSE(tree.parent(*part)->has_value());
        CHECK(tree.exists(*part));

        SUBCASE("An object cannot become its own descendant") {
            REQUIRE(tree.setParent(*b, *a).has_value());
            auto cycle = tree.setParent(*a, *b);
            REQUIRE_FALSE(cycle.has_value());
            CHECK(cycle.error().code == Error::Code::ReparentFailed);
        }
    }

    TEST_CASE("Names longer than the limit are truncated") {
        MemoryTree tree;
        tree.setMaxNameLength(4);
        auto part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());
        REQUIRE(tree.setName(*part, "LongName").has_value());
        CHECK(tree.name(*part) == std::string{"Long"});
    }

    TEST_CASE("Properties") {
        MemoryTree tree;
        auto       part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());

        CHECK(tree.getProperty(*part, "Anchored").error().code == Error::Code::NotFound);
        REQUIRE(tree.setProperty(*part, "Anchored", NativeValue{true}).has_value());
        CHECK(tree.getProperty(*part, "Anchored") == NativeValue{true});

        auto dangling = tree.setProperty(*part, "Target", NativeValue{ObjectHandle{1234}});
        REQUIRE_FALSE(dangling.has_value());
        CHECK(dangling.error().code == Error::Code::UnknownObject);

        NativeTable group;
        group.entries.emplace("Transparency", NativeValue{0.5});
        group.entries.emplace("Anchored", NativeValue{false});
        REQUIRE(tree.setProperties(*part, group).has_value());
        CHECK(tree.getProperty(*part, "Transparency") == NativeValue{0.5});
        CHECK(tree.getProperty(*part, "Anchored") == NativeValue{false});
    }

    TEST_CASE("Sinks observe mutations until released") {
        MemoryTree tree;
        auto       sink = std::make_shared<CollectingSink>();
        tree.addSink(sink);

        auto part = tree.create("Part", tree.root());
        REQUIRE(part.has_value());
        REQUIRE(tree.setName(*part, "Brick").has_value());
        REQUIRE(tree.setProperty(*part, "Anchored", NativeValue{true}).has_value());
        REQUIRE(tree.destroy(*part).has_value());

        REQUIRE(sink->events.size() == 4);
        CHECK(sink->events[0].second == "Children");
        CHECK(sink->events[1] == std::pair{*part, std::string{"Name"}});
        CHECK(sink->events[2] == std::pair{*part, std::string{"Anchored"}});
        CHECK(sink->events[3] == std::pair{*part, std::string{"Destroyed"}});

        sink.reset();
        CHECK(tree.create("Part", tree.root()).has_value());
    }
}
