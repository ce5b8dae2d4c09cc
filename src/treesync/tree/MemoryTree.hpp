#pragma once

#include "core/ChangeSink.hpp"
#include "tree/LiveTree.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace TS {

/**
 * In-memory LiveTree.
 *
 * Used as the host in tests and by the command-line tool, and as the reference
 * for how a host adapter is expected to behave.
 *
 * Host restrictions it can simulate:
 * - uncreatable classes: create() fails for them
 * - locked objects: cannot be destroyed, renamed or reparented (like services)
 * - a maximum name length: longer names are silently truncated
 *
 * Every successful mutation is reported to the registered ChangeSinks.
 */
class MemoryTree final : public LiveTree {
public:
    static constexpr std::string_view RootClassName = "DataModel";
    static constexpr std::string_view RootName      = "Game";

    MemoryTree();

    [[nodiscard]] auto root() const -> ObjectHandle override { return rootHandle; }
    [[nodiscard]] bool exists(ObjectHandle object) const override;

    auto create(std::string_view className, ObjectHandle parent) -> Expected<ObjectHandle> override;
    auto destroy(ObjectHandle object) -> Expected<void> override;
    auto setParent(ObjectHandle object, std::optional<ObjectHandle> parent) -> Expected<void> override;
    auto setName(ObjectHandle object, std::string_view name) -> Expected<void> override;

    [[nodiscard]] auto className(ObjectHandle object) const -> Expected<std::string> override;
    [[nodiscard]] auto name(ObjectHandle object) const -> Expected<std::string> override;
    [[nodiscard]] auto parent(ObjectHandle object) const -> Expected<std::optional<ObjectHandle>> override;
    [[nodiscard]] auto children(ObjectHandle object) const -> Expected<std::vector<ObjectHandle>> override;

    auto setProperty(ObjectHandle object, std::string_view property, NativeValue value) -> Expected<void> override;
    auto setProperties(ObjectHandle object, NativeTable values) -> Expected<void> override;
    [[nodiscard]] auto getProperty(ObjectHandle object, std::string_view property) const
            -> Expected<NativeValue> override;

    // Host restrictions
    void addUncreatableClass(std::string className);
    void lock(ObjectHandle object);
    void setMaxNameLength(std::size_t length) { maxNameLength = length; }

    void addSink(std::weak_ptr<ChangeSink> sink);

    // Finds the first child with the given name.
    [[nodiscard]] auto findChild(ObjectHandle parent, std::string_view name) const -> std::optional<ObjectHandle>;
    [[nodiscard]] auto objectCount() const noexcept -> std::size_t { return objects.size(); }

private:
    struct Object {
        std::string                        className;
        std::string                        name;
        std::optional<ObjectHandle>        parent;
        std::vector<ObjectHandle>          children;
        std::map<std::string, NativeValue> properties;
        bool                               locked = false;
    };

    auto lookup(ObjectHandle object) -> Object*;
    auto lookup(ObjectHandle object) const -> Object const*;
    auto unlinkFromParent(ObjectHandle object, Object& entry) -> void;
    auto isDescendant(ObjectHandle candidate, ObjectHandle ancestor) const -> bool;
    auto notify(ObjectHandle object, std::string const& what) -> void;

    phmap::node_hash_map<ObjectHandle, Object> objects;
    phmap::flat_hash_set<std::string>          uncreatableClasses;
    std::vector<std::weak_ptr<ChangeSink>>     sinks;
    std::uint64_t                              nextHandle    = 1;
    std::size_t                                maxNameLength = 0;
    ObjectHandle                               rootHandle;
};

} // namespace TS
