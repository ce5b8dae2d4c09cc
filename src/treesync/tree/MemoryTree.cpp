#include "tree/MemoryTree.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace TS {

namespace {

auto unknownObject(ObjectHandle object) -> Error {
    return Error{Error::Code::UnknownObject, "No live object " + describeHandle(object)};
}

} // namespace

MemoryTree::MemoryTree() {
    rootHandle = ObjectHandle{nextHandle++};
    Object root;
    root.className = std::string{RootClassName};
    root.name      = std::string{RootName};
    root.locked    = true;
    objects.emplace(rootHandle, std::move(root));
}

auto MemoryTree::lookup(ObjectHandle object) -> Object* {
    auto it = objects.find(object);
    return it == objects.end() ? nullptr : &it->second;
}

auto MemoryTree::lookup(ObjectHandle object) const -> Object const* {
    auto it = objects.find(object);
    return it == objects.end() ? nullptr : &it->second;
}

bool MemoryTree::exists(ObjectHandle object) const {
    return object.valid() && objects.contains(object);
}

auto MemoryTree::create(std::string_view className, ObjectHandle parent) -> Expected<ObjectHandle> {
    auto* parentEntry = lookup(parent);
    if (!parentEntry) {
        return std::unexpected(unknownObject(parent));
    }
    if (className.empty() || uncreatableClasses.contains(std::string{className})) {
        return std::unexpected(Error{Error::Code::CreateFailed,
                                     "Unable to create an object of class '" + std::string{className} + "'"});
    }

    auto const handle = ObjectHandle{nextHandle++};
    Object     entry;
    entry.className = std::string{className};
    entry.name      = std::string{className};
    entry.parent    = parent;
    objects.emplace(handle, std::move(entry));
    // node_hash_map keeps references stable, parentEntry is still valid
    parentEntry->children.push_back(handle);
    ts_log("MemoryTree::create " + std::string{className} + " " + describeHandle(handle), "MemoryTree", "TRACE");
    notify(parent, "Children");
    return handle;
}

auto MemoryTree::unlinkFromParent(ObjectHandle object, Object& entry) -> void {
    if (!entry.parent) {
        return;
    }
    if (auto* parentEntry = lookup(*entry.parent)) {
        auto& siblings = parentEntry->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), object), siblings.end());
    }
    entry.parent.reset();
}

auto MemoryTree::destroy(ObjectHandle object) -> Expected<void> {
    auto* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    if (entry->locked) {
        return std::unexpected(Error{Error::Code::DestroyFailed,
                                     "Object " + describeHandle(object) + " cannot be destroyed"});
    }

    unlinkFromParent(object, *entry);

    std::vector<ObjectHandle> pending{object};
    while (!pending.empty()) {
        auto const current = pending.back();
        pending.pop_back();
        auto it = objects.find(current);
        if (it == objects.end()) {
            continue;
        }
        pending.insert(pending.end(), it->second.children.begin(), it->second.children.end());
        objects.erase(it);
        notify(current, "Destroyed");
    }
    return {};
}

auto MemoryTree::isDescendant(ObjectHandle candidate, ObjectHandle ancestor) const -> bool {
    auto const* entry = lookup(candidate);
    while (entry) {
        if (candidate == ancestor) {
            return true;
        }
        if (!entry->parent) {
            return false;
        }
        candidate = *entry->parent;
        entry     = lookup(candidate);
    }
    return false;
}

auto MemoryTree::setParent(ObjectHandle object, std::optional<ObjectHandle> parent) -> Expected<void> {
    auto* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    if (entry->locked) {
        return std::unexpected(Error{Error::Code::ReparentFailed,
                                     "Object " + describeHandle(object) + " cannot be reparented"});
    }
    if (entry->parent == parent) {
        return {};
    }
    if (parent) {
        if (!lookup(*parent)) {
            return std::unexpected(unknownObject(*parent));
        }
        if (isDescendant(*parent, object)) {
            return std::unexpected(Error{Error::Code::ReparentFailed,
                                         "Cannot parent " + describeHandle(object) + " under its own descendant"});
        }
    }

    unlinkFromParent(object, *entry);
    if (parent) {
        lookup(*parent)->children.push_back(object);
        entry->parent = parent;
    }
    notify(object, "Parent");
    return {};
}

auto MemoryTree::setName(ObjectHandle object, std::string_view name) -> Expected<void> {
    auto* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    if (entry->locked) {
        return std::unexpected(Error{Error::Code::RenameFailed,
                                     "Object " + describeHandle(object) + " cannot be renamed"});
    }
    if (maxNameLength > 0 && name.size() > maxNameLength) {
        name = name.substr(0, maxNameLength);
    }
    entry->name.assign(name.begin(), name.end());
    notify(object, "Name");
    return {};
}

auto MemoryTree::className(ObjectHandle object) const -> Expected<std::string> {
    if (auto const* entry = lookup(object)) {
        return entry->className;
    }
    return std::unexpected(unknownObject(object));
}

auto MemoryTree::name(ObjectHandle object) const -> Expected<std::string> {
    if (auto const* entry = lookup(object)) {
        return entry->name;
    }
    return std::unexpected(unknownObject(object));
}

auto MemoryTree::parent(ObjectHandle object) const -> Expected<std::optional<ObjectHandle>> {
    if (auto const* entry = lookup(object)) {
        return entry->parent;
    }
    return std::unexpected(unknownObject(object));
}

auto MemoryTree::children(ObjectHandle object) const -> Expected<std::vector<ObjectHandle>> {
    if (auto const* entry = lookup(object)) {
        return entry->children;
    }
    return std::unexpected(unknownObject(object));
}

auto MemoryTree::setProperty(ObjectHandle object, std::string_view property, NativeValue value) -> Expected<void> {
    auto* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    if (auto const* target = value.get<ObjectHandle>(); target && !lookup(*target)) {
        return std::unexpected(unknownObject(*target));
    }
    std::string key{property};
    entry->properties.insert_or_assign(key, std::move(value));
    notify(object, key);
    return {};
}

auto MemoryTree::setProperties(ObjectHandle object, NativeTable values) -> Expected<void> {
    auto* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    for (auto& [key, value] : values.entries) {
        entry->properties.insert_or_assign(key, std::move(value));
        notify(object, key);
    }
    return {};
}

auto MemoryTree::getProperty(ObjectHandle object, std::string_view property) const -> Expected<NativeValue> {
    auto const* entry = lookup(object);
    if (!entry) {
        return std::unexpected(unknownObject(object));
    }
    auto it = entry->properties.find(std::string{property});
    if (it == entry->properties.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "Property '" + std::string{property} + "' is not set"});
    }
    return it->second;
}

void MemoryTree::addUncreatableClass(std::string className) {
    uncreatableClasses.insert(std::move(className));
}

void MemoryTree::lock(ObjectHandle object) {
    if (auto* entry = lookup(object)) {
        entry->locked = true;
    }
}

void MemoryTree::addSink(std::weak_ptr<ChangeSink> sink) {
    sinks.push_back(std::move(sink));
}

auto MemoryTree::findChild(ObjectHandle parent, std::string_view name) const -> std::optional<ObjectHandle> {
    auto const* entry = lookup(parent);
    if (!entry) {
        return std::nullopt;
    }
    for (auto child : entry->children) {
        if (auto const* childEntry = lookup(child); childEntry && childEntry->name == name) {
            return child;
        }
    }
    return std::nullopt;
}

auto MemoryTree::notify(ObjectHandle object, std::string const& what) -> void {
    sinks.erase(std::remove_if(sinks.begin(), sinks.end(), [](auto const& sink) { return sink.expired(); }),
                sinks.end());
    for (auto const& weak : sinks) {
        if (auto sink = weak.lock()) {
            sink->notify(object, what);
        }
    }
}

} // namespace TS
