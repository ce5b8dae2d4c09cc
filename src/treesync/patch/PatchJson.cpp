#include "patch/PatchJson.hpp"

#include <utility>

namespace TS::PatchJson {

using nlohmann::json;

namespace {

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto encodeProperties(PropertyMap const& properties) -> json {
    auto out = json::object();
    for (auto const& [name, value] : properties) {
        out[name] = encodeValue(value);
    }
    return out;
}

auto decodeProperties(json const& doc, std::string const& where) -> Expected<PropertyMap> {
    if (!doc.is_object()) {
        return std::unexpected(malformed(where + " must be an object"));
    }
    PropertyMap properties;
    for (auto const& [name, valueDoc] : doc.items()) {
        auto value = decodeValue(valueDoc);
        if (!value) {
            return std::unexpected(malformed(where + "." + name + ": " + describeError(value.error())));
        }
        properties.emplace(name, std::move(*value));
    }
    return properties;
}

auto optionalString(json const& doc, char const* key, std::string const& where)
        -> Expected<std::optional<std::string>> {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(malformed(where + "." + key + " must be a string"));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

auto decodeInstance(Id const& id, json const& doc) -> Expected<VirtualInstance> {
    auto const where = "added." + id;
    if (!doc.is_object()) {
        return std::unexpected(malformed(where + " must be an object"));
    }

    VirtualInstance instance;
    auto className = optionalString(doc, "ClassName", where);
    if (!className)
        return std::unexpected(className.error());
    if (!*className)
        return std::unexpected(malformed(where + ".ClassName is required"));
    instance.className = std::move(**className);

    auto name = optionalString(doc, "Name", where);
    if (!name)
        return std::unexpected(name.error());
    instance.name = name->value_or(instance.className);

    auto parent = optionalString(doc, "Parent", where);
    if (!parent)
        return std::unexpected(parent.error());
    instance.parent = std::move(*parent);

    if (auto it = doc.find("Properties"); it != doc.end()) {
        auto properties = decodeProperties(*it, where + ".Properties");
        if (!properties)
            return std::unexpected(properties.error());
        instance.properties = std::move(*properties);
    }

    if (auto it = doc.find("Children"); it != doc.end()) {
        if (!it->is_array()) {
            return std::unexpected(malformed(where + ".Children must be an array"));
        }
        for (auto const& child : *it) {
            if (!child.is_string()) {
                return std::unexpected(malformed(where + ".Children entries must be ids"));
            }
            instance.children.push_back(child.get<std::string>());
        }
    }
    return instance;
}

auto decodeUpdate(json const& doc, std::size_t index) -> Expected<Update> {
    auto const where = "updated[" + std::to_string(index) + "]";
    if (!doc.is_object()) {
        return std::unexpected(malformed(where + " must be an object"));
    }

    Update update;
    auto   id = optionalString(doc, "id", where);
    if (!id)
        return std::unexpected(id.error());
    if (!*id)
        return std::unexpected(malformed(where + ".id is required"));
    update.id = std::move(**id);

    auto changedName = optionalString(doc, "changedName", where);
    if (!changedName)
        return std::unexpected(changedName.error());
    update.changedName = std::move(*changedName);

    auto changedClassName = optionalString(doc, "changedClassName", where);
    if (!changedClassName)
        return std::unexpected(changedClassName.error());
    update.changedClassName = std::move(*changedClassName);

    if (auto it = doc.find("changedProperties"); it != doc.end() && !it->is_null()) {
        auto properties = decodeProperties(*it, where + ".changedProperties");
        if (!properties)
            return std::unexpected(properties.error());
        update.changedProperties = std::move(*properties);
    }

    if (auto it = doc.find("changedMetadata"); it != doc.end() && !it->is_null()) {
        update.changedMetadata = *it;
    }
    return update;
}

} // namespace

auto encodeValue(VirtualValue const& value) -> json {
    return std::visit(
            [](auto const& alternative) -> json {
                using T = std::decay_t<decltype(alternative)>;
                if constexpr (std::is_same_v<T, VirtualValue::Primitive>) {
                    json out = json::object();
                    out[alternative.type] = alternative.raw;
                    return out;
                } else if constexpr (std::is_same_v<T, VirtualValue::Ref>) {
                    json out = json::object();
                    out["Ref"] = alternative.isNull() ? json(nullptr) : json(alternative.target);
                    return out;
                } else {
                    json out = json::object();
                    out["Composite"] = encodeProperties(alternative.entries);
                    return out;
                }
            },
            value.data);
}

auto decodeValue(json const& doc) -> Expected<VirtualValue> {
    if (!doc.is_object() || doc.size() != 1) {
        return std::unexpected(malformed("a value must be an object with exactly one type key"));
    }
    auto const        entry = doc.begin();
    std::string const type  = entry.key();
    json const&       raw   = entry.value();
    if (type == "Ref") {
        if (raw.is_null()) {
            return VirtualValue::nullRef();
        }
        if (!raw.is_string()) {
            return std::unexpected(malformed("Ref must be an id or null"));
        }
        return VirtualValue::ref(raw.get<std::string>());
    }
    if (type == "Composite") {
        auto entries = decodeProperties(raw, "Composite");
        if (!entries) {
            return std::unexpected(entries.error());
        }
        return VirtualValue::composite(std::move(*entries));
    }
    return VirtualValue::primitive(type, raw);
}

auto encode(PatchSet const& patch) -> json {
    json removed = json::array();
    for (auto const& target : patch.removed) {
        if (auto const* id = std::get_if<Id>(&target)) {
            removed.push_back(*id);
        } else {
            json handle = json::object();
            handle["object"] = std::get<ObjectHandle>(target).value;
            removed.push_back(std::move(handle));
        }
    }

    json added = json::object();
    for (auto const& [id, instance] : patch.added) {
        json entry = json::object();
        entry["Id"]         = id;
        entry["Parent"]     = instance.parent ? json(*instance.parent) : json(nullptr);
        entry["Name"]       = instance.name;
        entry["ClassName"]  = instance.className;
        entry["Properties"] = encodeProperties(instance.properties);
        entry["Children"]   = instance.children;
        added[id]           = std::move(entry);
    }

    json updated = json::array();
    for (auto const& update : patch.updated) {
        json entry = json::object();
        entry["id"] = update.id;
        if (update.changedName)
            entry["changedName"] = *update.changedName;
        if (update.changedClassName)
            entry["changedClassName"] = *update.changedClassName;
        if (!update.changedProperties.empty())
            entry["changedProperties"] = encodeProperties(update.changedProperties);
        if (update.changedMetadata)
            entry["changedMetadata"] = *update.changedMetadata;
        updated.push_back(std::move(entry));
    }

    json out = json::object();
    out["removed"] = std::move(removed);
    out["added"]   = std::move(added);
    out["updated"] = std::move(updated);
    return out;
}

auto decode(json const& doc) -> Expected<PatchSet> {
    if (!doc.is_object()) {
        return std::unexpected(malformed("patch must be an object"));
    }
    PatchSet patch;

    if (auto it = doc.find("removed"); it != doc.end()) {
        if (!it->is_array()) {
            return std::unexpected(malformed("removed must be an array"));
        }
        for (auto const& entry : *it) {
            if (entry.is_string()) {
                patch.removed.emplace_back(entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("object") && entry.at("object").is_number_unsigned()) {
                patch.removed.emplace_back(ObjectHandle{entry.at("object").get<std::uint64_t>()});
            } else {
                return std::unexpected(malformed("removed entries must be an id or {\"object\": handle}"));
            }
        }
    }

    if (auto it = doc.find("added"); it != doc.end()) {
        if (!it->is_object()) {
            return std::unexpected(malformed("added must be an object"));
        }
        for (auto const& [id, instanceDoc] : it->items()) {
            auto instance = decodeInstance(id, instanceDoc);
            if (!instance) {
                return std::unexpected(instance.error());
            }
            patch.added.emplace(id, std::move(*instance));
        }
    }

    if (auto it = doc.find("updated"); it != doc.end()) {
        if (!it->is_array()) {
            return std::unexpected(malformed("updated must be an array"));
        }
        for (std::size_t index = 0; index < it->size(); ++index) {
            auto update = decodeUpdate((*it)[index], index);
            if (!update) {
                return std::unexpected(update.error());
            }
            patch.updated.push_back(std::move(*update));
        }
    }
    return patch;
}

auto parse(std::string const& text) -> Expected<PatchSet> {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(malformed("patch is not valid JSON"));
    }
    return decode(doc);
}

auto describePatch(PatchSet const& patch, int indent) -> std::string {
    return encode(patch).dump(indent);
}

} // namespace TS::PatchJson
