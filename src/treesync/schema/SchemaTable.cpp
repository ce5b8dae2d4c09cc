#include "schema/SchemaTable.hpp"

#include "tree/LiveTree.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <set>
#include <utility>

namespace TS {

auto scriptabilityName(Scriptability scriptability) -> std::string_view {
    switch (scriptability) {
    case Scriptability::None:
        return "None";
    case Scriptability::Read:
        return "Read";
    case Scriptability::Write:
        return "Write";
    case Scriptability::ReadWrite:
        return "ReadWrite";
    }
    return "None";
}

auto parseScriptability(std::string_view text) -> std::optional<Scriptability> {
    for (auto candidate : {Scriptability::None, Scriptability::Read, Scriptability::Write, Scriptability::ReadWrite}) {
        if (scriptabilityName(candidate) == text) {
            return candidate;
        }
    }
    return std::nullopt;
}

namespace {

auto parseKind(std::string_view text) -> std::optional<NativeValue::Kind> {
    constexpr std::array kinds{NativeValue::Kind::Nil,
                               NativeValue::Kind::Bool,
                               NativeValue::Kind::Int64,
                               NativeValue::Kind::Float64,
                               NativeValue::Kind::String,
                               NativeValue::Kind::Vector,
                               NativeValue::Kind::Enum,
                               NativeValue::Kind::Object,
                               NativeValue::Kind::Table};
    for (auto kind : kinds) {
        if (nativeKindName(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

auto parsePermission(std::string_view text) -> std::optional<SchemaTable::PermissionMode> {
    if (text == "granted")
        return SchemaTable::PermissionMode::Granted;
    if (text == "denied")
        return SchemaTable::PermissionMode::Denied;
    if (text == "message")
        return SchemaTable::PermissionMode::DeniedMessageOnly;
    return std::nullopt;
}

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

class SchemaTable::Descriptor final : public PropertyDescriptor {
public:
    Descriptor(LiveTree& tree, std::string className, std::string propertyName, PropertySpec spec)
        : tree(tree), className(std::move(className)), propertyName(std::move(propertyName)), spec(spec) {}

    [[nodiscard]] auto scriptability() const -> Scriptability override { return spec.scriptability; }

    auto write(ObjectHandle object, NativeValue const& value) const
            -> std::expected<void, DescriptorWriteFailure> override {
        switch (spec.permission) {
        case PermissionMode::Granted:
            break;
        case PermissionMode::Denied:
            return std::unexpected(DescriptorWriteFailure{DescriptorWriteFailure::Kind::PermissionDenied,
                                                          "write to " + qualifiedName() + " denied"});
        case PermissionMode::DeniedMessageOnly:
            return std::unexpected(DescriptorWriteFailure{
                    DescriptorWriteFailure::Kind::Host,
                    "The current identity cannot set " + qualifiedName() + " (lacking permission 4)"});
        }

        // Nil clears any property, including typed ones.
        if (spec.kind && !value.isNil() && value.kind() != *spec.kind) {
            return std::unexpected(DescriptorWriteFailure{
                    DescriptorWriteFailure::Kind::Host,
                    "Unable to assign " + std::string{nativeKindName(value.kind())} + " to " + qualifiedName()
                            + " of type " + std::string{nativeKindName(*spec.kind)}});
        }

        if (auto result = tree.setProperty(object, propertyName, value); !result) {
            return std::unexpected(DescriptorWriteFailure{DescriptorWriteFailure::Kind::Host,
                                                          describeError(result.error())});
        }
        return {};
    }

private:
    [[nodiscard]] auto qualifiedName() const -> std::string { return className + "." + propertyName; }

    LiveTree&    tree;
    std::string  className;
    std::string  propertyName;
    PropertySpec spec;
};

SchemaTable::SchemaTable(LiveTree& tree) : tree(tree) {}

SchemaTable::~SchemaTable() = default;

void SchemaTable::addClass(std::string className, std::optional<std::string> superclass) {
    auto& entry      = classes[std::move(className)];
    entry.superclass = std::move(superclass);
}

void SchemaTable::addProperty(std::string const& className, std::string propertyName, PropertySpec spec) {
    auto& entry      = classes[className];
    auto  descriptor = std::make_unique<Descriptor>(tree, className, propertyName, spec);
    entry.properties.insert_or_assign(std::move(propertyName), std::move(descriptor));
}

void SchemaTable::addEnum(std::string enumName, std::map<std::string, std::uint32_t> items) {
    auto& target = enums[std::move(enumName)];
    for (auto& [item, value] : items) {
        target.insert_or_assign(item, value);
    }
}

auto SchemaTable::findDescriptor(std::string_view className, std::string_view propertyName) const
        -> PropertyDescriptor const* {
    std::set<std::string_view> visited;
    auto                       current = classes.find(className);
    while (current != classes.end() && visited.insert(current->first).second) {
        auto const& entry = current->second;
        if (auto it = entry.properties.find(propertyName); it != entry.properties.end()) {
            return it->second.get();
        }
        if (!entry.superclass) {
            break;
        }
        current = classes.find(*entry.superclass);
    }
    return nullptr;
}

auto SchemaTable::findEnumItem(std::string_view enumName, std::string_view itemName) const
        -> std::optional<EnumItem> {
    auto enumIt = enums.find(enumName);
    if (enumIt == enums.end()) {
        return std::nullopt;
    }
    auto itemIt = enumIt->second.find(itemName);
    if (itemIt == enumIt->second.end()) {
        return std::nullopt;
    }
    return EnumItem{enumIt->first, itemIt->first, itemIt->second};
}

auto SchemaTable::fromJson(LiveTree& tree, nlohmann::json const& document) -> Expected<std::unique_ptr<SchemaTable>> {
    if (!document.is_object()) {
        return std::unexpected(malformed("schema document must be an object"));
    }
    auto table = std::make_unique<SchemaTable>(tree);

    if (auto classesIt = document.find("classes"); classesIt != document.end()) {
        if (!classesIt->is_object()) {
            return std::unexpected(malformed("'classes' must be an object"));
        }
        for (auto const& [className, classDoc] : classesIt->items()) {
            if (!classDoc.is_object()) {
                return std::unexpected(malformed("class '" + className + "' must be an object"));
            }
            std::optional<std::string> superclass;
            if (auto superIt = classDoc.find("superclass"); superIt != classDoc.end()) {
                if (!superIt->is_string()) {
                    return std::unexpected(malformed("superclass of '" + className + "' must be a string"));
                }
                superclass = superIt->get<std::string>();
            }
            table->addClass(className, std::move(superclass));

            auto propertiesIt = classDoc.find("properties");
            if (propertiesIt == classDoc.end()) {
                continue;
            }
            if (!propertiesIt->is_object()) {
                return std::unexpected(malformed("properties of '" + className + "' must be an object"));
            }
            for (auto const& [propertyName, propertyDoc] : propertiesIt->items()) {
                if (!propertyDoc.is_object()) {
                    return std::unexpected(malformed(className + "." + propertyName + " must be an object"));
                }
                PropertySpec spec;
                if (auto kindIt = propertyDoc.find("kind"); kindIt != propertyDoc.end()) {
                    auto kind = kindIt->is_string() ? parseKind(kindIt->get<std::string>()) : std::nullopt;
                    if (!kind) {
                        return std::unexpected(malformed("unknown kind for " + className + "." + propertyName));
                    }
                    spec.kind = kind;
                }
                if (auto scriptIt = propertyDoc.find("scriptability"); scriptIt != propertyDoc.end()) {
                    auto scriptability =
                            scriptIt->is_string() ? parseScriptability(scriptIt->get<std::string>()) : std::nullopt;
                    if (!scriptability) {
                        return std::unexpected(
                                malformed("unknown scriptability for " + className + "." + propertyName));
                    }
                    spec.scriptability = *scriptability;
                }
                if (auto permissionIt = propertyDoc.find("permission"); permissionIt != propertyDoc.end()) {
                    auto permission =
                            permissionIt->is_string() ? parsePermission(permissionIt->get<std::string>()) : std::nullopt;
                    if (!permission) {
                        return std::unexpected(malformed("unknown permission for " + className + "." + propertyName));
                    }
                    spec.permission = *permission;
                }
                table->addProperty(className, propertyName, spec);
            }
        }
    }

    if (auto enumsIt = document.find("enums"); enumsIt != document.end()) {
        if (!enumsIt->is_object()) {
            return std::unexpected(malformed("'enums' must be an object"));
        }
        for (auto const& [enumName, itemsDoc] : enumsIt->items()) {
            if (!itemsDoc.is_object()) {
                return std::unexpected(malformed("enum '" + enumName + "' must be an object"));
            }
            std::map<std::string, std::uint32_t> items;
            for (auto const& [itemName, value] : itemsDoc.items()) {
                if (!value.is_number_unsigned()) {
                    return std::unexpected(malformed("Enum." + enumName + "." + itemName + " must be unsigned"));
                }
                items.emplace(itemName, value.get<std::uint32_t>());
            }
            table->addEnum(enumName, std::move(items));
        }
    }

    return table;
}

} // namespace TS
