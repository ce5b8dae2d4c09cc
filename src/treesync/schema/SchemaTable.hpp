#pragma once

#include "schema/PropertySchema.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace TS {

class LiveTree;

/**
 * Table-driven PropertySchema writing through a LiveTree.
 *
 * Configured in code (addClass/addProperty/addEnum) or from JSON:
 *
 *   {
 *     "classes": {
 *       "Instance": { "properties": { "Archivable": { "kind": "Bool" } } },
 *       "Part": {
 *         "superclass": "Instance",
 *         "properties": {
 *           "Anchored":  { "kind": "Bool" },
 *           "Mass":      { "kind": "Float64", "scriptability": "Read" },
 *           "Locked":    { "kind": "Bool", "permission": "denied" },
 *           "Secret":    { "kind": "String", "permission": "message" }
 *         }
 *       }
 *     },
 *     "enums": { "Material": { "Plastic": 256, "Wood": 512 } }
 *   }
 *
 * `kind` is the native kind the host accepts (any when omitted), `scriptability`
 * defaults to ReadWrite. `permission` simulates a write rejected for lack of
 * permission, either reported structurally ("denied") or only as a host
 * message ("message"). Lookups walk the superclass chain.
 */
class SchemaTable final : public PropertySchema {
public:
    enum class PermissionMode {
        Granted,
        Denied,
        DeniedMessageOnly
    };

    struct PropertySpec {
        std::optional<NativeValue::Kind> kind;
        Scriptability                    scriptability = Scriptability::ReadWrite;
        PermissionMode                   permission    = PermissionMode::Granted;
    };

    explicit SchemaTable(LiveTree& tree);
    ~SchemaTable() override;

    SchemaTable(SchemaTable const&)            = delete;
    SchemaTable& operator=(SchemaTable const&) = delete;

    [[nodiscard]] static auto fromJson(LiveTree& tree, nlohmann::json const& document)
            -> Expected<std::unique_ptr<SchemaTable>>;

    void addClass(std::string className, std::optional<std::string> superclass = std::nullopt);
    void addProperty(std::string const& className, std::string propertyName, PropertySpec spec);
    void addEnum(std::string enumName, std::map<std::string, std::uint32_t> items);

    [[nodiscard]] auto findDescriptor(std::string_view className, std::string_view propertyName) const
            -> PropertyDescriptor const* override;
    [[nodiscard]] auto findEnumItem(std::string_view enumName, std::string_view itemName) const
            -> std::optional<EnumItem> override;

private:
    class Descriptor;

    struct ClassEntry {
        std::optional<std::string>                                    superclass;
        std::map<std::string, std::unique_ptr<Descriptor>, std::less<>> properties;
    };

    LiveTree&                                                             tree;
    std::map<std::string, ClassEntry, std::less<>>                        classes;
    std::map<std::string, std::map<std::string, std::uint32_t, std::less<>>, std::less<>> enums;
};

} // namespace TS
