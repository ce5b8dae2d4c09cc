#pragma once

#include "core/Error.hpp"
#include "patch/PatchSet.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace TS::PatchJson {

/**
 * JSON form of patches, as exchanged with the sync server.
 *
 *   {
 *     "removed": ["id", {"object": 42}],
 *     "added": {
 *       "id": { "Id": "id", "Parent": "parentId", "Name": "Part", "ClassName": "Part",
 *               "Properties": { "Anchored": { "Bool": true } }, "Children": [] }
 *     },
 *     "updated": [
 *       { "id": "id", "changedName": "...", "changedClassName": "...",
 *         "changedProperties": { ... }, "changedMetadata": { ... } }
 *     ]
 *   }
 *
 * Values are single-key objects naming their type: {"String": "x"},
 * {"Vector3": [1, 2, 3]}, {"Ref": "id"} ({"Ref": null} is the null reference)
 * and {"Composite": {name: value, ...}}.
 */
[[nodiscard]] auto encodeValue(VirtualValue const& value) -> nlohmann::json;
[[nodiscard]] auto decodeValue(nlohmann::json const& json) -> Expected<VirtualValue>;

[[nodiscard]] auto encode(PatchSet const& patch) -> nlohmann::json;
[[nodiscard]] auto decode(nlohmann::json const& json) -> Expected<PatchSet>;

[[nodiscard]] auto parse(std::string const& text) -> Expected<PatchSet>;
[[nodiscard]] auto describePatch(PatchSet const& patch, int indent = 2) -> std::string;

} // namespace TS::PatchJson
