#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "history/HistoryJournal.hpp"
#include "identity/IdentityMap.hpp"
#include "patch/PatchSet.hpp"
#include "reconciler/PatchApplier.hpp"
#include "schema/SchemaTable.hpp"
#include "tree/MemoryTree.hpp"

#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>

namespace TS {

/**
 * A MemoryTree configured from a schema document, with its root bound to
 * `rootId` so patches can add instances under it. Backs treesync_apply.
 */
class PatchSession {
public:
    static constexpr std::string_view DefaultRootId = "root";

    [[nodiscard]] static auto fromSchemaJson(nlohmann::json const& schemaDocument, Id rootId = Id{DefaultRootId})
            -> Expected<std::unique_ptr<PatchSession>>;

    PatchSession(PatchSession const&)            = delete;
    PatchSession& operator=(PatchSession const&) = delete;

    [[nodiscard]] auto apply(Patch const& patch) -> Expected<PatchSet>;

    [[nodiscard]] auto tree() const noexcept -> MemoryTree const& { return tree_; }
    [[nodiscard]] auto identities() const noexcept -> IdentityMap const& { return identities_; }
    [[nodiscard]] auto history() const noexcept -> History::HistoryJournal const& { return history_; }

private:
    PatchSession() = default;

    MemoryTree                    tree_;
    IdentityMap                   identities_{tree_};
    History::HistoryJournal       history_;
    std::unique_ptr<SchemaTable>  schema_;
    std::unique_ptr<PatchApplier> applier_;
};

} // namespace TS
