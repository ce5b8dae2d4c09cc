#include "tools/PatchSession.hpp"

#include "log/TaggedLogger.hpp"

namespace TS {

auto PatchSession::fromSchemaJson(nlohmann::json const& schemaDocument, Id rootId)
        -> Expected<std::unique_ptr<PatchSession>> {
    if (rootId.empty()) {
        return std::unexpected(Error{Error::Code::InvalidValue, "Root id must not be empty"});
    }

    std::unique_ptr<PatchSession> session(new PatchSession());

    auto schema = SchemaTable::fromJson(session->tree_, schemaDocument);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    session->schema_ = std::move(*schema);

    if (auto bound = session->identities_.insert(rootId, session->tree_.root()); !bound) {
        return std::unexpected(bound.error());
    }
    ts_log("Root bound to '" + rootId + "'", "PatchSession", "DEBUG");

    session->applier_ =
            std::make_unique<PatchApplier>(session->tree_, *session->schema_, session->identities_, &session->history_);
    return session;
}

auto PatchSession::apply(Patch const& patch) -> Expected<PatchSet> {
    return applier_->apply(patch);
}

} // namespace TS
