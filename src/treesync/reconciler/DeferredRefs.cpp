#include "reconciler/DeferredRefs.hpp"

#include "identity/IdentityMap.hpp"
#include "log/TaggedLogger.hpp"
#include "reconciler/PropertyWriter.hpp"
#include "reconciler/ReconcileContext.hpp"

namespace TS::DeferredRefResolver {

void resolve(ReconcileContext& context, std::vector<DeferredRef> const& deferredRefs, PatchSet& unapplied) {
    auto markFailed = [&](DeferredRef const& ref) {
        auto& changed = unapplied.updateFor(ref.id).changedProperties;
        if (!ref.inPostBag) {
            changed.insert_or_assign(ref.propertyName, ref.value);
            return;
        }
        auto const& options = context.options;
        auto&       post    = changed[options.postPropertiesKey];
        if (!post.isComposite()) {
            post = VirtualValue::composite({});
        }
        auto& bag = std::get<VirtualValue::Composite>(post.data).entries[options.postPropertiesBag];
        if (!bag.isComposite()) {
            bag = VirtualValue::composite({});
        }
        std::get<VirtualValue::Composite>(bag.data).entries.insert_or_assign(ref.propertyName, ref.value);
    };

    for (auto const& ref : deferredRefs) {
        auto const* target = ref.value.asRef();
        if (!target) {
            markFailed(ref);
            continue;
        }

        NativeValue resolved;
        if (!target->isNull()) {
            auto object = context.identities.byId(target->target);
            if (!object) {
                ts_log("Deferred ref " + ref.id + "." + ref.propertyName + " -> " + target->target + " is unbound",
                       "DeferredRefs",
                       "DEBUG");
                markFailed(ref);
                continue;
            }
            resolved = NativeValue{*object};
        }

        if (auto written = context.writer.write(ref.object, ref.propertyName, resolved); !written) {
            ts_log("Deferred ref write failed: " + describeError(written.error()), "DeferredRefs", "DEBUG");
            markFailed(ref);
        }
    }
}

} // namespace TS::DeferredRefResolver
