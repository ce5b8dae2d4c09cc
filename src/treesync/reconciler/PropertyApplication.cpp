#include "reconciler/PropertyApplication.hpp"

#include "identity/IdentityMap.hpp"
#include "log/TaggedLogger.hpp"
#include "reconciler/PropertyCodec.hpp"
#include "reconciler/PropertyWriter.hpp"
#include "reconciler/ReconcileContext.hpp"

namespace TS {

namespace {

template <typename Entries>
auto applyPass(ReconcileContext&         context,
               Id const&                 id,
               ObjectHandle              object,
               Entries const&            entries,
               std::string const*        skipKey,
               bool                      inPostBag,
               std::vector<DeferredRef>& deferredRefs) -> PropertyMap {
    PropertyMap failed;
    for (auto const& [name, value] : entries) {
        if (skipKey && name == *skipKey) {
            continue;
        }

        // Refs may point at objects this patch has not created yet.
        if (value.isRef()) {
            deferredRefs.push_back(DeferredRef{id, object, name, value, inPostBag});
            continue;
        }

        auto decoded = PropertyCodec::decode(value, context.identities, context.schema);
        if (!decoded) {
            ts_log("Could not decode " + id + "." + name + ": " + describeError(decoded.error()), "Reconciler", "DEBUG");
            failed.emplace(name, value);
            continue;
        }

        if (auto written = context.writer.write(object, name, *decoded); !written) {
            ts_log("Could not write " + id + "." + name + ": " + describeError(written.error()), "Reconciler", "DEBUG");
            failed.emplace(name, value);
        }
    }
    return failed;
}

} // namespace

auto applyProperties(ReconcileContext&         context,
                     Id const&                 id,
                     ObjectHandle              object,
                     PropertyMap const&        properties,
                     std::vector<DeferredRef>& deferredRefs) -> PropertyMap {
    auto const& postKey = context.options.postPropertiesKey;
    auto        failed  = applyPass(context, id, object, properties, &postKey, false, deferredRefs);

    auto postIt = properties.find(postKey);
    if (postIt == properties.end()) {
        return failed;
    }

    VirtualValue::Composite const* bag = nullptr;
    if (auto const* post = postIt->second.asComposite()) {
        if (auto bagIt = post->entries.find(context.options.postPropertiesBag); bagIt != post->entries.end()) {
            bag = bagIt->second.asComposite();
        }
    }
    if (!bag) {
        failed.insert_or_assign(postKey, postIt->second);
        return failed;
    }

    auto failedBag = applyPass(context, id, object, bag->entries, nullptr, true, deferredRefs);
    if (!failedBag.empty()) {
        PropertyMap retry;
        retry.emplace(context.options.postPropertiesBag, VirtualValue::composite(std::move(failedBag)));
        failed.insert_or_assign(postKey, VirtualValue::composite(std::move(retry)));
    }
    return failed;
}

} // namespace TS
