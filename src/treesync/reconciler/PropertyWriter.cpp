#include "reconciler/PropertyWriter.hpp"

#include "log/TaggedLogger.hpp"
#include "reconciler/PropertyCodec.hpp"
#include "schema/PropertySchema.hpp"
#include "tree/LiveTree.hpp"

#include <string>

namespace TS {

PropertyWriter::PropertyWriter(LiveTree& tree, PropertySchema const& schema, ApplyOptions const& options)
    : tree(tree), schema(schema), options(options) {}

auto PropertyWriter::write(ObjectHandle object, std::string_view propertyName, NativeValue const& value) const
        -> Expected<void> {
    if (propertyName == options.styledPropertiesName) {
        return writeStyledProperties(object, value);
    }

    auto className = tree.className(object);
    if (!className) {
        return std::unexpected(Error{Error::Code::OtherPropertyError, std::string{propertyName}});
    }
    auto const qualified = *className + "." + std::string{propertyName};

    auto const* descriptor = schema.findDescriptor(*className, propertyName);

    // Unknown properties are skipped; they are not reflected to the live model.
    if (!descriptor) {
        ts_log("Skipping unknown property " + qualified, "PropertyWriter", "TRACE");
        return {};
    }

    if (!isWritable(descriptor->scriptability())) {
        return std::unexpected(Error{Error::Code::UnwritableProperty, qualified});
    }

    auto written = descriptor->write(object, value);
    if (!written) {
        auto const& failure = written.error();
        bool const  lackingPermission =
                failure.kind == DescriptorWriteFailure::Kind::PermissionDenied
                || (failure.kind == DescriptorWriteFailure::Kind::Host
                    && failure.detail.find(DescriptorWriteFailure::LackingPermissionText) != std::string::npos);
        if (lackingPermission) {
            return std::unexpected(Error{Error::Code::LackingPropertyPermissions, qualified});
        }
        ts_log("Write to " + qualified + " failed: " + failure.detail, "PropertyWriter", "DEBUG");
        return std::unexpected(Error{Error::Code::OtherPropertyError, qualified});
    }
    return {};
}

auto PropertyWriter::writeStyledProperties(ObjectHandle object, NativeValue const& value) const -> Expected<void> {
    auto const* table = value.get<NativeTable>();
    if (!table) {
        // Passed to the host unchanged; like the bulk write, it is the host's to validate.
        if (auto written = tree.setProperty(object, options.styledPropertiesName, value); !written) {
            ts_log("Write of non-table " + options.styledPropertiesName + " reported " + describeError(written.error()),
                   "PropertyWriter",
                   "DEBUG");
        }
        return {};
    }

    NativeTable styled = *table;
    for (auto& [name, entry] : styled.entries) {
        auto const* text = entry.get<std::string>();
        if (!text) {
            continue;
        }
        auto const path = PropertyCodec::splitEnumPath(*text);
        if (!path) {
            continue;
        }
        if (auto item = schema.findEnumItem(path->enumName, path->itemName)) {
            entry = NativeValue{std::move(*item)};
        }
    }

    // Validation of the group is left to the host.
    if (auto written = tree.setProperties(object, std::move(styled)); !written) {
        ts_log("Bulk write of " + options.styledPropertiesName + " reported " + describeError(written.error()),
               "PropertyWriter",
               "DEBUG");
    }
    return {};
}

} // namespace TS
