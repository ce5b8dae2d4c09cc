#pragma once

#include <string>

namespace TS {

struct ApplyOptions {
    // Undo history recordings are labelled "<historyLabel> <HH:MM:SS>".
    std::string historyLabel = "TreeSync: Patch";

    // Property whose table value is written in one bulk call, with
    // "Enum.<Name>.<Item>" strings turned into enum values first.
    std::string styledPropertiesName = "StyledProperties";

    // Changed-property key holding values that must be applied after the
    // rest, and the bag inside it whose entries are applied as properties.
    std::string postPropertiesKey = "PostProperties";
    std::string postPropertiesBag = "Attributes";
};

} // namespace TS
