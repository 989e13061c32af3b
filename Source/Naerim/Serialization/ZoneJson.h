#pragma once

#include "Naerim/Public/Types.h"

namespace Naerim::Serialization
{
    // Partial constraint record. A null max_children / required_type clears the limit.
    juce::Result constraintsPatchFromVar(const juce::var& record, ZoneConstraintsPatch& patchOut);
    juce::Result constraintsPatchFromJsonString(const juce::String& json, ZoneConstraintsPatch& patchOut);

    juce::var constraintsToVar(const ZoneConstraints& constraints);

    juce::var zoneToVar(const DropZone& zone);
    juce::Result zoneFromVar(const juce::var& record, DropZone& zoneOut);

    // Reads { "zones": [ ... ] } in registration order, parents before children.
    juce::Result zonesFromJsonString(const juce::String& json, std::vector<DropZone>& zonesOut);
}
