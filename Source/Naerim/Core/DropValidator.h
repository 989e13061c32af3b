#pragma once

#include "Naerim/Public/DragPayload.h"
#include "Naerim/Public/Types.h"

namespace Naerim::Runtime
{
    class DropDiagnostics;
}

namespace Naerim::Core
{
    class SpatialDropIndex;

    // Constraint keys reported in ValidationResult::violatedConstraints.
    namespace ConstraintKey
    {
        inline const juce::String accepts { "accepts" };
        inline const juce::String maxChildren { "max_children" };
        inline const juce::String requiredType { "required_type" };
        inline const juce::String exclusive { "exclusive" };
        inline const juce::String minWidth { "min_width" };
        inline const juce::String minHeight { "min_height" };
        inline const juce::String invalidParents { "invalid_parents" };
        inline const juce::String zone { "zone" };
    }

    class DropValidator
    {
    public:
        explicit DropValidator(SpatialDropIndex& indexIn, Runtime::DropDiagnostics* diagnosticsIn = nullptr);

        // Rules run in a fixed order and the first failure is reported.
        ValidationResult validate(const DropZone& zone, const DragPayload& payload) const;
        ValidationResult validate(const ZoneId& zoneId, const DragPayload& payload) const;

        bool updateConstraints(const ZoneId& zoneId, const ZoneConstraintsPatch& patch);

    private:
        static ValidationResult checkTypeAcceptance(const DropZone& zone, const DragPayload& payload);
        static ValidationResult checkZoneKind(const DropZone& zone, const DragPayload& payload);
        static ValidationResult checkSize(const DropZone& zone, const DragPayload& payload);
        static ValidationResult checkPayloadExclusions(const DropZone& zone, const DragPayload& payload);

        SpatialDropIndex& index;
        Runtime::DropDiagnostics* diagnostics = nullptr;
    };
}
