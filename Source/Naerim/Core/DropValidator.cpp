#include "Naerim/Core/DropValidator.h"

#include "Naerim/Core/SpatialDropIndex.h"
#include "Naerim/Runtime/DropDiagnostics.h"

namespace Naerim::Core
{
    namespace
    {
        std::optional<double> numericConstraint(const juce::var& value)
        {
            if (isNumericVar(value))
                return static_cast<double>(value);
            return std::nullopt;
        }

        bool listContains(const juce::var& list, const juce::String& key)
        {
            if (const auto* array = list.getArray())
            {
                for (const auto& item : *array)
                {
                    if (item.toString().trim() == key)
                        return true;
                }

                return false;
            }

            return list.isString() && list.toString().trim() == key;
        }
    }

    DropValidator::DropValidator(SpatialDropIndex& indexIn, Runtime::DropDiagnostics* diagnosticsIn)
        : index(indexIn),
          diagnostics(diagnosticsIn)
    {
    }

    ValidationResult DropValidator::validate(const DropZone& zone, const DragPayload& payload) const
    {
        auto result = checkTypeAcceptance(zone, payload);
        if (result.isValid)
            result = checkZoneKind(zone, payload);
        if (result.isValid)
            result = checkSize(zone, payload);
        if (result.isValid)
            result = checkPayloadExclusions(zone, payload);

        if (!result.isValid && diagnostics != nullptr)
            diagnostics->debug("Validator", "zone=" + zone.id + " type=" + payload.type() + " rejected: " + result.reason);

        return result;
    }

    ValidationResult DropValidator::validate(const ZoneId& zoneId, const DragPayload& payload) const
    {
        if (const auto zone = index.findZone(zoneId))
            return validate(*zone, payload);

        return ValidationResult::rejected("Drop zone '" + zoneId + "' is not registered",
                                          "Refresh the canvas and try again",
                                          ConstraintKey::zone);
    }

    bool DropValidator::updateConstraints(const ZoneId& zoneId, const ZoneConstraintsPatch& patch)
    {
        return index.updateConstraints(zoneId, patch);
    }

    ValidationResult DropValidator::checkTypeAcceptance(const DropZone& zone, const DragPayload& payload)
    {
        if (acceptsType(zone.accepts, payload.type()))
            return ValidationResult::accepted();

        return ValidationResult::rejected("Component type '" + payload.type() + "' not accepted",
                                          "Try a different component type",
                                          ConstraintKey::accepts);
    }

    ValidationResult DropValidator::checkZoneKind(const DropZone& zone, const DragPayload& payload)
    {
        const auto& constraints = zone.constraints;

        if (constraints.kind == DropZoneKind::container)
        {
            if (constraints.maxChildren.has_value() && constraints.childCount >= *constraints.maxChildren)
            {
                return ValidationResult::rejected("Container already has maximum children ("
                                                      + juce::String(*constraints.maxChildren) + ")",
                                                  "Remove existing components or use a different container",
                                                  ConstraintKey::maxChildren);
            }
        }
        else if (constraints.kind == DropZoneKind::slot)
        {
            if (constraints.requiredType.has_value()
                && constraints.requiredType->isNotEmpty()
                && *constraints.requiredType != payload.type())
            {
                return ValidationResult::rejected("Slot requires '" + *constraints.requiredType + "' component",
                                                  "Use a " + *constraints.requiredType + " component instead",
                                                  ConstraintKey::requiredType);
            }

            if (constraints.exclusive && constraints.occupied)
            {
                return ValidationResult::rejected("Slot is already occupied",
                                                  "Remove existing component first",
                                                  ConstraintKey::exclusive);
            }
        }

        return ValidationResult::accepted();
    }

    ValidationResult DropValidator::checkSize(const DropZone& zone, const DragPayload& payload)
    {
        const auto& constraints = zone.constraints;
        const auto minWidth = numericConstraint(payload.constraint(ConstraintKey::minWidth));
        const auto minHeight = numericConstraint(payload.constraint(ConstraintKey::minHeight));

        juce::String violated;
        if (minWidth.has_value() && constraints.availableWidth.has_value() && *minWidth > *constraints.availableWidth)
            violated = ConstraintKey::minWidth;
        else if (minHeight.has_value() && constraints.availableHeight.has_value() && *minHeight > *constraints.availableHeight)
            violated = ConstraintKey::minHeight;

        if (violated.isEmpty())
            return ValidationResult::accepted();

        return ValidationResult::rejected("Component too large for drop zone",
                                          "Use a larger container or smaller component",
                                          violated);
    }

    ValidationResult DropValidator::checkPayloadExclusions(const DropZone& zone, const DragPayload& payload)
    {
        const auto kindKey = dropZoneKindToKey(zone.constraints.kind);
        if (!listContains(payload.constraint(ConstraintKey::invalidParents), kindKey))
            return ValidationResult::accepted();

        return ValidationResult::rejected("Component cannot be placed in " + kindKey,
                                          "Use a compatible container type",
                                          ConstraintKey::invalidParents);
    }
}
