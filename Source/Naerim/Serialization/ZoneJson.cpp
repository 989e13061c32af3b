#include "Naerim/Serialization/ZoneJson.h"

#include "Naerim/Serialization/JsonFields.h"
#include <memory>

namespace Naerim::Serialization
{
    namespace
    {
        juce::Result parseAccepts(const juce::var& value, AcceptSet& out, const juce::String& context)
        {
            const auto* array = value.getArray();
            if (array == nullptr)
                return juce::Result::fail(context + " must be array");

            AcceptSet accepts;
            for (const auto& item : *array)
            {
                if (!item.isString())
                    return juce::Result::fail(context + " entries must be strings");

                const auto type = item.toString().trim();
                if (type.isNotEmpty())
                    accepts.insert(type);
            }

            out = std::move(accepts);
            return juce::Result::ok();
        }

        juce::var serializeAccepts(const AcceptSet& accepts)
        {
            juce::Array<juce::var> items;
            for (const auto& type : accepts)
                items.add(type);
            return juce::var(items);
        }
    }

    juce::Result constraintsPatchFromVar(const juce::var& record, ZoneConstraintsPatch& patchOut)
    {
        if (auto result = Fields::requireObject(record, "constraints"); result.failed())
            return result;

        const auto& props = record.getDynamicObject()->getProperties();
        ZoneConstraintsPatch patch;

        if (props.contains("kind"))
        {
            const auto kind = dropZoneKindFromKey(props["kind"].toString());
            if (!props["kind"].isString() || !kind.has_value())
                return juce::Result::fail("constraints.kind is invalid");
            patch.kind = kind;
        }

        if (props.contains("max_children") && props["max_children"].isVoid())
            patch.clearMaxChildren = true;
        else if (auto result = Fields::parseOptionalInt(props, "max_children", patch.maxChildren, "constraints"); result.failed())
            return result;

        if (auto result = Fields::parseOptionalInt(props, "child_count", patch.childCount, "constraints"); result.failed())
            return result;

        if (props.contains("required_type") && props["required_type"].isVoid())
            patch.clearRequiredType = true;
        else if (auto result = Fields::parseOptionalString(props, "required_type", patch.requiredType, "constraints"); result.failed())
            return result;

        if (auto result = Fields::parseOptionalBool(props, "exclusive", patch.exclusive, "constraints"); result.failed())
            return result;
        if (auto result = Fields::parseOptionalBool(props, "occupied", patch.occupied, "constraints"); result.failed())
            return result;
        if (auto result = Fields::parseOptionalFloat(props, "available_width", patch.availableWidth, "constraints"); result.failed())
            return result;
        if (auto result = Fields::parseOptionalFloat(props, "available_height", patch.availableHeight, "constraints"); result.failed())
            return result;

        if (patch.maxChildren.has_value() && *patch.maxChildren < 0)
            return juce::Result::fail("constraints.max_children must be >= 0");
        if (patch.childCount.has_value() && *patch.childCount < 0)
            return juce::Result::fail("constraints.child_count must be >= 0");

        patchOut = std::move(patch);
        return juce::Result::ok();
    }

    juce::Result constraintsPatchFromJsonString(const juce::String& json, ZoneConstraintsPatch& patchOut)
    {
        juce::var parsed;
        const auto parseResult = juce::JSON::parse(json, parsed);
        if (parseResult.failed())
            return juce::Result::fail("constraints JSON parse failed: " + parseResult.getErrorMessage());

        return constraintsPatchFromVar(parsed, patchOut);
    }

    juce::var constraintsToVar(const ZoneConstraints& constraints)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("kind", dropZoneKindToKey(constraints.kind));
        object->setProperty("max_children", constraints.maxChildren.has_value() ? juce::var(*constraints.maxChildren) : juce::var());
        object->setProperty("child_count", constraints.childCount);
        object->setProperty("required_type", constraints.requiredType.has_value() ? juce::var(*constraints.requiredType) : juce::var());
        object->setProperty("exclusive", constraints.exclusive);
        object->setProperty("occupied", constraints.occupied);
        if (constraints.availableWidth.has_value())
            object->setProperty("available_width", *constraints.availableWidth);
        if (constraints.availableHeight.has_value())
            object->setProperty("available_height", *constraints.availableHeight);
        return juce::var(object.release());
    }

    juce::var zoneToVar(const DropZone& zone)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", zone.id);
        object->setProperty("bounds", Fields::serializeBounds(zone.bounds));
        object->setProperty("depth", zone.depth);
        if (zone.parentId.has_value())
            object->setProperty("parent_id", *zone.parentId);
        object->setProperty("accepts", serializeAccepts(zone.accepts));
        object->setProperty("constraints", constraintsToVar(zone.constraints));
        return juce::var(object.release());
    }

    juce::Result zoneFromVar(const juce::var& record, DropZone& zoneOut)
    {
        if (auto result = Fields::requireObject(record, "zone"); result.failed())
            return result;

        const auto& props = record.getDynamicObject()->getProperties();
        if (!props.contains("id") || !props.contains("bounds"))
            return juce::Result::fail("zone requires id and bounds");
        if (!props["id"].isString() || props["id"].toString().trim().isEmpty())
            return juce::Result::fail("zone.id must be non-empty string");

        DropZone zone;
        zone.id = props["id"].toString().trim();

        const auto bounds = Fields::parseBounds(props["bounds"]);
        if (!bounds.has_value())
            return juce::Result::fail("zone.bounds is invalid");
        zone.bounds = *bounds;

        std::optional<int> depth;
        if (auto result = Fields::parseOptionalInt(props, "depth", depth, "zone"); result.failed())
            return result;
        zone.depth = depth.value_or(0);

        std::optional<juce::String> parentId;
        if (auto result = Fields::parseOptionalString(props, "parent_id", parentId, "zone"); result.failed())
            return result;
        if (parentId.has_value() && parentId->trim().isNotEmpty())
            zone.parentId = parentId->trim();

        if (props.contains("accepts"))
        {
            if (auto result = parseAccepts(props["accepts"], zone.accepts, "zone.accepts"); result.failed())
                return result;
        }

        if (props.contains("constraints"))
        {
            ZoneConstraintsPatch patch;
            if (auto result = constraintsPatchFromVar(props["constraints"], patch); result.failed())
                return juce::Result::fail("zone." + result.getErrorMessage());
            applyConstraintsPatch(zone.constraints, patch);
        }

        zoneOut = std::move(zone);
        return juce::Result::ok();
    }

    juce::Result zonesFromJsonString(const juce::String& json, std::vector<DropZone>& zonesOut)
    {
        juce::var parsed;
        const auto parseResult = juce::JSON::parse(json, parsed);
        if (parseResult.failed())
            return juce::Result::fail("zone layout JSON parse failed: " + parseResult.getErrorMessage());

        if (auto result = Fields::requireObject(parsed, "zone layout"); result.failed())
            return result;

        const auto* array = parsed.getDynamicObject()->getProperties()["zones"].getArray();
        if (array == nullptr)
            return juce::Result::fail("zone layout.zones must be array");

        std::vector<DropZone> zones;
        zones.reserve(static_cast<size_t>(array->size()));
        for (const auto& item : *array)
        {
            DropZone zone;
            if (auto result = zoneFromVar(item, zone); result.failed())
                return result;
            zones.push_back(std::move(zone));
        }

        zonesOut = std::move(zones);
        return juce::Result::ok();
    }
}
