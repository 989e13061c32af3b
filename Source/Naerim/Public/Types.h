#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <vector>

namespace Naerim
{
    using ZoneId = juce::String;
    using PropertyBag = juce::NamedValueSet;
    using AcceptSet = std::set<juce::String>;

    inline const juce::String kWildcardType { "*" };

    enum class DropZoneKind
    {
        canvas,
        container,
        slot,
        gridCell,
        listItem
    };

    inline juce::String dropZoneKindToKey(DropZoneKind kind)
    {
        switch (kind)
        {
            case DropZoneKind::canvas: return "canvas";
            case DropZoneKind::container: return "container";
            case DropZoneKind::slot: return "slot";
            case DropZoneKind::gridCell: return "grid_cell";
            case DropZoneKind::listItem: return "list_item";
        }

        return "canvas";
    }

    inline std::optional<DropZoneKind> dropZoneKindFromKey(const juce::String& value)
    {
        const auto normalized = value.trim().toLowerCase();
        if (normalized == "canvas") return DropZoneKind::canvas;
        if (normalized == "container") return DropZoneKind::container;
        if (normalized == "slot") return DropZoneKind::slot;
        if (normalized == "grid_cell") return DropZoneKind::gridCell;
        if (normalized == "list_item") return DropZoneKind::listItem;
        return std::nullopt;
    }

    struct ZoneConstraints
    {
        DropZoneKind kind = DropZoneKind::canvas;
        std::optional<int> maxChildren;
        int childCount = 0;
        std::optional<juce::String> requiredType;
        bool exclusive = true;
        bool occupied = false;
        std::optional<float> availableWidth;
        std::optional<float> availableHeight;
    };

    // Partial update. Unset fields keep their current value; the clear flags reset
    // an optional limit back to "unbounded".
    struct ZoneConstraintsPatch
    {
        std::optional<DropZoneKind> kind;
        std::optional<int> maxChildren;
        bool clearMaxChildren = false;
        std::optional<int> childCount;
        std::optional<juce::String> requiredType;
        bool clearRequiredType = false;
        std::optional<bool> exclusive;
        std::optional<bool> occupied;
        std::optional<float> availableWidth;
        std::optional<float> availableHeight;

        bool isEmpty() const noexcept
        {
            return !kind.has_value() && !maxChildren.has_value() && !clearMaxChildren
                && !childCount.has_value() && !requiredType.has_value() && !clearRequiredType
                && !exclusive.has_value() && !occupied.has_value()
                && !availableWidth.has_value() && !availableHeight.has_value();
        }
    };

    inline void applyConstraintsPatch(ZoneConstraints& constraints, const ZoneConstraintsPatch& patch)
    {
        if (patch.kind.has_value())
            constraints.kind = *patch.kind;

        if (patch.clearMaxChildren)
            constraints.maxChildren.reset();
        else if (patch.maxChildren.has_value())
            constraints.maxChildren = std::max(0, *patch.maxChildren);

        if (patch.childCount.has_value())
            constraints.childCount = std::max(0, *patch.childCount);

        if (patch.clearRequiredType)
            constraints.requiredType.reset();
        else if (patch.requiredType.has_value())
            constraints.requiredType = patch.requiredType->trim();

        if (patch.exclusive.has_value())
            constraints.exclusive = *patch.exclusive;
        if (patch.occupied.has_value())
            constraints.occupied = *patch.occupied;
        if (patch.availableWidth.has_value())
            constraints.availableWidth = patch.availableWidth;
        if (patch.availableHeight.has_value())
            constraints.availableHeight = patch.availableHeight;
    }

    struct DropZone
    {
        ZoneId id;
        juce::Rectangle<float> bounds;
        int depth = 0;
        std::optional<ZoneId> parentId;
        AcceptSet accepts;
        ZoneConstraints constraints;

        float area() const noexcept
        {
            return bounds.getWidth() * bounds.getHeight();
        }

        juce::Point<float> centre() const noexcept
        {
            return bounds.getCentre();
        }
    };

    inline bool isFiniteBounds(const juce::Rectangle<float>& bounds) noexcept
    {
        return std::isfinite(bounds.getX())
            && std::isfinite(bounds.getY())
            && std::isfinite(bounds.getWidth())
            && std::isfinite(bounds.getHeight());
    }

    inline bool isPositiveBounds(const juce::Rectangle<float>& bounds) noexcept
    {
        return isFiniteBounds(bounds) && bounds.getWidth() > 0.0f && bounds.getHeight() > 0.0f;
    }

    // Edges count as inside, so a pointer resting on a zone border still hits it.
    inline bool containsInclusive(const juce::Rectangle<float>& bounds, float x, float y) noexcept
    {
        return bounds.getX() <= x && x <= bounds.getRight()
            && bounds.getY() <= y && y <= bounds.getBottom();
    }

    inline bool intersectsStrict(const juce::Rectangle<float>& lhs, const juce::Rectangle<float>& rhs) noexcept
    {
        return lhs.getX() < rhs.getRight()
            && lhs.getRight() > rhs.getX()
            && lhs.getY() < rhs.getBottom()
            && lhs.getBottom() > rhs.getY();
    }

    inline bool containsRect(const juce::Rectangle<float>& outer, const juce::Rectangle<float>& inner) noexcept
    {
        return outer.getX() <= inner.getX()
            && outer.getRight() >= inner.getRight()
            && outer.getY() <= inner.getY()
            && outer.getBottom() >= inner.getBottom();
    }

    // An empty accept set or the wildcard accepts every type; an empty type is not filtered.
    inline bool acceptsType(const AcceptSet& accepts, const juce::String& type)
    {
        if (type.isEmpty() || accepts.empty())
            return true;

        return accepts.count(kWildcardType) > 0 || accepts.count(type) > 0;
    }

    inline juce::String acceptSetToString(const AcceptSet& accepts)
    {
        juce::StringArray tokens;
        for (const auto& type : accepts)
            tokens.add(type);
        return "{" + tokens.joinIntoString(",") + "}";
    }

    inline bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    inline bool varDeepEquals(const juce::var& lhs, const juce::var& rhs)
    {
        if (const auto* lhsObject = lhs.getDynamicObject())
        {
            const auto* rhsObject = rhs.getDynamicObject();
            if (rhsObject == nullptr)
                return false;

            const auto& lhsProps = lhsObject->getProperties();
            const auto& rhsProps = rhsObject->getProperties();
            if (lhsProps.size() != rhsProps.size())
                return false;

            for (int i = 0; i < lhsProps.size(); ++i)
            {
                const auto name = lhsProps.getName(i);
                if (!rhsProps.contains(name))
                    return false;
                if (!varDeepEquals(lhsProps.getValueAt(i), rhsProps[name]))
                    return false;
            }

            return true;
        }

        if (const auto* lhsArray = lhs.getArray())
        {
            const auto* rhsArray = rhs.getArray();
            if (rhsArray == nullptr || lhsArray->size() != rhsArray->size())
                return false;

            for (int i = 0; i < lhsArray->size(); ++i)
            {
                if (!varDeepEquals(lhsArray->getReference(i), rhsArray->getReference(i)))
                    return false;
            }

            return true;
        }

        if (rhs.getDynamicObject() != nullptr || rhs.isArray())
            return false;

        return lhs == rhs;
    }

    inline bool propertyBagDeepEquals(const PropertyBag& lhs, const PropertyBag& rhs)
    {
        if (lhs.size() != rhs.size())
            return false;

        for (int i = 0; i < lhs.size(); ++i)
        {
            const auto name = lhs.getName(i);
            if (!rhs.contains(name))
                return false;
            if (!varDeepEquals(lhs.getValueAt(i), rhs[name]))
                return false;
        }

        return true;
    }

    enum class DragState
    {
        idle,
        dragging,
        hovering,
        cancelled
    };

    inline juce::String dragStateToString(DragState state)
    {
        switch (state)
        {
            case DragState::idle: return "idle";
            case DragState::dragging: return "dragging";
            case DragState::hovering: return "hovering";
            case DragState::cancelled: return "cancelled";
        }

        return "unknown";
    }

    enum class FeedbackState
    {
        valid,
        invalid,
        hover
    };

    inline juce::String feedbackStateToString(FeedbackState state)
    {
        switch (state)
        {
            case FeedbackState::valid: return "valid";
            case FeedbackState::invalid: return "invalid";
            case FeedbackState::hover: return "hover";
        }

        return "unknown";
    }

    enum class InsertionOrientation
    {
        point,
        horizontal,
        vertical,
        child
    };

    struct InsertionPoint
    {
        juce::Point<float> position;
        InsertionOrientation orientation = InsertionOrientation::point;
    };

    struct ValidationResult
    {
        bool isValid = false;
        juce::String reason;
        juce::String suggestedAction;
        juce::StringArray violatedConstraints;

        static ValidationResult accepted()
        {
            ValidationResult result;
            result.isValid = true;
            result.reason = "Valid drop target";
            return result;
        }

        static ValidationResult rejected(juce::String reasonIn,
                                         juce::String suggestedActionIn,
                                         const juce::String& violatedConstraint)
        {
            ValidationResult result;
            result.reason = std::move(reasonIn);
            result.suggestedAction = std::move(suggestedActionIn);
            if (violatedConstraint.isNotEmpty())
                result.violatedConstraints.add(violatedConstraint);
            return result;
        }
    };

    struct QueryResult
    {
        std::vector<DropZone> zones;
        double queryTimeMs = 0.0;
        int zonesExamined = 0;
        bool cacheHit = false;

        bool empty() const noexcept
        {
            return zones.empty();
        }

        std::vector<ZoneId> ids() const
        {
            std::vector<ZoneId> result;
            result.reserve(zones.size());
            for (const auto& zone : zones)
                result.push_back(zone.id);
            return result;
        }
    };
}
