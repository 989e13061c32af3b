#pragma once

#include "Naerim/Public/Types.h"
#include <optional>

namespace Naerim
{
    enum class PayloadField
    {
        record,
        id,
        type,
        name,
        category,
        properties,
        metadata,
        sourceId
    };

    juce::String payloadFieldToKey(PayloadField field);

    struct DragPayloadFields
    {
        juce::String id;
        juce::String type;
        juce::String name;
        juce::String category;
        PropertyBag properties;
        PropertyBag metadata;
        juce::String sourceId;
    };

    // Immutable description of the component being dragged. Instances only come
    // out of create(), so a payload that exists has passed validation.
    class DragPayload
    {
    public:
        static constexpr int kMaxTextLength = 100;

        static juce::Result create(DragPayloadFields fields,
                                   std::optional<DragPayload>& payloadOut,
                                   PayloadField* failedFieldOut = nullptr);

        const juce::String& id() const noexcept { return payloadFields.id; }
        const juce::String& type() const noexcept { return payloadFields.type; }
        const juce::String& name() const noexcept { return payloadFields.name; }
        const juce::String& category() const noexcept { return payloadFields.category; }
        const PropertyBag& properties() const noexcept { return payloadFields.properties; }
        const PropertyBag& metadata() const noexcept { return payloadFields.metadata; }
        const juce::String& sourceId() const noexcept { return payloadFields.sourceId; }
        const DragPayloadFields& fields() const noexcept { return payloadFields; }

        // Entry of the "constraints" object in properties, void when absent.
        juce::var constraint(const juce::Identifier& key) const;

        bool operator==(const DragPayload& other) const;
        bool operator!=(const DragPayload& other) const { return !(*this == other); }

        static juce::String sanitize(const juce::String& text);
        static bool isKnownType(const juce::String& type);
        static bool isKnownCategory(const juce::String& category);

    private:
        explicit DragPayload(DragPayloadFields fieldsIn);

        DragPayloadFields payloadFields;
    };
}
