#include "Naerim/Public/DragPayload.h"

#include <array>

namespace Naerim
{
    namespace
    {
        constexpr std::array<const char*, 13> kKnownTypes {
            "button", "input", "text", "image", "container", "section", "header",
            "footer", "nav", "div", "span", "form", "table"
        };

        constexpr std::array<const char*, 6> kKnownCategories {
            "basic", "layout", "forms", "media", "navigation", "data"
        };

        bool isStrippedCharacter(juce::juce_wchar c) noexcept
        {
            if (c < 0x20 || c == 0x7f)
                return true;

            return c == '<' || c == '>' || c == '"' || c == '\'' || c == '&';
        }

        PropertyBag detachBag(const PropertyBag& source)
        {
            PropertyBag copy;
            for (int i = 0; i < source.size(); ++i)
                copy.set(source.getName(i), source.getValueAt(i).clone());
            return copy;
        }

        juce::Result requireField(const juce::String& value, PayloadField field, PayloadField* failedFieldOut)
        {
            if (value.isNotEmpty())
                return juce::Result::ok();

            if (failedFieldOut != nullptr)
                *failedFieldOut = field;
            return juce::Result::fail("payload." + payloadFieldToKey(field) + " is required");
        }
    }

    juce::String payloadFieldToKey(PayloadField field)
    {
        switch (field)
        {
            case PayloadField::record: return "record";
            case PayloadField::id: return "id";
            case PayloadField::type: return "type";
            case PayloadField::name: return "name";
            case PayloadField::category: return "category";
            case PayloadField::properties: return "properties";
            case PayloadField::metadata: return "metadata";
            case PayloadField::sourceId: return "source_id";
        }

        return "record";
    }

    DragPayload::DragPayload(DragPayloadFields fieldsIn)
        : payloadFields(std::move(fieldsIn))
    {
    }

    juce::Result DragPayload::create(DragPayloadFields fields,
                                     std::optional<DragPayload>& payloadOut,
                                     PayloadField* failedFieldOut)
    {
        payloadOut.reset();

        fields.id = fields.id.trim();
        fields.type = sanitize(fields.type);
        fields.name = sanitize(fields.name);
        fields.category = sanitize(fields.category);
        fields.sourceId = fields.sourceId.trim();

        if (auto result = requireField(fields.id, PayloadField::id, failedFieldOut); result.failed())
            return result;
        if (auto result = requireField(fields.type, PayloadField::type, failedFieldOut); result.failed())
            return result;
        if (auto result = requireField(fields.name, PayloadField::name, failedFieldOut); result.failed())
            return result;
        if (auto result = requireField(fields.category, PayloadField::category, failedFieldOut); result.failed())
            return result;

        if (!isKnownType(fields.type))
            DBG("[Naerim][Payload] unknown component type: " + fields.type);
        if (!isKnownCategory(fields.category))
            DBG("[Naerim][Payload] unknown component category: " + fields.category);

        if (fields.sourceId.isEmpty())
            fields.sourceId = juce::Uuid().toDashedString();

        fields.properties = detachBag(fields.properties);
        fields.metadata = detachBag(fields.metadata);

        payloadOut.emplace(DragPayload(std::move(fields)));
        return juce::Result::ok();
    }

    juce::var DragPayload::constraint(const juce::Identifier& key) const
    {
        const auto constraints = payloadFields.properties["constraints"];
        if (const auto* object = constraints.getDynamicObject())
            return object->getProperty(key);
        return {};
    }

    bool DragPayload::operator==(const DragPayload& other) const
    {
        return payloadFields.id == other.payloadFields.id
            && payloadFields.type == other.payloadFields.type
            && payloadFields.name == other.payloadFields.name
            && payloadFields.category == other.payloadFields.category
            && payloadFields.sourceId == other.payloadFields.sourceId
            && propertyBagDeepEquals(payloadFields.properties, other.payloadFields.properties)
            && propertyBagDeepEquals(payloadFields.metadata, other.payloadFields.metadata);
    }

    juce::String DragPayload::sanitize(const juce::String& text)
    {
        juce::String stripped;
        stripped.preallocateBytes(text.getNumBytesAsUTF8());

        for (auto p = text.getCharPointer(); !p.isEmpty();)
        {
            const auto c = p.getAndAdvance();
            if (!isStrippedCharacter(c))
                stripped += juce::String::charToString(c);
        }

        // Trim again after truncation so a second pass is a no-op.
        return stripped.trim().substring(0, kMaxTextLength).trim();
    }

    bool DragPayload::isKnownType(const juce::String& type)
    {
        return std::any_of(kKnownTypes.begin(),
                           kKnownTypes.end(),
                           [&type](const char* known)
                           {
                               return type == known;
                           });
    }

    bool DragPayload::isKnownCategory(const juce::String& category)
    {
        return std::any_of(kKnownCategories.begin(),
                           kKnownCategories.end(),
                           [&category](const char* known)
                           {
                               return category == known;
                           });
    }
}
