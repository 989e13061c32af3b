#include "Naerim/Serialization/PayloadJson.h"

#include <memory>

namespace Naerim::Serialization
{
    namespace
    {
        juce::var serializeBag(const PropertyBag& bag)
        {
            auto object = std::make_unique<juce::DynamicObject>();
            for (int i = 0; i < bag.size(); ++i)
                object->setProperty(bag.getName(i), bag.getValueAt(i));
            return juce::var(object.release());
        }

        juce::Result fail(PayloadField field, PayloadField* failedFieldOut, const juce::String& message)
        {
            if (failedFieldOut != nullptr)
                *failedFieldOut = field;
            return juce::Result::fail(message);
        }

        juce::Result parseRequiredText(const juce::NamedValueSet& props,
                                       PayloadField field,
                                       juce::String& out,
                                       PayloadField* failedFieldOut)
        {
            const auto key = payloadFieldToKey(field);
            if (!props.contains(key))
                return fail(field, failedFieldOut, "payload." + key + " is required");

            const auto& value = props[key];
            if (!value.isString())
                return fail(field, failedFieldOut, "payload." + key + " must be string");

            out = value.toString();
            return juce::Result::ok();
        }

        juce::Result parseBag(const juce::NamedValueSet& props,
                              PayloadField field,
                              PropertyBag& out,
                              PayloadField* failedFieldOut)
        {
            const auto key = payloadFieldToKey(field);
            if (!props.contains(key) || props[key].isVoid())
                return juce::Result::ok();

            const auto* object = props[key].getDynamicObject();
            if (object == nullptr)
                return fail(field, failedFieldOut, "payload." + key + " must be object");

            out = object->getProperties();
            return juce::Result::ok();
        }
    }

    juce::var payloadToVar(const DragPayload& payload)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", payload.id());
        object->setProperty("type", payload.type());
        object->setProperty("name", payload.name());
        object->setProperty("category", payload.category());
        object->setProperty("properties", serializeBag(payload.properties()));
        object->setProperty("metadata", serializeBag(payload.metadata()));
        object->setProperty("source_id", payload.sourceId());
        return juce::var(object.release());
    }

    juce::String payloadToJsonString(const DragPayload& payload)
    {
        return juce::JSON::toString(payloadToVar(payload), true);
    }

    juce::Result payloadFromVar(const juce::var& record,
                                std::optional<DragPayload>& payloadOut,
                                PayloadField* failedFieldOut)
    {
        payloadOut.reset();

        const auto* object = record.getDynamicObject();
        if (object == nullptr)
            return fail(PayloadField::record, failedFieldOut, "payload record must be object");

        const auto& props = object->getProperties();
        DragPayloadFields fields;

        if (auto result = parseRequiredText(props, PayloadField::id, fields.id, failedFieldOut); result.failed())
            return result;
        if (auto result = parseRequiredText(props, PayloadField::type, fields.type, failedFieldOut); result.failed())
            return result;
        if (auto result = parseRequiredText(props, PayloadField::name, fields.name, failedFieldOut); result.failed())
            return result;
        if (auto result = parseRequiredText(props, PayloadField::category, fields.category, failedFieldOut); result.failed())
            return result;
        if (auto result = parseBag(props, PayloadField::properties, fields.properties, failedFieldOut); result.failed())
            return result;
        if (auto result = parseBag(props, PayloadField::metadata, fields.metadata, failedFieldOut); result.failed())
            return result;

        const auto sourceKey = payloadFieldToKey(PayloadField::sourceId);
        if (props.contains(sourceKey) && !props[sourceKey].isVoid())
        {
            if (!props[sourceKey].isString())
                return fail(PayloadField::sourceId, failedFieldOut, "payload.source_id must be string");
            fields.sourceId = props[sourceKey].toString();
        }

        return DragPayload::create(std::move(fields), payloadOut, failedFieldOut);
    }

    juce::Result payloadFromJsonString(const juce::String& json,
                                       std::optional<DragPayload>& payloadOut,
                                       PayloadField* failedFieldOut)
    {
        payloadOut.reset();

        juce::var parsed;
        const auto parseResult = juce::JSON::parse(json, parsed);
        if (parseResult.failed())
            return fail(PayloadField::record, failedFieldOut, "payload JSON parse failed: " + parseResult.getErrorMessage());

        return payloadFromVar(parsed, payloadOut, failedFieldOut);
    }
}
