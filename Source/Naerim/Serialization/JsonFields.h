#pragma once

#include "Naerim/Public/Types.h"
#include <cmath>
#include <limits>
#include <memory>
#include <optional>

namespace Naerim::Serialization::Fields
{
    inline juce::String describe(const juce::String& context, const juce::Identifier& key)
    {
        return context.isEmpty() ? key.toString() : context + "." + key.toString();
    }

    inline juce::Result requireObject(const juce::var& value, const juce::String& context)
    {
        if (value.getDynamicObject() == nullptr)
            return juce::Result::fail(context + " must be object");
        return juce::Result::ok();
    }

    inline juce::Result parseOptionalInt(const juce::NamedValueSet& props,
                                         const juce::Identifier& key,
                                         std::optional<int>& out,
                                         const juce::String& context)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!isNumericVar(value))
            return juce::Result::fail(describe(context, key) + " must be numeric");

        const auto number = static_cast<double>(value);
        if (!std::isfinite(number) || std::floor(number) != number)
            return juce::Result::fail(describe(context, key) + " must be an integer");

        if (number < static_cast<double>(std::numeric_limits<int>::min())
            || number > static_cast<double>(std::numeric_limits<int>::max()))
            return juce::Result::fail(describe(context, key) + " out of range");

        out = static_cast<int>(number);
        return juce::Result::ok();
    }

    inline juce::Result parseOptionalFloat(const juce::NamedValueSet& props,
                                           const juce::Identifier& key,
                                           std::optional<float>& out,
                                           const juce::String& context)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!isNumericVar(value))
            return juce::Result::fail(describe(context, key) + " must be numeric");

        const auto number = static_cast<double>(value);
        if (!std::isfinite(number))
            return juce::Result::fail(describe(context, key) + " must be finite");

        out = static_cast<float>(number);
        return juce::Result::ok();
    }

    inline juce::Result parseOptionalBool(const juce::NamedValueSet& props,
                                          const juce::Identifier& key,
                                          std::optional<bool>& out,
                                          const juce::String& context)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isBool())
            return juce::Result::fail(describe(context, key) + " must be bool");

        out = static_cast<bool>(value);
        return juce::Result::ok();
    }

    inline juce::Result parseOptionalString(const juce::NamedValueSet& props,
                                            const juce::Identifier& key,
                                            std::optional<juce::String>& out,
                                            const juce::String& context)
    {
        if (!props.contains(key))
            return juce::Result::ok();

        const auto& value = props[key];
        if (!value.isString())
            return juce::Result::fail(describe(context, key) + " must be string");

        out = value.toString();
        return juce::Result::ok();
    }

    inline juce::var serializeBounds(const juce::Rectangle<float>& bounds)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("x", bounds.getX());
        object->setProperty("y", bounds.getY());
        object->setProperty("w", bounds.getWidth());
        object->setProperty("h", bounds.getHeight());
        return juce::var(object.release());
    }

    inline std::optional<juce::Rectangle<float>> parseBounds(const juce::var& value)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return std::nullopt;

        const auto& props = object->getProperties();
        for (const auto* key : { "x", "y", "w", "h" })
        {
            if (!isNumericVar(props[key]))
                return std::nullopt;
        }

        return juce::Rectangle<float>(static_cast<float>(props["x"]),
                                      static_cast<float>(props["y"]),
                                      static_cast<float>(props["w"]),
                                      static_cast<float>(props["h"]));
    }
}
