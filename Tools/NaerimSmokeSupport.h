#pragma once

#include "Naerim/Public/DragPayload.h"

#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace Naerim::Smoke
{
    using TestList = std::vector<std::pair<const char*, std::function<juce::Result()>>>;

    inline int runTests(const TestList& tests, const char* banner)
    {
        for (const auto& [name, run] : tests)
        {
            const auto result = run();
            if (result.failed())
            {
                std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
                return 1;
            }

            std::cout << "[PASS] " << name << std::endl;
        }

        std::cout << banner << std::endl;
        return 0;
    }

    inline bool nearlyEqual(double lhs, double rhs, double epsilon = 1.0e-4)
    {
        return std::fabs(lhs - rhs) <= epsilon;
    }

    inline bool sameRect(const juce::Rectangle<float>& lhs, const juce::Rectangle<float>& rhs)
    {
        return nearlyEqual(lhs.getX(), rhs.getX())
            && nearlyEqual(lhs.getY(), rhs.getY())
            && nearlyEqual(lhs.getWidth(), rhs.getWidth())
            && nearlyEqual(lhs.getHeight(), rhs.getHeight());
    }

    inline juce::String joinIds(const std::vector<ZoneId>& ids)
    {
        juce::StringArray tokens;
        for (const auto& id : ids)
            tokens.add(id);
        return "[" + tokens.joinIntoString(",") + "]";
    }

    inline bool idsEqual(const std::vector<ZoneId>& actual, std::initializer_list<const char*> expected)
    {
        if (actual.size() != expected.size())
            return false;

        size_t i = 0;
        for (const auto* id : expected)
        {
            if (actual[i++] != id)
                return false;
        }

        return true;
    }

    inline std::optional<DragPayload> makePayload(const juce::String& type,
                                                  const juce::String& id = "component-1",
                                                  const juce::String& name = "Primary Button",
                                                  const juce::String& category = "basic",
                                                  PropertyBag properties = {},
                                                  const juce::String& sourceId = "library")
    {
        DragPayloadFields fields;
        fields.id = id;
        fields.type = type;
        fields.name = name;
        fields.category = category;
        fields.properties = std::move(properties);
        fields.sourceId = sourceId;

        std::optional<DragPayload> payload;
        if (DragPayload::create(std::move(fields), payload).failed())
            return std::nullopt;
        return payload;
    }

    inline juce::var makeObject(std::initializer_list<std::pair<const char*, juce::var>> entries)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        for (const auto& [key, value] : entries)
            object->setProperty(key, value);
        return juce::var(object.release());
    }

    class CapturingLogger : public juce::Logger
    {
    public:
        CapturingLogger()
        {
            juce::Logger::setCurrentLogger(this);
        }

        ~CapturingLogger() override
        {
            juce::Logger::setCurrentLogger(nullptr);
        }

        void logMessage(const juce::String& message) override
        {
            const juce::ScopedLock sl(lock);
            lines.add(message);
        }

        int countContaining(const juce::String& fragment) const
        {
            const juce::ScopedLock sl(lock);
            int count = 0;
            for (const auto& line : lines)
            {
                if (line.contains(fragment))
                    ++count;
            }

            return count;
        }

        juce::StringArray snapshot() const
        {
            const juce::ScopedLock sl(lock);
            return lines;
        }

    private:
        juce::CriticalSection lock;
        juce::StringArray lines;
    };
}
