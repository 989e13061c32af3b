#include "Naerim/Runtime/DropDiagnostics.h"

#include <algorithm>

namespace Naerim::Runtime
{
    namespace
    {
        juce::String levelToText(LogLevel level)
        {
            switch (level)
            {
                case LogLevel::off: return "off";
                case LogLevel::error: return "error";
                case LogLevel::warning: return "warn";
                case LogLevel::info: return "info";
                case LogLevel::debug: return "debug";
            }

            return "unknown";
        }

        DiagnosticsSettings normalized(DiagnosticsSettings settings) noexcept
        {
            settings.queryLogStride = std::max(1, settings.queryLogStride);
            return settings;
        }
    }

    DropDiagnostics::DropDiagnostics(DiagnosticsSettings settingsIn)
        : diagnosticsSettings(normalized(settingsIn))
    {
    }

    void DropDiagnostics::setSettings(DiagnosticsSettings nextSettings)
    {
        const juce::ScopedLock sl(lock);
        diagnosticsSettings = normalized(nextSettings);
    }

    DiagnosticsSettings DropDiagnostics::settings() const
    {
        const juce::ScopedLock sl(lock);
        return diagnosticsSettings;
    }

    void DropDiagnostics::resetSession() noexcept
    {
        queryCounter.store(0);
    }

    bool DropDiagnostics::isEnabled(LogLevel level) const
    {
        if (level == LogLevel::off)
            return false;

        const juce::ScopedLock sl(lock);
        return static_cast<int>(level) <= static_cast<int>(diagnosticsSettings.logLevel);
    }

    void DropDiagnostics::log(LogLevel level, const juce::String& tag, const juce::String& message) const
    {
        if (!isEnabled(level))
            return;

        juce::Logger::writeToLog(formatLine(level, tag, message));
    }

    bool DropDiagnostics::shouldLogQuery() noexcept
    {
        if (!isEnabled(LogLevel::debug))
            return false;

        const auto stride = static_cast<std::uint64_t>(settings().queryLogStride);
        const auto count = queryCounter.fetch_add(1) + 1;
        return (count % stride) == 0;
    }

    juce::String DropDiagnostics::formatQuerySummary(const juce::String& queryKind,
                                                     const juce::String& signature,
                                                     const QueryResult& result)
    {
        auto text = "query=" + queryKind
                  + " key=" + signature
                  + " hits=" + juce::String(static_cast<int>(result.zones.size()))
                  + " examined=" + juce::String(result.zonesExamined)
                  + " cached=" + juce::String(result.cacheHit ? 1 : 0)
                  + " ms=" + juce::String(result.queryTimeMs, 3);

        if (!result.zones.empty())
            text += " top=" + result.zones.front().id;

        return text;
    }

    juce::String DropDiagnostics::formatLine(LogLevel level, const juce::String& tag, const juce::String& message)
    {
        return "[Naerim][" + tag + "] " + levelToText(level) + ": " + message;
    }
}
