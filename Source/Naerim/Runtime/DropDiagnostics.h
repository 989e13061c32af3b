#pragma once

#include "Naerim/Public/EngineConfig.h"
#include "Naerim/Public/Types.h"
#include <atomic>
#include <cstdint>

namespace Naerim::Runtime
{
    // Levelled logging through juce::Logger. One instance is shared by the
    // components of an engine; it is safe to call from any thread.
    class DropDiagnostics
    {
    public:
        DropDiagnostics() = default;
        explicit DropDiagnostics(DiagnosticsSettings settingsIn);

        void setSettings(DiagnosticsSettings nextSettings);
        [[nodiscard]] DiagnosticsSettings settings() const;
        void resetSession() noexcept;

        [[nodiscard]] bool isEnabled(LogLevel level) const;
        void log(LogLevel level, const juce::String& tag, const juce::String& message) const;

        void error(const juce::String& tag, const juce::String& message) const { log(LogLevel::error, tag, message); }
        void warning(const juce::String& tag, const juce::String& message) const { log(LogLevel::warning, tag, message); }
        void info(const juce::String& tag, const juce::String& message) const { log(LogLevel::info, tag, message); }
        void debug(const juce::String& tag, const juce::String& message) const { log(LogLevel::debug, tag, message); }

        // Pointer-move queries arrive every frame; only every Nth one is logged.
        [[nodiscard]] bool shouldLogQuery() noexcept;
        [[nodiscard]] static juce::String formatQuerySummary(const juce::String& queryKind,
                                                             const juce::String& signature,
                                                             const QueryResult& result);

        [[nodiscard]] static juce::String formatLine(LogLevel level, const juce::String& tag, const juce::String& message);

    private:
        mutable juce::CriticalSection lock;
        DiagnosticsSettings diagnosticsSettings {};
        std::atomic<std::uint64_t> queryCounter { 0 };
    };
}
