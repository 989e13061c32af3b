#pragma once

#include <juce_core/juce_core.h>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace Naerim::Runtime
{
    struct Announcement
    {
        juce::String source;
        juce::String message;
        double timestampMs = 0.0;
    };

    class AccessibilityAnnouncer
    {
    public:
        using Listener = std::function<void(const Announcement&)>;

        explicit AccessibilityAnnouncer(int historyLimitIn = 64);

        void setListener(Listener listenerIn);
        void announce(const juce::String& source, const juce::String& message);

        [[nodiscard]] std::vector<Announcement> recent(int maxCount) const;
        [[nodiscard]] std::optional<Announcement> latest() const;
        [[nodiscard]] int totalCount() const;
        [[nodiscard]] int historyLimit() const noexcept { return limit; }
        void clearHistory();

    private:
        mutable juce::CriticalSection lock;
        Listener listener;
        std::deque<Announcement> history;
        int limit = 64;
        int announcedCount = 0;
    };
}
