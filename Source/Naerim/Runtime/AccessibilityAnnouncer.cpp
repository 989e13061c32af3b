#include "Naerim/Runtime/AccessibilityAnnouncer.h"

#include <algorithm>

namespace Naerim::Runtime
{
    AccessibilityAnnouncer::AccessibilityAnnouncer(int historyLimitIn)
        : limit(std::max(1, historyLimitIn))
    {
    }

    void AccessibilityAnnouncer::setListener(Listener listenerIn)
    {
        const juce::ScopedLock sl(lock);
        listener = std::move(listenerIn);
    }

    void AccessibilityAnnouncer::announce(const juce::String& source, const juce::String& message)
    {
        if (message.isEmpty())
            return;

        Announcement announcement;
        announcement.source = source;
        announcement.message = message;
        announcement.timestampMs = juce::Time::getMillisecondCounterHiRes();

        Listener listenerCopy;
        {
            const juce::ScopedLock sl(lock);
            history.push_back(announcement);
            while (static_cast<int>(history.size()) > limit)
                history.pop_front();
            ++announcedCount;
            listenerCopy = listener;
        }

        if (listenerCopy == nullptr)
            return;

        try
        {
            listenerCopy(announcement);
        }
        catch (const std::exception& e)
        {
            juce::Logger::writeToLog("[Naerim][A11y] error: listener threw: " + juce::String(e.what()));
        }
        catch (...)
        {
            juce::Logger::writeToLog("[Naerim][A11y] error: listener threw a non-standard exception");
        }
    }

    std::vector<Announcement> AccessibilityAnnouncer::recent(int maxCount) const
    {
        const juce::ScopedLock sl(lock);
        const auto count = std::min(std::max(0, maxCount), static_cast<int>(history.size()));
        return std::vector<Announcement>(history.end() - count, history.end());
    }

    std::optional<Announcement> AccessibilityAnnouncer::latest() const
    {
        const juce::ScopedLock sl(lock);
        if (history.empty())
            return std::nullopt;
        return history.back();
    }

    int AccessibilityAnnouncer::totalCount() const
    {
        const juce::ScopedLock sl(lock);
        return announcedCount;
    }

    void AccessibilityAnnouncer::clearHistory()
    {
        const juce::ScopedLock sl(lock);
        history.clear();
    }
}
