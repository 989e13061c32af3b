#pragma once

#include <juce_core/juce_core.h>
#include <map>
#include <vector>

namespace Naerim::Ui::Interaction
{
    class DragSession;

    // Tracks the session owned by each draggable element. An element may hold
    // at most one live (dragging, hovering or cancelled) session. A destroyed
    // session drops out of the registry on its own.
    class ActiveDragRegistry
    {
    public:
        ActiveDragRegistry() = default;
        ~ActiveDragRegistry();

        ActiveDragRegistry(const ActiveDragRegistry&) = delete;
        ActiveDragRegistry& operator=(const ActiveDragRegistry&) = delete;

        bool registerSession(const juce::String& elementId, DragSession& session);
        bool unregisterSession(const juce::String& elementId);

        [[nodiscard]] DragSession* find(const juce::String& elementId) const;
        [[nodiscard]] std::vector<DragSession*> activeSessions() const;
        [[nodiscard]] int size() const;

        // Cancels every active session; returns how many were cancelled.
        int cancelAll();

    private:
        struct Entry
        {
            DragSession* session = nullptr;
            int observerId = 0;
        };

        void forgetDestroyed(const juce::String& elementId, DragSession& session);

        mutable juce::CriticalSection lock;
        std::map<juce::String, Entry> sessionsByElement;
    };
}
