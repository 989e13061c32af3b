#include "Naerim/Editor/Interaction/ActiveDragRegistry.h"

#include "Naerim/Editor/Interaction/DragSession.h"

namespace Naerim::Ui::Interaction
{
    namespace
    {
        bool isLive(const DragSession& session)
        {
            return session.getState() != DragState::idle;
        }
    }

    ActiveDragRegistry::~ActiveDragRegistry()
    {
        const juce::ScopedLock sl(lock);
        for (const auto& entry : sessionsByElement)
            entry.second.session->removeObserver(entry.second.observerId);
        sessionsByElement.clear();
    }

    bool ActiveDragRegistry::registerSession(const juce::String& elementId, DragSession& session)
    {
        if (elementId.isEmpty())
            return false;

        const juce::ScopedLock sl(lock);
        if (const auto it = sessionsByElement.find(elementId); it != sessionsByElement.end())
        {
            if (it->second.session == &session)
                return true;
            if (isLive(*it->second.session))
            {
                DBG("[Naerim][Registry] element " + elementId + " already has a live drag session");
                return false;
            }

            it->second.session->removeObserver(it->second.observerId);
        }

        DragSessionObserver observer;
        observer.onDestroyed = [this, elementId](DragSession& destroyed) { forgetDestroyed(elementId, destroyed); };

        Entry entry;
        entry.session = &session;
        entry.observerId = session.addObserver(std::move(observer));
        sessionsByElement[elementId] = entry;
        return true;
    }

    bool ActiveDragRegistry::unregisterSession(const juce::String& elementId)
    {
        const juce::ScopedLock sl(lock);
        const auto it = sessionsByElement.find(elementId);
        if (it == sessionsByElement.end())
            return false;

        it->second.session->removeObserver(it->second.observerId);
        sessionsByElement.erase(it);
        return true;
    }

    DragSession* ActiveDragRegistry::find(const juce::String& elementId) const
    {
        const juce::ScopedLock sl(lock);
        const auto it = sessionsByElement.find(elementId);
        return it == sessionsByElement.end() ? nullptr : it->second.session;
    }

    std::vector<DragSession*> ActiveDragRegistry::activeSessions() const
    {
        const juce::ScopedLock sl(lock);
        std::vector<DragSession*> sessions;
        for (const auto& entry : sessionsByElement)
        {
            if (entry.second.session->isActive())
                sessions.push_back(entry.second.session);
        }

        return sessions;
    }

    int ActiveDragRegistry::size() const
    {
        const juce::ScopedLock sl(lock);
        return static_cast<int>(sessionsByElement.size());
    }

    int ActiveDragRegistry::cancelAll()
    {
        int cancelled = 0;
        for (auto* session : activeSessions())
        {
            if (session->cancel())
                ++cancelled;
        }

        return cancelled;
    }

    void ActiveDragRegistry::forgetDestroyed(const juce::String& elementId, DragSession& session)
    {
        const juce::ScopedLock sl(lock);
        const auto it = sessionsByElement.find(elementId);
        if (it != sessionsByElement.end() && it->second.session == &session)
            sessionsByElement.erase(it);
    }
}
