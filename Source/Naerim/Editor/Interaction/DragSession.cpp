#include "Naerim/Editor/Interaction/DragSession.h"

#include "Naerim/Runtime/AccessibilityAnnouncer.h"
#include "Naerim/Runtime/DropDiagnostics.h"
#include <algorithm>

namespace Naerim::Ui::Interaction
{
    namespace
    {
        constexpr auto kSource = "session";

        juce::String describeZone(const std::optional<ZoneId>& zoneId)
        {
            return zoneId.has_value() ? *zoneId : juce::String("none");
        }
    }

    template <typename Callback, typename... Args>
    void DragSession::invokeCallback(const char* name, const Callback& callback, Args&&... args) const
    {
        if (callback == nullptr)
            return;

        try
        {
            callback(std::forward<Args>(args)...);
        }
        catch (const std::exception& e)
        {
            if (diagnostics != nullptr)
                diagnostics->error("Session", juce::String(name) + " callback threw: " + juce::String(e.what()));
            else
                juce::Logger::writeToLog("[Naerim][Session] error: " + juce::String(name) + " callback threw: " + juce::String(e.what()));
        }
        catch (...)
        {
            if (diagnostics != nullptr)
                diagnostics->error("Session", juce::String(name) + " callback threw a non-standard exception");
            else
                juce::Logger::writeToLog("[Naerim][Session] error: " + juce::String(name) + " callback threw a non-standard exception");
        }
    }

    DragSession::DragSession(DragPayload payloadIn,
                             Runtime::TaskScheduler& schedulerIn,
                             Runtime::AccessibilityAnnouncer* announcerIn,
                             Runtime::DropDiagnostics* diagnosticsIn,
                             SessionSettings settingsIn)
        : dragPayload(std::move(payloadIn)),
          scheduler(schedulerIn),
          announcer(announcerIn),
          diagnostics(diagnosticsIn),
          sessionSettings(settingsIn)
    {
        sessionSettings.cancelResetDelayMs = std::max(0, sessionSettings.cancelResetDelayMs);
        if (!(sessionSettings.durationSmoothing > 0.0 && sessionSettings.durationSmoothing <= 1.0))
            sessionSettings.durationSmoothing = 0.1;
    }

    DragSession::~DragSession()
    {
        ownerGuard.revoke();
        resetTask.cancel();

        std::vector<std::pair<int, DragSessionObserver>> snapshot;
        {
            const juce::ScopedLock sl(lock);
            snapshot.swap(observers);
        }

        for (const auto& entry : snapshot)
            invokeCallback("onDestroyed", entry.second.onDestroyed, *this);
    }

    void DragSession::setCallbacks(DragSessionCallbacks callbacksIn)
    {
        const juce::ScopedLock sl(lock);
        callbacks = std::move(callbacksIn);
    }

    int DragSession::addObserver(DragSessionObserver observer)
    {
        const juce::ScopedLock sl(lock);
        const auto id = nextObserverId++;
        observers.emplace_back(id, std::move(observer));
        return id;
    }

    void DragSession::removeObserver(int observerId)
    {
        const juce::ScopedLock sl(lock);
        observers.erase(std::remove_if(observers.begin(),
                                       observers.end(),
                                       [observerId](const auto& entry) { return entry.first == observerId; }),
                        observers.end());
    }

    bool DragSession::start()
    {
        DragSessionCallbacks snapshot;
        {
            const juce::ScopedLock sl(lock);
            if (state != DragState::idle)
            {
                logIgnored("start", state);
                return false;
            }

            state = DragState::dragging;
            hovered.reset();
            dragStartedMs = scheduler.nowMs();
            metrics.dragCount += 1;
            metrics.lastDragStartMs = dragStartedMs;
            snapshot = callbacks;
        }

        announce("Started dragging " + dragPayload.name() + " " + dragPayload.type());
        invokeCallback("onDragStarted", snapshot.onDragStarted, dragPayload);
        return true;
    }

    bool DragSession::updateHover(std::optional<ZoneId> zoneId)
    {
        std::optional<ZoneId> previous;
        DragSessionCallbacks snapshot;
        {
            const juce::ScopedLock sl(lock);
            if (state != DragState::dragging && state != DragState::hovering)
            {
                logIgnored("updateHover", state);
                return false;
            }

            if (hovered == zoneId)
                return false;

            previous = hovered;
            hovered = zoneId;
            state = hovered.has_value() ? DragState::hovering : DragState::dragging;
            snapshot = callbacks;
        }

        if (zoneId.has_value())
            announce("Hovering over drop zone " + *zoneId);
        else
            announce("Left drop zone " + describeZone(previous));

        invokeCallback("onHoverChanged", snapshot.onHoverChanged, previous, zoneId);
        return true;
    }

    bool DragSession::complete(bool success)
    {
        DragSessionCallbacks snapshot;
        double durationMs = 0.0;
        {
            const juce::ScopedLock sl(lock);
            if (state != DragState::dragging && state != DragState::hovering)
            {
                logIgnored("complete", state);
                return false;
            }

            durationMs = std::max(0.0, scheduler.nowMs() - dragStartedMs);
            if (durationSamples == 0)
                metrics.averageDragDurationMs = durationMs;
            else
                metrics.averageDragDurationMs = sessionSettings.durationSmoothing * durationMs
                                              + (1.0 - sessionSettings.durationSmoothing) * metrics.averageDragDurationMs;
            durationSamples += 1;

            if (success)
                metrics.successfulDrops += 1;
            else
                metrics.failedDrops += 1;

            state = DragState::idle;
            hovered.reset();
            snapshot = callbacks;
        }

        if (diagnostics != nullptr)
            diagnostics->info("Session", "drag finished id=" + dragPayload.id()
                                             + " success=" + juce::String(success ? 1 : 0)
                                             + " durationMs=" + juce::String(durationMs, 1));

        announce(success ? "Successfully placed " + dragPayload.name()
                         : "Failed to place " + dragPayload.name());
        invokeCallback("onDragCompleted", snapshot.onDragCompleted, dragPayload, success);
        notifyGestureEnded();
        return true;
    }

    bool DragSession::cancel()
    {
        DragSessionCallbacks snapshot;
        std::uint64_t generation = 0;
        {
            const juce::ScopedLock sl(lock);
            if (state != DragState::dragging && state != DragState::hovering)
            {
                logIgnored("cancel", state);
                return false;
            }

            state = DragState::cancelled;
            hovered.reset();
            metrics.cancelledDrags += 1;
            generation = ++resetGeneration;
            resetTask.cancel();
            snapshot = callbacks;
        }

        auto task = scheduler.schedule(sessionSettings.cancelResetDelayMs,
                                       ownerGuard.wrap([this, generation]
                                                       {
                                                           resetAfterCancel(generation);
                                                       }),
                                       "session.reset");
        {
            const juce::ScopedLock sl(lock);
            if (generation == resetGeneration)
                resetTask = task;
        }

        announce("Cancelled dragging " + dragPayload.name());
        invokeCallback("onDragCancelled", snapshot.onDragCancelled, dragPayload);
        notifyGestureEnded();
        return true;
    }

    bool DragSession::handleKey(DragKey key)
    {
        switch (key)
        {
            case DragKey::space:
            case DragKey::enter:
                if (getState() == DragState::idle)
                    return start();
                return false;

            case DragKey::escape:
                if (isActive())
                    return cancel();
                return false;

            case DragKey::other:
                break;
        }

        return false;
    }

    DragState DragSession::getState() const
    {
        const juce::ScopedLock sl(lock);
        return state;
    }

    DragMetrics DragSession::getMetrics() const
    {
        const juce::ScopedLock sl(lock);
        return metrics;
    }

    std::optional<ZoneId> DragSession::hoveredZone() const
    {
        const juce::ScopedLock sl(lock);
        return hovered;
    }

    bool DragSession::isActive() const
    {
        const juce::ScopedLock sl(lock);
        return state == DragState::dragging || state == DragState::hovering;
    }

    bool DragSession::hasPendingReset() const
    {
        const juce::ScopedLock sl(lock);
        return resetTask.isPending();
    }

    void DragSession::resetAfterCancel(std::uint64_t generation)
    {
        {
            const juce::ScopedLock sl(lock);
            if (generation != resetGeneration || state != DragState::cancelled)
                return;

            state = DragState::idle;
        }

        announce("Ready to drag " + dragPayload.name());
    }

    void DragSession::notifyGestureEnded()
    {
        std::vector<std::pair<int, DragSessionObserver>> snapshot;
        {
            const juce::ScopedLock sl(lock);
            snapshot = observers;
        }

        for (const auto& entry : snapshot)
            invokeCallback("onGestureEnded", entry.second.onGestureEnded, *this);
    }

    void DragSession::announce(const juce::String& message) const
    {
        if (announcer != nullptr)
            announcer->announce(kSource, message);
    }

    void DragSession::logIgnored(const juce::String& operation, DragState currentState) const
    {
        if (diagnostics == nullptr)
            return;

        const auto message = operation + " ignored in state " + dragStateToString(currentState) + " id=" + dragPayload.id();
        if (operation == "start")
            diagnostics->warning("Session", message);
        else
            diagnostics->debug("Session", message);
    }
}
