#pragma once

#include "Naerim/Public/DragPayload.h"
#include "Naerim/Public/EngineConfig.h"
#include "Naerim/Public/Types.h"
#include "Naerim/Runtime/TaskScheduler.h"
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace Naerim::Runtime
{
    class AccessibilityAnnouncer;
    class DropDiagnostics;
}

namespace Naerim::Ui::Interaction
{
    enum class DragKey
    {
        space,
        enter,
        escape,
        other
    };

    struct DragMetrics
    {
        int dragCount = 0;
        int successfulDrops = 0;
        int failedDrops = 0;
        int cancelledDrags = 0;
        double averageDragDurationMs = 0.0;
        std::optional<double> lastDragStartMs;
    };

    struct DragSessionCallbacks
    {
        std::function<void(const DragPayload&)> onDragStarted;
        std::function<void(const std::optional<ZoneId>& previous, const std::optional<ZoneId>& current)> onHoverChanged;
        std::function<void(const DragPayload&, bool success)> onDragCompleted;
        std::function<void(const DragPayload&)> onDragCancelled;
    };

    class DragSession;

    // Owner-side hooks, kept apart from the element's own callbacks.
    struct DragSessionObserver
    {
        std::function<void(DragSession&)> onGestureEnded;
        std::function<void(DragSession&)> onDestroyed;
    };

    // Lifecycle of one draggable element:
    //   idle -> dragging <-> hovering -> idle          (complete)
    //   dragging/hovering -> cancelled -> idle         (cancel, reset after a delay)
    // Calls outside their legal source state are logged no-ops returning false.
    class DragSession
    {
    public:
        DragSession(DragPayload payloadIn,
                    Runtime::TaskScheduler& schedulerIn,
                    Runtime::AccessibilityAnnouncer* announcerIn = nullptr,
                    Runtime::DropDiagnostics* diagnosticsIn = nullptr,
                    SessionSettings settingsIn = {});
        ~DragSession();

        DragSession(const DragSession&) = delete;
        DragSession& operator=(const DragSession&) = delete;

        void setCallbacks(DragSessionCallbacks callbacksIn);

        int addObserver(DragSessionObserver observer);
        void removeObserver(int observerId);

        bool start();
        bool updateHover(std::optional<ZoneId> zoneId);
        bool complete(bool success);
        bool cancel();
        bool handleKey(DragKey key);

        [[nodiscard]] DragState getState() const;
        [[nodiscard]] DragMetrics getMetrics() const;
        [[nodiscard]] std::optional<ZoneId> hoveredZone() const;
        [[nodiscard]] bool isActive() const;
        [[nodiscard]] bool hasPendingReset() const;
        const DragPayload& payload() const noexcept { return dragPayload; }

    private:
        void resetAfterCancel(std::uint64_t generation);
        void notifyGestureEnded();
        void announce(const juce::String& message) const;
        void logIgnored(const juce::String& operation, DragState currentState) const;

        template <typename Callback, typename... Args>
        void invokeCallback(const char* name, const Callback& callback, Args&&... args) const;

        const DragPayload dragPayload;
        Runtime::TaskScheduler& scheduler;
        Runtime::AccessibilityAnnouncer* announcer = nullptr;
        Runtime::DropDiagnostics* diagnostics = nullptr;
        SessionSettings sessionSettings;

        mutable juce::CriticalSection lock;
        DragState state = DragState::idle;
        std::optional<ZoneId> hovered;
        DragMetrics metrics;
        int durationSamples = 0;
        double dragStartedMs = 0.0;
        DragSessionCallbacks callbacks;
        std::vector<std::pair<int, DragSessionObserver>> observers;
        int nextObserverId = 1;

        std::uint64_t resetGeneration = 0;
        Runtime::ScheduledTask resetTask;
        Runtime::TaskOwnerGuard ownerGuard;
    };
}
