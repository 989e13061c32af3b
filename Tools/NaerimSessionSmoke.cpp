#include "NaerimSmokeSupport.h"

#include "Naerim/Editor/Canvas/FeedbackCoordinator.h"
#include "Naerim/Editor/Interaction/ActiveDragRegistry.h"
#include "Naerim/Editor/Interaction/DragSession.h"
#include "Naerim/Runtime/AccessibilityAnnouncer.h"
#include "Naerim/Runtime/DropDiagnostics.h"
#include "Naerim/Runtime/TaskScheduler.h"
#include <atomic>
#include <memory>
#include <stdexcept>

using namespace Naerim;
using namespace Naerim::Smoke;
using Naerim::Runtime::ManualTaskScheduler;
using Naerim::Ui::Canvas::FeedbackCoordinator;
using Naerim::Ui::Canvas::OverlayKind;
using Naerim::Ui::Interaction::DragKey;
using Naerim::Ui::Interaction::DragSession;

namespace
{
    int countOverlays(const FeedbackCoordinator& feedback, OverlayKind kind)
    {
        int count = 0;
        for (const auto& overlay : feedback.activeOverlays())
        {
            if (overlay.kind == kind)
                ++count;
        }

        return count;
    }

    bool announced(const Runtime::AccessibilityAnnouncer& announcer, const juce::String& message)
    {
        for (const auto& entry : announcer.recent(announcer.historyLimit()))
        {
            if (entry.message == message)
                return true;
        }

        return false;
    }

    juce::Result testSchedulerOrderingAndCancel()
    {
        ManualTaskScheduler scheduler;
        juce::StringArray fired;

        scheduler.schedule(30.0, [&fired] { fired.add("late"); }, "late");
        auto dropped = scheduler.schedule(10.0, [&fired] { fired.add("dropped"); }, "dropped");
        scheduler.schedule(20.0, [] { throw std::runtime_error("boom"); }, "throws");
        scheduler.schedule(10.0, [&fired] { fired.add("early"); }, "early");

        if (scheduler.pendingCount() != 4)
            return juce::Result::fail("expected four pending tasks");
        if (!dropped.cancel() || dropped.cancel())
            return juce::Result::fail("cancel should succeed exactly once");

        if (scheduler.advance(5.0) != 0)
            return juce::Result::fail("nothing is due at t=5");

        const auto executed = scheduler.advance(35.0);
        if (executed != 3)
            return juce::Result::fail("expected three tasks to run, got " + juce::String(executed));
        if (fired.joinIntoString(",") != "early,late")
            return juce::Result::fail("unexpected order: " + fired.joinIntoString(","));
        if (dropped.hasFired() || dropped.isPending())
            return juce::Result::fail("cancelled task changed state");
        if (scheduler.pendingCount() != 0)
            return juce::Result::fail("queue should be empty");

        auto chained = scheduler.schedule(0.0, [&scheduler, &fired]
                                          {
                                              scheduler.schedule(0.0, [&fired] { fired.add("chained"); });
                                          });
        scheduler.runPending();
        if (!chained.hasFired() || !fired.contains("chained"))
            return juce::Result::fail("zero-delay task queued by a task should run in the same pass");
        if (chained.cancel())
            return juce::Result::fail("cancel after firing should fail");

        return juce::Result::ok();
    }

    juce::Result testThreadSchedulerFires()
    {
        Runtime::ThreadTaskScheduler scheduler;
        juce::WaitableEvent done;
        std::atomic<bool> cancelledRan { false };

        auto cancelled = scheduler.schedule(50.0, [&cancelledRan] { cancelledRan = true; }, "cancelled");
        scheduler.schedule(1.0, [] { throw 7; }, "throws-int");
        scheduler.schedule(5.0, [&done] { done.signal(); }, "signal");
        cancelled.cancel();

        if (!done.wait(2000))
            return juce::Result::fail("background task did not fire after a throwing task");

        juce::Thread::sleep(120);
        if (cancelledRan.load())
            return juce::Result::fail("cancelled task ran on the background thread");

        return juce::Result::ok();
    }

    juce::Result testOwnerGuardRevokes()
    {
        ManualTaskScheduler scheduler;
        int runs = 0;

        auto guard = std::make_unique<Runtime::TaskOwnerGuard>();
        scheduler.schedule(10.0, guard->wrap([&runs] { ++runs; }));
        guard.reset();

        scheduler.advance(20.0);
        if (runs != 0)
            return juce::Result::fail("revoked task reached its owner");

        return juce::Result::ok();
    }

    juce::Result testSessionTransitions()
    {
        ManualTaskScheduler scheduler;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler);

        if (session.cancel() || session.complete(true) || session.updateHover(ZoneId("zone")))
            return juce::Result::fail("operations from idle should be no-ops");
        if (!session.start() || session.getState() != DragState::dragging)
            return juce::Result::fail("start from idle failed");
        if (session.start())
            return juce::Result::fail("second start should be ignored");

        if (!session.complete(true) || session.getState() != DragState::idle)
            return juce::Result::fail("complete should return to idle");

        const auto metrics = session.getMetrics();
        if (metrics.dragCount != 1 || metrics.successfulDrops != 1 || metrics.failedDrops != 0)
            return juce::Result::fail("unexpected metrics after one successful drop");
        if (!metrics.lastDragStartMs.has_value())
            return juce::Result::fail("drag start time not recorded");

        session.start();
        session.complete(false);
        if (session.getMetrics().failedDrops != 1 || session.getMetrics().dragCount != 2)
            return juce::Result::fail("failed drop not counted");

        return juce::Result::ok();
    }

    juce::Result testSessionHoverAndDuration()
    {
        ManualTaskScheduler scheduler;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler);

        int hoverChanges = 0;
        std::optional<ZoneId> lastPrevious;
        Ui::Interaction::DragSessionCallbacks callbacks;
        callbacks.onHoverChanged = [&](const std::optional<ZoneId>& previous, const std::optional<ZoneId>&)
        {
            ++hoverChanges;
            lastPrevious = previous;
        };
        session.setCallbacks(callbacks);

        session.start();
        if (!session.updateHover(ZoneId("a")) || session.getState() != DragState::hovering)
            return juce::Result::fail("hover did not enter hovering");
        if (session.updateHover(ZoneId("a")))
            return juce::Result::fail("repeated hover should not report a change");
        if (!session.updateHover(ZoneId("b")) || lastPrevious != ZoneId("a"))
            return juce::Result::fail("hover change did not report the previous zone");
        if (!session.updateHover(std::nullopt) || session.getState() != DragState::dragging)
            return juce::Result::fail("leaving a zone should return to dragging");
        if (hoverChanges != 3)
            return juce::Result::fail("expected three hover callbacks");

        scheduler.advance(200.0);
        session.complete(true);
        if (!nearlyEqual(session.getMetrics().averageDragDurationMs, 200.0))
            return juce::Result::fail("first duration sample should be taken as-is");

        session.start();
        scheduler.advance(100.0);
        session.complete(true);
        if (!nearlyEqual(session.getMetrics().averageDragDurationMs, 190.0))
            return juce::Result::fail("duration average should be smoothed, got "
                                      + juce::String(session.getMetrics().averageDragDurationMs));

        return juce::Result::ok();
    }

    juce::Result testSessionCancelResetsAfterDelay()
    {
        ManualTaskScheduler scheduler;
        Runtime::AccessibilityAnnouncer announcer;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler, &announcer);

        session.start();
        if (!session.cancel() || session.getState() != DragState::cancelled)
            return juce::Result::fail("cancel from dragging failed");
        if (session.getMetrics().cancelledDrags != 1 || !session.hasPendingReset())
            return juce::Result::fail("cancel bookkeeping is wrong");
        if (session.start())
            return juce::Result::fail("start must wait for the reset");

        scheduler.advance(50.0);
        if (session.getState() != DragState::cancelled)
            return juce::Result::fail("reset fired too early");

        scheduler.advance(60.0);
        if (session.getState() != DragState::idle || session.hasPendingReset())
            return juce::Result::fail("session did not reset after the delay");
        if (!announced(announcer, "Ready to drag Primary Button"))
            return juce::Result::fail("reset was not announced");

        if (!session.start())
            return juce::Result::fail("start after reset failed");

        return juce::Result::ok();
    }

    juce::Result testDestroyedSessionIgnoresPendingReset()
    {
        ManualTaskScheduler scheduler;
        const auto payload = makePayload("button");

        {
            DragSession session(*payload, scheduler);
            session.start();
            session.cancel();
        }

        if (scheduler.pendingCount() != 0)
            return juce::Result::fail("reset task survived its session");
        if (scheduler.advance(500.0) != 0)
            return juce::Result::fail("reset task ran after its session was destroyed");

        return juce::Result::ok();
    }

    juce::Result testSessionKeyboard()
    {
        ManualTaskScheduler scheduler;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler);

        if (!session.handleKey(DragKey::space) || session.getState() != DragState::dragging)
            return juce::Result::fail("space should start a drag");
        if (session.handleKey(DragKey::enter) || session.handleKey(DragKey::other))
            return juce::Result::fail("enter/other should do nothing while dragging");
        if (!session.handleKey(DragKey::escape) || session.getState() != DragState::cancelled)
            return juce::Result::fail("escape should cancel");
        if (session.handleKey(DragKey::escape))
            return juce::Result::fail("escape while cancelled should do nothing");

        return juce::Result::ok();
    }

    juce::Result testSessionCallbackFailureContained()
    {
        ManualTaskScheduler scheduler;
        Runtime::AccessibilityAnnouncer announcer;
        announcer.setListener([](const Runtime::Announcement&) { throw 42; });
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler, &announcer);

        Ui::Interaction::DragSessionCallbacks callbacks;
        callbacks.onDragStarted = [](const DragPayload&) { throw std::runtime_error("listener failed"); };
        callbacks.onDragCancelled = [](const DragPayload&) { throw 42; };
        session.setCallbacks(callbacks);

        Ui::Interaction::DragSessionObserver observer;
        observer.onGestureEnded = [](DragSession&) { throw juce::String("owner failed"); };
        session.addObserver(observer);

        if (!session.start() || session.getState() != DragState::dragging)
            return juce::Result::fail("throwing callback broke the transition");
        if (!session.cancel() || session.getState() != DragState::cancelled)
            return juce::Result::fail("non-standard exception broke the cancel transition");

        scheduler.advance(110.0);
        if (session.getState() != DragState::idle)
            return juce::Result::fail("reset task did not survive a throwing announcer listener");

        return juce::Result::ok();
    }

    juce::Result testRejectedStartLogsWarning()
    {
        CapturingLogger logger;
        ManualTaskScheduler scheduler;
        Runtime::DropDiagnostics diagnostics;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler, nullptr, &diagnostics);

        session.start();
        if (session.start())
            return juce::Result::fail("second start should be refused");
        if (logger.countContaining("[Naerim][Session] warn: start ignored in state dragging") != 1)
            return juce::Result::fail("refused start not logged at warning level");

        session.complete(true);
        if (session.complete(true))
            return juce::Result::fail("complete while idle should be refused");
        if (logger.countContaining("complete ignored") != 0)
            return juce::Result::fail("other ignored transitions stay at debug level");

        return juce::Result::ok();
    }

    juce::Result testSessionAnnouncements()
    {
        ManualTaskScheduler scheduler;
        Runtime::AccessibilityAnnouncer announcer;
        const auto payload = makePayload("button");
        DragSession session(*payload, scheduler, &announcer);

        session.start();
        session.updateHover(ZoneId("hero"));
        session.updateHover(std::nullopt);
        session.complete(true);

        for (const auto* message : { "Started dragging Primary Button button",
                                     "Hovering over drop zone hero",
                                     "Left drop zone hero",
                                     "Successfully placed Primary Button" })
        {
            if (!announced(announcer, message))
                return juce::Result::fail(juce::String("missing announcement: ") + message);
        }

        if (announcer.latest()->source != "session")
            return juce::Result::fail("announcement source should be session");

        return juce::Result::ok();
    }

    juce::Result testAnnouncerHistory()
    {
        Runtime::AccessibilityAnnouncer announcer(3);
        int heard = 0;
        announcer.setListener([&heard](const Runtime::Announcement&)
                              {
                                  ++heard;
                                  throw std::runtime_error("screen reader gone");
                              });

        for (int i = 1; i <= 5; ++i)
            announcer.announce("test", "message " + juce::String(i));
        announcer.announce("test", {});

        const auto recent = announcer.recent(10);
        if (recent.size() != 3 || recent.front().message != "message 3" || recent.back().message != "message 5")
            return juce::Result::fail("history should keep the newest three in order");
        if (announcer.totalCount() != 5 || heard != 5)
            return juce::Result::fail("empty messages must be ignored");

        announcer.clearHistory();
        if (announcer.latest().has_value())
            return juce::Result::fail("history not cleared");

        return juce::Result::ok();
    }

    juce::Result testFeedbackGhostThrottle()
    {
        ManualTaskScheduler scheduler;
        FeedbackCoordinator feedback(scheduler);
        const auto payload = makePayload("button");

        feedback.start(*payload, juce::Rectangle<float>(0.0f, 0.0f, 320.0f, 60.0f), juce::Point<float>(50.0f, 50.0f));
        const auto ghost = feedback.ghost();
        if (!ghost.has_value() || !sameRect(ghost->bounds, { 60.0f, 60.0f, 200.0f, 60.0f }))
            return juce::Result::fail("ghost should be clamped to 200 wide and offset by 10");
        if (!nearlyEqual(ghost->opacity, 0.7) || !nearlyEqual(ghost->scale, 0.9))
            return juce::Result::fail("ghost styling not taken from settings");

        if (!feedback.updateGhostPosition(100.0f, 100.0f))
            return juce::Result::fail("first ghost update should apply");
        if (feedback.updateGhostPosition(101.0f, 101.0f))
            return juce::Result::fail("update within one frame should be throttled");

        scheduler.advance(17.0);
        if (!feedback.updateGhostPosition(102.0f, 102.0f))
            return juce::Result::fail("update after the frame budget should apply");
        if (!sameRect(feedback.ghost()->bounds, { 112.0f, 112.0f, 200.0f, 60.0f }))
            return juce::Result::fail("ghost did not follow the pointer");

        const auto stats = feedback.stats();
        if (stats.ghostUpdatesApplied != 2 || stats.ghostUpdatesThrottled != 1)
            return juce::Result::fail("ghost counters are wrong");

        feedback.start(*payload);
        if (!sameRect(feedback.ghost()->bounds, { 10.0f, 10.0f, 100.0f, 40.0f }))
            return juce::Result::fail("ghost without source bounds should use the default size");

        return juce::Result::ok();
    }

    juce::Result testFeedbackZoneOverlays()
    {
        ManualTaskScheduler scheduler;
        Runtime::AccessibilityAnnouncer announcer;
        FeedbackCoordinator feedback(scheduler, &announcer);

        const juce::Rectangle<float> bounds(10.0f, 10.0f, 100.0f, 50.0f);
        feedback.updateZoneFeedback("list", FeedbackState::valid, bounds, InsertionPoint { { 60.0f, 10.0f }, InsertionOrientation::horizontal });

        bool sawHighlight = false;
        bool sawIndicator = false;
        for (const auto& overlay : feedback.activeOverlays())
        {
            if (overlay.kind == OverlayKind::highlight)
            {
                sawHighlight = sameRect(overlay.bounds, { 8.0f, 8.0f, 104.0f, 54.0f })
                            && overlay.colour == juce::Colour(0xff5e6ad2)
                            && nearlyEqual(overlay.opacity, 0.2);
            }
            else if (overlay.kind == OverlayKind::insertionIndicator)
            {
                sawIndicator = sameRect(overlay.bounds, { 40.0f, 9.0f, 40.0f, 2.0f });
            }
        }

        if (!sawHighlight || !sawIndicator)
            return juce::Result::fail("highlight or insertion indicator missing or misplaced");
        if (!announced(announcer, "Valid drop zone: list"))
            return juce::Result::fail("valid zone not announced");

        const auto vertical = FeedbackCoordinator::indicatorBounds({ { 0.0f, 50.0f }, InsertionOrientation::vertical }, 2.0f);
        if (!sameRect(vertical, { -1.0f, 30.0f, 2.0f, 40.0f }))
            return juce::Result::fail("vertical indicator misplaced");

        feedback.updateZoneFeedback("list", FeedbackState::invalid, bounds, InsertionPoint {});
        if (countOverlays(feedback, OverlayKind::insertionIndicator) != 0)
            return juce::Result::fail("invalid zones must not show an insertion indicator");

        feedback.updateZoneFeedback("list", FeedbackState::hover);
        if (countOverlays(feedback, OverlayKind::highlight) != 0)
            return juce::Result::fail("update without bounds should drop the highlight");
        if (feedback.zoneState("list") != FeedbackState::hover)
            return juce::Result::fail("zone state not tracked");

        feedback.clearZone("list");
        if (feedback.zoneState("list").has_value() || !feedback.activeOverlays().empty())
            return juce::Result::fail("clearZone left feedback behind");

        feedback.updateZoneFeedback("card", FeedbackState::valid, bounds);
        feedback.clearZone("card");
        if (!announced(announcer, "Left drop zone card"))
            return juce::Result::fail("clearing a highlight not announced");

        return juce::Result::ok();
    }

    juce::Result testFeedbackInvalidMarkerExpiry()
    {
        ManualTaskScheduler scheduler;
        Runtime::AccessibilityAnnouncer announcer;
        FeedbackCoordinator feedback(scheduler, &announcer);
        const juce::Rectangle<float> bounds(0.0f, 0.0f, 50.0f, 50.0f);

        feedback.showInvalid("slot", "Slot is already occupied", bounds);
        if (countOverlays(feedback, OverlayKind::invalidMarker) != 1 || feedback.stats().pendingRemovals != 1)
            return juce::Result::fail("invalid marker not shown");
        if (!announced(announcer, "Drop not allowed: Slot is already occupied"))
            return juce::Result::fail("invalid drop not announced");

        scheduler.advance(999.0);
        if (countOverlays(feedback, OverlayKind::invalidMarker) != 1)
            return juce::Result::fail("marker expired early");

        scheduler.advance(2.0);
        if (countOverlays(feedback, OverlayKind::invalidMarker) != 0 || feedback.stats().invalidMarkersExpired != 1)
            return juce::Result::fail("marker did not expire after one second");
        if (!announced(announcer, "Invalid marker cleared for slot"))
            return juce::Result::fail("marker expiry not announced");

        feedback.showInvalid("slot", "again", bounds);
        scheduler.advance(500.0);
        feedback.showInvalid("slot", "and again", bounds);
        scheduler.advance(600.0);
        if (countOverlays(feedback, OverlayKind::invalidMarker) != 1)
            return juce::Result::fail("re-shown marker was removed by the superseded timer");

        feedback.clearAll();
        feedback.showInvalid("other", "fresh", bounds);
        feedback.clearAll();
        scheduler.advance(2000.0);
        if (!feedback.activeOverlays().empty())
            return juce::Result::fail("feedback resurrected after clearAll");
        if (feedback.stats().invalidMarkersExpired != 1)
            return juce::Result::fail("cleared markers must not count as expired");
        if (!announced(announcer, "Drag feedback cleared"))
            return juce::Result::fail("clearAll not announced");

        return juce::Result::ok();
    }

    juce::Result testRegistryAllowsOneLiveSession()
    {
        ManualTaskScheduler scheduler;
        const auto payload = makePayload("button");
        DragSession first(*payload, scheduler);
        DragSession second(*payload, scheduler);
        Ui::Interaction::ActiveDragRegistry registry;

        if (registry.registerSession({}, first))
            return juce::Result::fail("empty element id accepted");
        if (!registry.registerSession("palette.button", first) || !registry.registerSession("palette.button", first))
            return juce::Result::fail("registering the same session should succeed");

        first.start();
        if (registry.registerSession("palette.button", second))
            return juce::Result::fail("element already has a live session");
        if (registry.find("palette.button") != &first)
            return juce::Result::fail("live session was replaced");

        first.complete(true);
        if (!registry.registerSession("palette.button", second))
            return juce::Result::fail("idle session should be replaceable");

        if (!registry.registerSession("palette.image", first))
            return juce::Result::fail("second element rejected");
        first.start();
        second.start();
        if (registry.activeSessions().size() != 2)
            return juce::Result::fail("expected two active sessions");
        if (registry.cancelAll() != 2 || first.getState() != DragState::cancelled)
            return juce::Result::fail("cancelAll did not cancel every active session");

        if (!registry.unregisterSession("palette.image") || registry.size() != 1)
            return juce::Result::fail("unregister failed");

        auto transient = std::make_unique<DragSession>(*payload, scheduler);
        if (!registry.registerSession("palette.transient", *transient))
            return juce::Result::fail("transient session rejected");
        transient.reset();
        if (registry.find("palette.transient") != nullptr || registry.size() != 1)
            return juce::Result::fail("destroyed session still registered");
        if (registry.activeSessions().size() != 0)
            return juce::Result::fail("activeSessions should only report live sessions");

        return juce::Result::ok();
    }
}

int main()
{
    const TestList tests = {
        { "SchedulerOrderingAndCancel", testSchedulerOrderingAndCancel },
        { "ThreadSchedulerFires", testThreadSchedulerFires },
        { "OwnerGuardRevokes", testOwnerGuardRevokes },
        { "SessionTransitions", testSessionTransitions },
        { "SessionHoverAndDuration", testSessionHoverAndDuration },
        { "SessionCancelResetsAfterDelay", testSessionCancelResetsAfterDelay },
        { "DestroyedSessionIgnoresPendingReset", testDestroyedSessionIgnoresPendingReset },
        { "SessionKeyboard", testSessionKeyboard },
        { "SessionCallbackFailureContained", testSessionCallbackFailureContained },
        { "RejectedStartLogsWarning", testRejectedStartLogsWarning },
        { "SessionAnnouncements", testSessionAnnouncements },
        { "AnnouncerHistory", testAnnouncerHistory },
        { "FeedbackGhostThrottle", testFeedbackGhostThrottle },
        { "FeedbackZoneOverlays", testFeedbackZoneOverlays },
        { "FeedbackInvalidMarkerExpiry", testFeedbackInvalidMarkerExpiry },
        { "RegistryAllowsOneLiveSession", testRegistryAllowsOneLiveSession }
    };

    return runTests(tests, "Naerim session smoke passed.");
}
