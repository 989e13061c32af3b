#include "NaerimSmokeSupport.h"

#include "Naerim/Core/DropValidator.h"
#include "Naerim/Core/SpatialDropIndex.h"
#include "Naerim/Editor/Canvas/FeedbackCoordinator.h"
#include "Naerim/Editor/Interaction/DragDropController.h"
#include "Naerim/Editor/Interaction/DragSession.h"
#include "Naerim/Editor/Perf/DropPerfTracker.h"
#include "Naerim/Runtime/DropDiagnostics.h"
#include "Naerim/Runtime/TaskScheduler.h"
#include "Naerim/Serialization/ConfigJson.h"
#include "Naerim/Serialization/ZoneJson.h"
#include <memory>
#include <stdexcept>

using namespace Naerim;
using namespace Naerim::Smoke;
using Naerim::Ui::Interaction::DragDropController;
using Naerim::Ui::Interaction::DragKey;
using Naerim::Ui::Interaction::DragSession;

namespace
{
    // Index, validator, feedback and controller wired the way a host would.
    struct Engine
    {
        explicit Engine(ControllerSettings controllerSettings = {})
            : validator(index),
              feedback(scheduler),
              controller(index, validator, feedback, nullptr, controllerSettings, &perf)
        {
        }

        Runtime::ManualTaskScheduler scheduler;
        Core::SpatialDropIndex index;
        Core::DropValidator validator;
        Ui::Canvas::FeedbackCoordinator feedback;
        Ui::Perf::DropPerfTracker perf;
        DragDropController controller;
    };

    ZoneConstraints kindOf(DropZoneKind kind)
    {
        ZoneConstraints constraints;
        constraints.kind = kind;
        return constraints;
    }

    juce::Result addNestedPair(Core::SpatialDropIndex& index)
    {
        if (auto r = index.addZone("A", { 0.0f, 0.0f, 200.0f, 200.0f }, 0, std::nullopt, { "button" }); r.failed())
            return r;
        return index.addZone("B", { 50.0f, 50.0f, 50.0f, 50.0f }, 1, ZoneId("A"), { kWildcardType });
    }

    juce::Result testDragAcrossNestedZones()
    {
        Engine engine;
        if (auto r = addNestedPair(engine.index); r.failed())
            return r;

        const auto image = makePayload("image", "img-1", "Logo", "media");
        DragSession session(*image, engine.scheduler);

        if (!engine.controller.beginDrag(session, juce::Point<float>(5.0f, 5.0f)))
            return juce::Result::fail("beginDrag failed");
        if (!idsEqual(engine.controller.validTargets(), { "B" }))
            return juce::Result::fail("only B should be a valid target: " + joinIds(engine.controller.validTargets()));
        if (engine.controller.beginDrag(session))
            return juce::Result::fail("second beginDrag should be refused");

        const auto overB = engine.controller.dragOver(60.0f, 60.0f);
        if (!overB.target.has_value() || overB.target->id != "B" || !overB.validation.isValid)
            return juce::Result::fail("B should be the drop target at (60,60)");
        if (session.getState() != DragState::hovering || session.hoveredZone() != ZoneId("B"))
            return juce::Result::fail("session not hovering B");
        if (engine.feedback.zoneState("B") != FeedbackState::valid)
            return juce::Result::fail("B not highlighted as valid");

        engine.scheduler.advance(20.0);
        const auto overA = engine.controller.dragOver(150.0f, 150.0f);
        if (overA.target.has_value() || overA.validation.isValid)
            return juce::Result::fail("A must not accept an image");
        if (overA.validation.reason != "Component type 'image' not accepted")
            return juce::Result::fail("unexpected rejection: " + overA.validation.reason);
        if (session.getState() != DragState::dragging)
            return juce::Result::fail("leaving B should drop the hover");
        if (engine.feedback.zoneState("A") != FeedbackState::invalid || engine.feedback.zoneState("B").has_value())
            return juce::Result::fail("feedback did not move from B to A");

        const auto outcome = engine.controller.drop(60.0f, 60.0f);
        if (!outcome.success || !outcome.target.has_value() || outcome.target->id != "B")
            return juce::Result::fail("drop on B failed: " + outcome.validation.reason);
        if (!nearlyEqual(outcome.dropPosition.x, 10.0) || !nearlyEqual(outcome.dropPosition.y, 10.0))
            return juce::Result::fail("drop position should be relative to the zone");

        if (session.getState() != DragState::idle || session.getMetrics().successfulDrops != 1)
            return juce::Result::fail("session not completed");
        if (engine.controller.isDragging() || !engine.feedback.activeOverlays().empty())
            return juce::Result::fail("controller left drag state behind");

        if (!engine.perf.summaryFor(Ui::Perf::DropOperation::dragOver).has_value()
            || engine.perf.summaryFor(Ui::Perf::DropOperation::dragOver)->count != 2
            || !engine.perf.summaryFor(Ui::Perf::DropOperation::beginDrag).has_value())
            return juce::Result::fail("drag_over timings not recorded");

        return juce::Result::ok();
    }

    juce::Result testNoDragAndEmptyCanvas()
    {
        Engine engine;
        const auto idle = engine.controller.dragOver(10.0f, 10.0f);
        if (idle.validation.isValid || idle.validation.reason != "No drag in progress")
            return juce::Result::fail("dragOver without a drag should be rejected");

        const auto payload = makePayload("button");
        DragSession session(*payload, engine.scheduler);
        engine.controller.beginDrag(session);

        const auto empty = engine.controller.dragOver(10.0f, 10.0f);
        if (empty.validation.reason != "No drop zone under pointer")
            return juce::Result::fail("empty canvas should report no zone");

        const auto outcome = engine.controller.drop(10.0f, 10.0f);
        if (outcome.success || session.getMetrics().failedDrops != 1)
            return juce::Result::fail("drop on nothing should fail and count as failed");

        return juce::Result::ok();
    }

    juce::Result testInsertionPoints()
    {
        Engine engine;
        DropZone container;
        container.id = "list";
        container.bounds = { 0.0f, 0.0f, 100.0f, 100.0f };
        container.constraints = kindOf(DropZoneKind::container);

        struct Case
        {
            juce::Point<float> pointer;
            juce::Point<float> expected;
            InsertionOrientation orientation;
        };

        const std::vector<Case> cases {
            { { 50.0f, 10.0f }, { 50.0f, 0.0f }, InsertionOrientation::horizontal },
            { { 50.0f, 95.0f }, { 50.0f, 100.0f }, InsertionOrientation::horizontal },
            { { 5.0f, 50.0f }, { 0.0f, 50.0f }, InsertionOrientation::vertical },
            { { 95.0f, 50.0f }, { 100.0f, 50.0f }, InsertionOrientation::vertical },
            { { 50.0f, 50.0f }, { 50.0f, 50.0f }, InsertionOrientation::child }
        };

        for (const auto& c : cases)
        {
            const auto point = engine.controller.computeInsertionPoint(container, c.pointer);
            if (point.orientation != c.orientation || point.position != c.expected)
                return juce::Result::fail("container insertion wrong at " + c.pointer.toString());
        }

        auto canvas = container;
        canvas.constraints = kindOf(DropZoneKind::canvas);
        const auto onCanvas = engine.controller.computeInsertionPoint(canvas, { 33.0f, 44.0f });
        if (onCanvas.orientation != InsertionOrientation::point || onCanvas.position != juce::Point<float>(33.0f, 44.0f))
            return juce::Result::fail("canvas insertion should follow the pointer");

        auto slot = container;
        slot.constraints = kindOf(DropZoneKind::slot);
        if (engine.controller.computeInsertionPoint(slot, { 5.0f, 5.0f }).position != juce::Point<float>(50.0f, 50.0f))
            return juce::Result::fail("slot insertion should use the centre");

        return juce::Result::ok();
    }

    juce::Result testNestingDepthAndSelfDrop()
    {
        ControllerSettings settings;
        settings.maxNestingDepth = 2;
        Engine engine(settings);

        if (auto r = engine.index.addZone("root", { 0.0f, 0.0f, 400.0f, 400.0f }, 0); r.failed())
            return r;
        if (auto r = engine.index.addZone("panel", { 10.0f, 10.0f, 300.0f, 300.0f }, 1, ZoneId("root")); r.failed())
            return r;
        if (auto r = engine.index.addZone("card", { 20.0f, 20.0f, 100.0f, 100.0f }, 2, ZoneId("panel")); r.failed())
            return r;
        if (auto r = engine.index.addZone("deep", { 30.0f, 30.0f, 10.0f, 10.0f }, 3, ZoneId("card")); r.failed())
            return r;

        const auto button = makePayload("button");
        const auto tooDeep = engine.controller.evaluate(*engine.index.findZone("deep"), *button);
        if (tooDeep.isValid || tooDeep.reason != "Maximum nesting depth (2) exceeded")
            return juce::Result::fail("depth limit not enforced: " + tooDeep.reason);

        const auto movingPanel = makePayload("section", "panel-copy", "Panel", "layout", {}, "panel");
        const auto intoItself = engine.controller.evaluate(*engine.index.findZone("card"), *movingPanel);
        if (intoItself.isValid || intoItself.reason != "Cannot drop a component into itself")
            return juce::Result::fail("self drop not rejected: " + intoItself.reason);
        if (!engine.controller.evaluate(*engine.index.findZone("root"), *movingPanel).isValid)
            return juce::Result::fail("dropping outside the source should be allowed");

        DragSession session(*button, engine.scheduler);
        engine.controller.beginDrag(session);
        const auto over = engine.controller.dragOver(35.0f, 35.0f);
        if (!over.target.has_value() || over.target->id != "card")
            return juce::Result::fail("pointer over a too-deep zone should fall back to its parent");

        return juce::Result::ok();
    }

    juce::Result testHandlersOverrideDecisions()
    {
        Engine engine;
        if (auto r = addNestedPair(engine.index); r.failed())
            return r;

        const auto image = makePayload("image", "img-1", "Logo", "media");
        DragSession session(*image, engine.scheduler);

        const auto vetoId = engine.controller.addDragOverHandler([](const DragPayload&, const DropZone& zone, const ValidationResult&) -> std::optional<bool>
                                                                 {
                                                                     if (zone.id == "B")
                                                                         return false;
                                                                     return std::nullopt;
                                                                 });
        engine.controller.addDragOverHandler([](const DragPayload&, const DropZone&, const ValidationResult&) -> std::optional<bool>
                                             {
                                                 throw std::runtime_error("handler bug");
                                             });
        engine.controller.addDragOverHandler([](const DragPayload&, const DropZone&, const ValidationResult&) -> std::optional<bool>
                                             {
                                                 throw 3;
                                             });

        engine.controller.beginDrag(session);
        const auto vetoed = engine.controller.dragOver(60.0f, 60.0f);
        if (vetoed.target.has_value() || !vetoed.overriddenByHandler || vetoed.validation.reason != "Drop rejected by handler")
            return juce::Result::fail("handler veto ignored");
        if (engine.feedback.zoneState("B") != FeedbackState::invalid)
            return juce::Result::fail("vetoed zone should show invalid feedback");

        if (!engine.controller.removeHandler(vetoId) || engine.controller.removeHandler(vetoId))
            return juce::Result::fail("removeHandler bookkeeping is wrong");

        engine.controller.addDragOverHandler([](const DragPayload&, const DropZone& zone, const ValidationResult&) -> std::optional<bool>
                                             {
                                                 if (zone.id == "A")
                                                     return true;
                                                 return std::nullopt;
                                             });
        engine.scheduler.advance(20.0);
        const auto forced = engine.controller.dragOver(150.0f, 150.0f);
        if (!forced.target.has_value() || forced.target->id != "A" || !forced.overriddenByHandler)
            return juce::Result::fail("handler should be able to accept a rejected zone");

        int dropCalls = 0;
        engine.controller.addDropHandler([&dropCalls](const DragPayload&, const DropZone&, juce::Point<float>, const std::optional<InsertionPoint>&)
                                         {
                                             ++dropCalls;
                                             return false;
                                         });
        const auto declined = engine.controller.drop(60.0f, 60.0f);
        if (declined.success || dropCalls != 1 || declined.validation.reason != "Drop handler declined the drop")
            return juce::Result::fail("declining drop handler ignored");
        if (session.getMetrics().failedDrops != 1 || session.getState() != DragState::idle)
            return juce::Result::fail("declined drop should complete the session as failed");

        return juce::Result::ok();
    }

    juce::Result testDropSnapsToGrid()
    {
        ControllerSettings settings;
        settings.snapToGrid = true;
        settings.gridSize = 20.0f;
        Engine engine(settings);

        if (auto r = engine.index.addZone("canvas", { 100.0f, 100.0f, 400.0f, 400.0f }, 0); r.failed())
            return r;

        juce::Point<float> seen;
        engine.controller.addDropHandler([&seen](const DragPayload&, const DropZone&, juce::Point<float> position, const std::optional<InsertionPoint>&)
                                         {
                                             seen = position;
                                             return true;
                                         });

        const auto payload = makePayload("button");
        DragSession session(*payload, engine.scheduler);
        engine.controller.beginDrag(session);
        const auto outcome = engine.controller.drop(133.0f, 147.0f);

        if (!outcome.success || outcome.dropPosition != juce::Point<float>(40.0f, 40.0f) || seen != outcome.dropPosition)
            return juce::Result::fail("drop position not snapped: " + outcome.dropPosition.toString());

        engine.controller.addDropHandler([](const DragPayload&, const DropZone&, juce::Point<float>, const std::optional<InsertionPoint>&) -> bool
                                         {
                                             throw 5;
                                         });
        engine.controller.beginDrag(session);
        const auto failed = engine.controller.drop(133.0f, 147.0f);
        if (failed.success || session.getState() != DragState::idle || session.getMetrics().failedDrops != 1)
            return juce::Result::fail("a drop handler throwing a non-standard exception should decline the drop");

        return juce::Result::ok();
    }

    juce::Result testControllerCancel()
    {
        Engine engine;
        if (auto r = addNestedPair(engine.index); r.failed())
            return r;

        const auto button = makePayload("button");
        DragSession session(*button, engine.scheduler);
        if (engine.controller.cancel())
            return juce::Result::fail("cancel without a drag should report false");

        engine.controller.beginDrag(session);
        engine.controller.dragOver(150.0f, 150.0f);
        if (engine.controller.currentTarget() != ZoneId("A"))
            return juce::Result::fail("A should be the current target");

        if (!engine.controller.cancel())
            return juce::Result::fail("cancel during a drag failed");
        if (session.getState() != DragState::cancelled || engine.controller.isDragging())
            return juce::Result::fail("session not cancelled");
        if (!engine.feedback.activeOverlays().empty() || engine.controller.currentTarget().has_value())
            return juce::Result::fail("cancel left feedback behind");

        engine.scheduler.advance(100.0);
        if (session.getState() != DragState::idle || !engine.controller.beginDrag(session))
            return juce::Result::fail("session should be reusable after the reset delay");

        return juce::Result::ok();
    }

    juce::Result testEngineConfigJson()
    {
        EngineConfig config;
        const juce::String json = R"({
            "index": { "max_cache_entries": 64, "grid_threshold": 0 },
            "feedback": { "valid_colour": "#112233", "fps_limit": 120, "invalid_marker_ms": 250 },
            "controller": { "snap_to_grid": true, "grid_size": 8 },
            "diagnostics": { "log_level": "debug", "query_log_stride": 5 }
        })";

        if (auto r = Serialization::engineConfigFromJsonString(json, config); r.failed())
            return juce::Result::fail("valid config rejected: " + r.getErrorMessage());
        if (config.index.maxCacheEntries != 64 || config.index.gridThreshold != 0 || !nearlyEqual(config.index.gridCellSize, 64.0))
            return juce::Result::fail("index section not applied");
        if (config.feedback.validHighlightColour != juce::Colour(0xff112233) || config.feedback.fpsLimit != 120)
            return juce::Result::fail("feedback section not applied");
        if (config.feedback.invalidHighlightColour != juce::Colour(0xffef4444))
            return juce::Result::fail("unspecified keys must keep their values");
        if (!config.controller.snapToGrid || config.diagnostics.logLevel != LogLevel::debug)
            return juce::Result::fail("controller or diagnostics section not applied");

        const auto before = Serialization::engineConfigToVar(config);
        for (const auto* bad : { R"({"feedback":{"fps_limit":10}})",
                                 R"({"index":{"max_cache_entries":1.5}})",
                                 R"({"diagnostics":{"log_level":"loud"}})",
                                 R"({"feedback":{"hover_colour":"teal"}})",
                                 R"({"session":[]})",
                                 "{ broken" })
        {
            if (Serialization::engineConfigFromJsonString(bad, config).wasOk())
                return juce::Result::fail(juce::String("bad config accepted: ") + bad);
        }

        if (!varDeepEquals(before, Serialization::engineConfigToVar(config)))
            return juce::Result::fail("failed load modified the config");

        const auto file = juce::File::createTempFile(".json");
        if (auto r = Serialization::saveEngineConfigToFile(file, config); r.failed())
            return r;

        EngineConfig reloaded;
        const auto loadResult = Serialization::loadEngineConfigFromFile(file, reloaded);
        file.deleteFile();
        if (loadResult.failed())
            return juce::Result::fail("saved config did not load: " + loadResult.getErrorMessage());
        if (!varDeepEquals(Serialization::engineConfigToVar(reloaded), before))
            return juce::Result::fail("config changed across save and load");

        if (Serialization::loadEngineConfigFromFile(juce::File::getNonexistentFile(), reloaded).wasOk())
            return juce::Result::fail("missing file should fail");

        if (Serialization::colourToString(juce::Colour(0x80ff0000)) != "#80FF0000")
            return juce::Result::fail("alpha colour formatting wrong");

        return juce::Result::ok();
    }

    juce::Result testSessionEndingOutsideController()
    {
        Engine engine;
        if (auto r = addNestedPair(engine.index); r.failed())
            return r;

        const auto button = makePayload("button");
        auto session = std::make_unique<DragSession>(*button, engine.scheduler);

        engine.controller.beginDrag(*session, juce::Point<float>(5.0f, 5.0f));
        engine.controller.dragOver(150.0f, 150.0f);
        if (engine.feedback.activeOverlays().empty())
            return juce::Result::fail("drag should show feedback");

        if (!session->handleKey(DragKey::escape))
            return juce::Result::fail("escape should cancel the session");
        if (engine.controller.isDragging() || engine.controller.currentTarget().has_value())
            return juce::Result::fail("controller still tracks an escaped drag");
        if (!engine.feedback.activeOverlays().empty())
            return juce::Result::fail("escape left feedback behind");
        if (engine.controller.dragOver(60.0f, 60.0f).validation.reason != "No drag in progress")
            return juce::Result::fail("dragOver after escape should report no drag");

        auto other = std::make_unique<DragSession>(*button, engine.scheduler);
        if (!engine.controller.beginDrag(*other))
            return juce::Result::fail("a new drag should start after escape");
        engine.controller.dragOver(150.0f, 150.0f);
        other.reset();
        if (engine.controller.isDragging() || !engine.feedback.activeOverlays().empty())
            return juce::Result::fail("destroyed session still held by the controller");

        engine.scheduler.advance(110.0);
        if (!engine.controller.beginDrag(*session))
            return juce::Result::fail("drag after a destroyed session should start");
        session->complete(true);
        if (engine.controller.isDragging() || !engine.feedback.activeOverlays().empty())
            return juce::Result::fail("session completed by its element still tracked");

        return juce::Result::ok();
    }

    juce::Result testZoneLayoutJson()
    {
        const juce::String layout = R"({ "zones": [
            { "id": "page", "bounds": { "x": 0, "y": 0, "w": 800, "h": 600 }, "depth": 0,
              "constraints": { "kind": "canvas" } },
            { "id": "list", "bounds": { "x": 20, "y": 20, "w": 300, "h": 200 }, "depth": 1, "parent_id": "page",
              "accepts": [ "button", "text" ],
              "constraints": { "kind": "container", "max_children": 2, "child_count": 2 } }
        ] })";

        std::vector<DropZone> zones;
        if (auto r = Serialization::zonesFromJsonString(layout, zones); r.failed())
            return juce::Result::fail("layout rejected: " + r.getErrorMessage());

        Core::SpatialDropIndex index;
        Core::DropValidator validator(index);
        for (const auto& zone : zones)
        {
            if (auto r = index.addZone(zone); r.failed())
                return r;
        }

        const auto button = makePayload("button");
        if (validator.validate("list", *button).isValid)
            return juce::Result::fail("full container from layout accepted a drop");

        ZoneConstraintsPatch patch;
        if (auto r = Serialization::constraintsPatchFromJsonString(R"({"max_children": null})", patch); r.failed())
            return r;
        if (!patch.clearMaxChildren || !validator.updateConstraints("list", patch))
            return juce::Result::fail("null max_children should clear the limit");
        if (!validator.validate("list", *button).isValid)
            return juce::Result::fail("cleared limit should accept");

        for (const auto* bad : { R"({"kind":"drawer"})", R"({"max_children":-1})", R"({"occupied":"yes"})" })
        {
            ZoneConstraintsPatch ignored;
            if (Serialization::constraintsPatchFromJsonString(bad, ignored).wasOk())
                return juce::Result::fail(juce::String("bad constraint patch accepted: ") + bad);
        }

        ZoneConstraintsPatch huge;
        const auto hugeResult = Serialization::constraintsPatchFromJsonString(R"({"max_children": 3e9})", huge);
        if (hugeResult.wasOk() || !hugeResult.getErrorMessage().contains("max_children out of range"))
            return juce::Result::fail("max_children beyond int range accepted");

        std::vector<DropZone> deep;
        const auto deepResult = Serialization::zonesFromJsonString(
            R"({ "zones": [ { "id": "far", "bounds": { "x": 0, "y": 0, "w": 10, "h": 10 }, "depth": 1e12 } ] })", deep);
        if (deepResult.wasOk() || !deepResult.getErrorMessage().contains("depth out of range"))
            return juce::Result::fail("depth beyond int range accepted");

        DropZone restored;
        if (auto r = Serialization::zoneFromVar(Serialization::zoneToVar(*index.findZone("list")), restored); r.failed())
            return r;
        if (restored.parentId != ZoneId("page") || restored.accepts.count("text") != 1 || restored.constraints.maxChildren.has_value())
            return juce::Result::fail("zone record lost fields");

        return juce::Result::ok();
    }

    juce::Result testDiagnosticsLevelsAndStride()
    {
        CapturingLogger logger;

        DiagnosticsSettings settings;
        settings.logLevel = LogLevel::warning;
        Runtime::DropDiagnostics diagnostics(settings);

        diagnostics.debug("Index", "hidden");
        diagnostics.warning("Index", "shown");
        if (logger.countContaining("hidden") != 0 || logger.countContaining("[Naerim][Index] warn: shown") != 1)
            return juce::Result::fail("level filtering wrong: " + logger.snapshot().joinIntoString(" | "));

        Core::SpatialDropIndex index({}, &diagnostics);
        if (!index.addZone("", { 0.0f, 0.0f, 10.0f, 10.0f }, 0).failed()
            || logger.countContaining("addZone rejected: zone.id must not be empty") != 1)
            return juce::Result::fail("rejected zone not logged as a warning");

        settings.logLevel = LogLevel::debug;
        settings.queryLogStride = 3;
        diagnostics.setSettings(settings);
        diagnostics.resetSession();
        if (auto r = index.addZone("canvas", { 0.0f, 0.0f, 100.0f, 100.0f }, 0); r.failed())
            return r;

        for (int i = 0; i < 6; ++i)
            index.queryPoint(static_cast<float>(i), 1.0f);

        if (logger.countContaining("query=point") != 2)
            return juce::Result::fail("expected every third query to be logged, got "
                                      + juce::String(logger.countContaining("query=point")));

        settings.logLevel = LogLevel::off;
        diagnostics.setSettings(settings);
        diagnostics.error("Index", "silenced");
        if (logger.countContaining("silenced") != 0)
            return juce::Result::fail("off level still logs");

        return juce::Result::ok();
    }

    juce::Result testPerfTrackerSummaries()
    {
        using Ui::Perf::DropOperation;

        CapturingLogger logger;
        Runtime::DropDiagnostics diagnostics;
        Ui::Perf::DropPerfTracker tracker(16.0, 10, &diagnostics);
        for (int i = 1; i <= 20; ++i)
            tracker.record(DropOperation::drop, static_cast<double>(i));
        tracker.record(DropOperation::drop, -1.0);

        const auto summary = tracker.summaryFor(DropOperation::drop);
        if (!summary.has_value() || summary->count != 10)
            return juce::Result::fail("samples should be capped at 10");
        if (!nearlyEqual(summary->p50Ms, 15.0) || !nearlyEqual(summary->p95Ms, 20.0) || !nearlyEqual(summary->maxMs, 20.0))
            return juce::Result::fail("unexpected percentiles");
        if (summary->overFrameBudget != 4 || logger.countContaining("[Naerim][Perf] warn: drop took") != 4)
            return juce::Result::fail("samples over the frame budget should be counted and logged");

        {
            const Ui::Perf::DropPerfTracker::Scope scope(tracker, DropOperation::dragOver);
        }

        const auto all = tracker.summarize();
        if (all.size() != 2 || all.front().operation != DropOperation::dragOver)
            return juce::Result::fail("scoped timing not recorded");

        tracker.clear();
        if (tracker.summaryFor(DropOperation::drop).has_value())
            return juce::Result::fail("clear left samples behind");

        return juce::Result::ok();
    }
}

int main()
{
    const TestList tests = {
        { "DragAcrossNestedZones", testDragAcrossNestedZones },
        { "NoDragAndEmptyCanvas", testNoDragAndEmptyCanvas },
        { "InsertionPoints", testInsertionPoints },
        { "NestingDepthAndSelfDrop", testNestingDepthAndSelfDrop },
        { "HandlersOverrideDecisions", testHandlersOverrideDecisions },
        { "DropSnapsToGrid", testDropSnapsToGrid },
        { "ControllerCancel", testControllerCancel },
        { "SessionEndingOutsideController", testSessionEndingOutsideController },
        { "EngineConfigJson", testEngineConfigJson },
        { "ZoneLayoutJson", testZoneLayoutJson },
        { "DiagnosticsLevelsAndStride", testDiagnosticsLevelsAndStride },
        { "PerfTrackerSummaries", testPerfTrackerSummaries }
    };

    return runTests(tests, "Naerim controller smoke passed.");
}
