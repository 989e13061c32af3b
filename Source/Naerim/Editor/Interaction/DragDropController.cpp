#include "Naerim/Editor/Interaction/DragDropController.h"

#include "Naerim/Core/DropValidator.h"
#include "Naerim/Core/SpatialDropIndex.h"
#include "Naerim/Editor/Canvas/FeedbackCoordinator.h"
#include "Naerim/Editor/Interaction/DragSession.h"
#include "Naerim/Editor/Perf/DropPerfTracker.h"
#include "Naerim/Runtime/DropDiagnostics.h"
#include <algorithm>
#include <cmath>

namespace Naerim::Ui::Interaction
{
    namespace
    {
        ValidationResult noActiveDrag()
        {
            return ValidationResult::rejected("No drag in progress", "Start dragging a component first", {});
        }

        ValidationResult noZoneUnderPointer()
        {
            return ValidationResult::rejected("No drop zone under pointer", "Move the component over the canvas", {});
        }

        ValidationResult rejectedByHandler()
        {
            return ValidationResult::rejected("Drop rejected by handler", "Try a different drop target", "handler");
        }

        float snapToGrid(float value, float gridSize)
        {
            return std::round(value / gridSize) * gridSize;
        }
    }

    DragDropController::DragDropController(Core::SpatialDropIndex& indexIn,
                                           Core::DropValidator& validatorIn,
                                           Canvas::FeedbackCoordinator& feedbackIn,
                                           Runtime::DropDiagnostics* diagnosticsIn,
                                           ControllerSettings settingsIn,
                                           Perf::DropPerfTracker* perfTrackerIn)
        : index(indexIn),
          validator(validatorIn),
          feedback(feedbackIn),
          diagnostics(diagnosticsIn),
          perfTracker(perfTrackerIn),
          controllerSettings(settingsIn)
    {
        controllerSettings.maxNestingDepth = std::max(0, controllerSettings.maxNestingDepth);
        controllerSettings.edgeInsertionFraction = juce::jlimit(0.0f, 0.49f, controllerSettings.edgeInsertionFraction);
        if (!(controllerSettings.gridSize > 0.0f))
            controllerSettings.gridSize = 20.0f;
    }

    DragDropController::~DragDropController()
    {
        releaseSession();
    }

    bool DragDropController::beginDrag(DragSession& session,
                                       std::optional<juce::Point<float>> pointer,
                                       std::optional<juce::Rectangle<float>> sourceBounds)
    {
        {
            const juce::ScopedLock sl(lock);
            if (activeSession != nullptr)
            {
                if (diagnostics != nullptr)
                    diagnostics->debug("Controller", "beginDrag ignored: drag already in progress id=" + activeSession->payload().id());
                return false;
            }
        }

        if (!session.start())
            return false;

        std::optional<Perf::DropPerfTracker::Scope> perfScope;
        if (perfTracker != nullptr)
            perfScope.emplace(*perfTracker, Perf::DropOperation::beginDrag);

        const auto& payload = session.payload();
        feedback.start(payload, sourceBounds, pointer);

        std::vector<ZoneId> targets;
        const auto region = index.queryRegion(index.canvasBounds(), payload.type(), false);
        for (const auto& zone : region.zones)
        {
            if (evaluate(zone, payload).isValid)
                targets.push_back(zone.id);
        }

        DragSessionObserver observer;
        observer.onGestureEnded = [this](DragSession& ended) { forgetSession(ended, false); };
        observer.onDestroyed = [this](DragSession& destroyed) { forgetSession(destroyed, true); };

        {
            const juce::ScopedLock sl(lock);
            activeSession = &session;
            sessionObserverId = session.addObserver(std::move(observer));
            hoverTarget.reset();
            currentValidTargets = targets;
        }

        if (diagnostics != nullptr)
            diagnostics->info("Controller", "drag started id=" + payload.id()
                                                + " type=" + payload.type()
                                                + " validTargets=" + juce::String(static_cast<int>(targets.size())));
        return true;
    }

    DragOverResult DragDropController::dragOver(float x, float y)
    {
        DragOverResult result;

        DragSession* session = nullptr;
        {
            const juce::ScopedLock sl(lock);
            session = activeSession;
        }

        if (session == nullptr || !session->isActive())
        {
            result.validation = noActiveDrag();
            return result;
        }

        std::optional<Perf::DropPerfTracker::Scope> perfScope;
        if (perfTracker != nullptr)
            perfScope.emplace(*perfTracker, Perf::DropOperation::dragOver);

        const auto& payload = session->payload();
        const juce::Point<float> pointer(x, y);
        result.ghostMoved = feedback.updateGhostPosition(x, y);

        auto pick = pickTarget(x, y, payload);
        result.candidates = pick.candidates;
        result.validation = pick.validation;

        if (pick.target.has_value())
        {
            const auto decision = consultDragOverHandlers(payload, *pick.target, pick.validation);
            if (decision.has_value() && !*decision)
            {
                result.overriddenByHandler = true;
                result.validation = rejectedByHandler();
                retarget(pick.target->id);
                session->updateHover(std::nullopt);
                if (feedback.zoneState(pick.target->id) != FeedbackState::invalid)
                    feedback.showInvalid(pick.target->id, result.validation.reason, pick.target->bounds);
                return result;
            }
        }
        else if (pick.rejectedZone.has_value())
        {
            const auto decision = consultDragOverHandlers(payload, *pick.rejectedZone, pick.validation);
            if (decision.has_value() && *decision)
            {
                result.overriddenByHandler = true;
                pick.target = pick.rejectedZone;
                result.validation = ValidationResult::accepted();
            }
        }

        if (pick.target.has_value())
        {
            const auto& zone = *pick.target;
            result.target = zone;
            result.insertionPoint = computeInsertionPoint(zone, pointer);
            retarget(zone.id);
            session->updateHover(zone.id);
            feedback.updateZoneFeedback(zone.id, FeedbackState::valid, zone.bounds, result.insertionPoint);
            return result;
        }

        session->updateHover(std::nullopt);

        if (pick.rejectedZone.has_value())
        {
            const auto& zone = *pick.rejectedZone;
            retarget(zone.id);
            if (feedback.zoneState(zone.id) != FeedbackState::invalid)
                feedback.showInvalid(zone.id, pick.validation.reason, zone.bounds);
        }
        else
        {
            retarget(std::nullopt);
        }

        return result;
    }

    DropOutcome DragDropController::drop(float x, float y)
    {
        DropOutcome outcome;

        DragSession* session = nullptr;
        {
            const juce::ScopedLock sl(lock);
            session = activeSession;
        }

        if (session == nullptr || !session->isActive())
        {
            outcome.validation = noActiveDrag();
            return outcome;
        }

        std::optional<Perf::DropPerfTracker::Scope> perfScope;
        if (perfTracker != nullptr)
            perfScope.emplace(*perfTracker, Perf::DropOperation::drop);

        const auto& payload = session->payload();
        const juce::Point<float> pointer(x, y);
        outcome.dropPosition = pointer;

        auto pick = pickTarget(x, y, payload);
        outcome.validation = pick.validation;

        if (pick.target.has_value())
        {
            const auto decision = consultDragOverHandlers(payload, *pick.target, pick.validation);
            if (decision.has_value() && !*decision)
            {
                pick.target.reset();
                outcome.validation = rejectedByHandler();
            }
        }
        else if (pick.rejectedZone.has_value())
        {
            const auto decision = consultDragOverHandlers(payload, *pick.rejectedZone, pick.validation);
            if (decision.has_value() && *decision)
            {
                pick.target = pick.rejectedZone;
                outcome.validation = ValidationResult::accepted();
            }
        }

        if (pick.target.has_value())
        {
            const auto& zone = *pick.target;
            outcome.target = zone;
            outcome.insertionPoint = computeInsertionPoint(zone, pointer);
            outcome.dropPosition = computeDropPosition(zone, pointer);
            outcome.success = runDropHandlers(payload, zone, outcome.dropPosition, outcome.insertionPoint);
            if (!outcome.success)
                outcome.validation = ValidationResult::rejected("Drop handler declined the drop",
                                                                "Try dropping again",
                                                                "handler");
        }

        releaseSession();
        session->complete(outcome.success);
        feedback.clearAll();

        if (diagnostics != nullptr)
            diagnostics->info("Controller", "drop id=" + payload.id()
                                                + " zone=" + (outcome.target.has_value() ? outcome.target->id : juce::String("none"))
                                                + " success=" + juce::String(outcome.success ? 1 : 0)
                                                + " reason=" + outcome.validation.reason);
        return outcome;
    }

    bool DragDropController::cancel()
    {
        auto* session = releaseSession();
        if (session == nullptr)
            return false;

        const auto cancelled = session->cancel();
        feedback.clearAll();
        return cancelled;
    }

    bool DragDropController::isDragging() const
    {
        const juce::ScopedLock sl(lock);
        return activeSession != nullptr && activeSession->isActive();
    }

    std::vector<ZoneId> DragDropController::validTargets() const
    {
        const juce::ScopedLock sl(lock);
        return currentValidTargets;
    }

    std::optional<ZoneId> DragDropController::currentTarget() const
    {
        const juce::ScopedLock sl(lock);
        return hoverTarget;
    }

    int DragDropController::addDragOverHandler(DragOverHandler handler)
    {
        const juce::ScopedLock sl(lock);
        const auto id = nextHandlerId++;
        dragOverHandlers.emplace_back(id, std::move(handler));
        return id;
    }

    int DragDropController::addDropHandler(DropHandler handler)
    {
        const juce::ScopedLock sl(lock);
        const auto id = nextHandlerId++;
        dropHandlers.emplace_back(id, std::move(handler));
        return id;
    }

    bool DragDropController::removeHandler(int handlerId)
    {
        const juce::ScopedLock sl(lock);
        const auto matches = [handlerId](const auto& entry)
        {
            return entry.first == handlerId;
        };

        const auto before = dragOverHandlers.size() + dropHandlers.size();
        dragOverHandlers.erase(std::remove_if(dragOverHandlers.begin(), dragOverHandlers.end(), matches), dragOverHandlers.end());
        dropHandlers.erase(std::remove_if(dropHandlers.begin(), dropHandlers.end(), matches), dropHandlers.end());
        return dragOverHandlers.size() + dropHandlers.size() != before;
    }

    ValidationResult DragDropController::evaluate(const DropZone& zone, const DragPayload& payload) const
    {
        auto result = validator.validate(zone, payload);
        if (!result.isValid)
            return result;

        if (zone.depth > controllerSettings.maxNestingDepth)
        {
            return ValidationResult::rejected("Maximum nesting depth (" + juce::String(controllerSettings.maxNestingDepth) + ") exceeded",
                                              "Drop into a shallower container",
                                              "max_depth");
        }

        for (const auto& ancestor : index.getHierarchy(zone.id))
        {
            if (ancestor.id == payload.sourceId())
            {
                return ValidationResult::rejected("Cannot drop a component into itself",
                                                  "Choose a target outside the dragged component",
                                                  "source");
            }
        }

        return result;
    }

    InsertionPoint DragDropController::computeInsertionPoint(const DropZone& zone, juce::Point<float> pointer) const
    {
        const auto& bounds = zone.bounds;

        switch (zone.constraints.kind)
        {
            case DropZoneKind::canvas:
                return { pointer, InsertionOrientation::point };

            case DropZoneKind::container:
            {
                const auto fraction = controllerSettings.edgeInsertionFraction;
                const auto relX = (pointer.x - bounds.getX()) / bounds.getWidth();
                const auto relY = (pointer.y - bounds.getY()) / bounds.getHeight();

                if (relY < fraction)
                    return { { bounds.getCentreX(), bounds.getY() }, InsertionOrientation::horizontal };
                if (relY > 1.0f - fraction)
                    return { { bounds.getCentreX(), bounds.getBottom() }, InsertionOrientation::horizontal };
                if (relX < fraction)
                    return { { bounds.getX(), bounds.getCentreY() }, InsertionOrientation::vertical };
                if (relX > 1.0f - fraction)
                    return { { bounds.getRight(), bounds.getCentreY() }, InsertionOrientation::vertical };

                return { bounds.getCentre(), InsertionOrientation::child };
            }

            case DropZoneKind::slot:
            case DropZoneKind::gridCell:
            case DropZoneKind::listItem:
                break;
        }

        return { bounds.getCentre(), InsertionOrientation::point };
    }

    juce::Point<float> DragDropController::computeDropPosition(const DropZone& zone, juce::Point<float> pointer) const
    {
        auto relative = pointer - zone.bounds.getPosition();
        if (controllerSettings.snapToGrid)
        {
            relative.x = snapToGrid(relative.x, controllerSettings.gridSize);
            relative.y = snapToGrid(relative.y, controllerSettings.gridSize);
        }

        return relative;
    }

    DragDropController::TargetPick DragDropController::pickTarget(float x, float y, const DragPayload& payload) const
    {
        TargetPick pick;

        const auto accepted = index.queryPoint(x, y, payload.type());
        pick.candidates = accepted.ids();

        for (const auto& zone : accepted.zones)
        {
            auto validation = evaluate(zone, payload);
            if (validation.isValid)
            {
                pick.target = zone;
                pick.validation = std::move(validation);
                return pick;
            }

            if (!pick.rejectedZone.has_value())
            {
                pick.rejectedZone = zone;
                pick.validation = std::move(validation);
            }
        }

        if (pick.rejectedZone.has_value())
            return pick;

        // Nothing accepts the type; report against the deepest zone under the pointer.
        const auto everything = index.queryPoint(x, y);
        if (everything.empty())
        {
            pick.validation = noZoneUnderPointer();
            return pick;
        }

        pick.rejectedZone = everything.zones.front();
        pick.validation = evaluate(everything.zones.front(), payload);
        return pick;
    }

    std::optional<bool> DragDropController::consultDragOverHandlers(const DragPayload& payload,
                                                                    const DropZone& zone,
                                                                    const ValidationResult& validation) const
    {
        std::vector<DragOverHandler> handlers;
        {
            const juce::ScopedLock sl(lock);
            for (const auto& entry : dragOverHandlers)
                handlers.push_back(entry.second);
        }

        std::optional<bool> decision;
        for (const auto& handler : handlers)
        {
            try
            {
                if (const auto verdict = handler(payload, zone, validation); verdict.has_value())
                    decision = verdict;
            }
            catch (const std::exception& e)
            {
                if (diagnostics != nullptr)
                    diagnostics->error("Controller", "drag-over handler threw: " + juce::String(e.what()));
            }
            catch (...)
            {
                if (diagnostics != nullptr)
                    diagnostics->error("Controller", "drag-over handler threw a non-standard exception");
            }
        }

        return decision;
    }

    bool DragDropController::runDropHandlers(const DragPayload& payload,
                                             const DropZone& zone,
                                             juce::Point<float> position,
                                             const std::optional<InsertionPoint>& insertionPoint) const
    {
        std::vector<DropHandler> handlers;
        {
            const juce::ScopedLock sl(lock);
            for (const auto& entry : dropHandlers)
                handlers.push_back(entry.second);
        }

        for (const auto& handler : handlers)
        {
            try
            {
                if (!handler(payload, zone, position, insertionPoint))
                    return false;
            }
            catch (const std::exception& e)
            {
                if (diagnostics != nullptr)
                    diagnostics->error("Controller", "drop handler threw: " + juce::String(e.what()));
                return false;
            }
            catch (...)
            {
                if (diagnostics != nullptr)
                    diagnostics->error("Controller", "drop handler threw a non-standard exception");
                return false;
            }
        }

        return true;
    }

    void DragDropController::retarget(const std::optional<ZoneId>& nextTarget)
    {
        std::optional<ZoneId> previous;
        {
            const juce::ScopedLock sl(lock);
            if (hoverTarget == nextTarget)
                return;

            previous = hoverTarget;
            hoverTarget = nextTarget;
        }

        if (previous.has_value())
            feedback.clearZone(*previous);
    }

    DragSession* DragDropController::releaseSession()
    {
        DragSession* session = nullptr;
        int observerId = 0;
        {
            const juce::ScopedLock sl(lock);
            session = activeSession;
            observerId = sessionObserverId;
            activeSession = nullptr;
            sessionObserverId = 0;
            hoverTarget.reset();
            currentValidTargets.clear();
        }

        if (session != nullptr)
            session->removeObserver(observerId);
        return session;
    }

    // The session finished or died without going through drop() or cancel().
    void DragDropController::forgetSession(DragSession& session, bool destroyed)
    {
        int observerId = 0;
        {
            const juce::ScopedLock sl(lock);
            if (activeSession != &session)
                return;

            observerId = sessionObserverId;
            activeSession = nullptr;
            sessionObserverId = 0;
            hoverTarget.reset();
            currentValidTargets.clear();
        }

        if (!destroyed)
            session.removeObserver(observerId);

        feedback.clearAll();

        if (diagnostics != nullptr)
            diagnostics->info("Controller", "drag ended outside the controller id=" + session.payload().id()
                                                + (destroyed ? " (session destroyed)" : ""));
    }
}
