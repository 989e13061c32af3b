#pragma once

#include "Naerim/Public/DragPayload.h"
#include "Naerim/Public/EngineConfig.h"
#include "Naerim/Public/Types.h"
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace Naerim::Core
{
    class DropValidator;
    class SpatialDropIndex;
}

namespace Naerim::Runtime
{
    class DropDiagnostics;
}

namespace Naerim::Ui::Canvas
{
    class FeedbackCoordinator;
}

namespace Naerim::Ui::Perf
{
    class DropPerfTracker;
}

namespace Naerim::Ui::Interaction
{
    class DragSession;

    struct DragOverResult
    {
        std::optional<DropZone> target;
        ValidationResult validation;
        std::optional<InsertionPoint> insertionPoint;
        std::vector<ZoneId> candidates;
        bool ghostMoved = false;
        bool overriddenByHandler = false;
    };

    struct DropOutcome
    {
        bool success = false;
        std::optional<DropZone> target;
        ValidationResult validation;
        juce::Point<float> dropPosition;
        std::optional<InsertionPoint> insertionPoint;
    };

    // Returning std::nullopt keeps the validator's decision.
    using DragOverHandler = std::function<std::optional<bool>(const DragPayload&, const DropZone&, const ValidationResult&)>;
    using DropHandler = std::function<bool(const DragPayload&, const DropZone&, juce::Point<float>, const std::optional<InsertionPoint>&)>;

    class DragDropController
    {
    public:
        DragDropController(Core::SpatialDropIndex& indexIn,
                           Core::DropValidator& validatorIn,
                           Canvas::FeedbackCoordinator& feedbackIn,
                           Runtime::DropDiagnostics* diagnosticsIn = nullptr,
                           ControllerSettings settingsIn = {},
                           Perf::DropPerfTracker* perfTrackerIn = nullptr);
        ~DragDropController();

        DragDropController(const DragDropController&) = delete;
        DragDropController& operator=(const DragDropController&) = delete;

        bool beginDrag(DragSession& session,
                       std::optional<juce::Point<float>> pointer = std::nullopt,
                       std::optional<juce::Rectangle<float>> sourceBounds = std::nullopt);
        DragOverResult dragOver(float x, float y);
        DropOutcome drop(float x, float y);
        bool cancel();

        [[nodiscard]] bool isDragging() const;
        [[nodiscard]] std::vector<ZoneId> validTargets() const;
        [[nodiscard]] std::optional<ZoneId> currentTarget() const;

        int addDragOverHandler(DragOverHandler handler);
        int addDropHandler(DropHandler handler);
        bool removeHandler(int handlerId);

        // Validator rules plus nesting depth and self-drop checks.
        ValidationResult evaluate(const DropZone& zone, const DragPayload& payload) const;
        InsertionPoint computeInsertionPoint(const DropZone& zone, juce::Point<float> pointer) const;
        juce::Point<float> computeDropPosition(const DropZone& zone, juce::Point<float> pointer) const;

    private:
        struct TargetPick
        {
            std::optional<DropZone> target;
            ValidationResult validation;
            std::vector<ZoneId> candidates;
            std::optional<DropZone> rejectedZone;
        };

        TargetPick pickTarget(float x, float y, const DragPayload& payload) const;
        std::optional<bool> consultDragOverHandlers(const DragPayload& payload,
                                                    const DropZone& zone,
                                                    const ValidationResult& validation) const;
        bool runDropHandlers(const DragPayload& payload,
                             const DropZone& zone,
                             juce::Point<float> position,
                             const std::optional<InsertionPoint>& insertionPoint) const;
        void retarget(const std::optional<ZoneId>& nextTarget);
        DragSession* releaseSession();
        void forgetSession(DragSession& session, bool destroyed);

        Core::SpatialDropIndex& index;
        Core::DropValidator& validator;
        Canvas::FeedbackCoordinator& feedback;
        Runtime::DropDiagnostics* diagnostics = nullptr;
        Perf::DropPerfTracker* perfTracker = nullptr;
        ControllerSettings controllerSettings;

        mutable juce::CriticalSection lock;
        DragSession* activeSession = nullptr;
        int sessionObserverId = 0;
        std::optional<ZoneId> hoverTarget;
        std::vector<ZoneId> currentValidTargets;
        std::vector<std::pair<int, DragOverHandler>> dragOverHandlers;
        std::vector<std::pair<int, DropHandler>> dropHandlers;
        int nextHandlerId = 1;
    };
}
