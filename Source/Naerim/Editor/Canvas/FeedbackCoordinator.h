#pragma once

#include "Naerim/Public/DragPayload.h"
#include "Naerim/Public/EngineConfig.h"
#include "Naerim/Public/Types.h"
#include "Naerim/Runtime/TaskScheduler.h"
#include <map>
#include <optional>
#include <vector>

namespace Naerim::Runtime
{
    class AccessibilityAnnouncer;
    class DropDiagnostics;
}

namespace Naerim::Ui::Canvas
{
    enum class OverlayKind
    {
        ghost,
        highlight,
        insertionIndicator,
        invalidMarker
    };

    juce::String overlayKindToString(OverlayKind kind);

    struct FeedbackOverlay
    {
        OverlayKind kind = OverlayKind::highlight;
        std::optional<ZoneId> zoneId;
        juce::Rectangle<float> bounds;
        FeedbackState state = FeedbackState::hover;
        juce::Colour colour;
        float opacity = 1.0f;
        float scale = 1.0f;
        juce::String label;
    };

    struct FeedbackStats
    {
        int zoneUpdates = 0;
        int ghostUpdatesApplied = 0;
        int ghostUpdatesThrottled = 0;
        int invalidMarkersShown = 0;
        int invalidMarkersExpired = 0;
        double averageRenderMs = 0.0;
        int slowRenders = 0;
        int activeOverlays = 0;
        int pendingRemovals = 0;
    };

    // Transient drag feedback. The renderer pulls activeOverlays() each frame;
    // nothing here paints.
    class FeedbackCoordinator
    {
    public:
        static constexpr float kHighlightExpansion = 2.0f;
        static constexpr float kIndicatorLength = 40.0f;
        static constexpr float kMaxGhostWidth = 200.0f;
        static constexpr float kMaxGhostHeight = 100.0f;
        static constexpr float kDefaultGhostWidth = 100.0f;
        static constexpr float kDefaultGhostHeight = 40.0f;

        FeedbackCoordinator(Runtime::TaskScheduler& schedulerIn,
                            Runtime::AccessibilityAnnouncer* announcerIn = nullptr,
                            Runtime::DropDiagnostics* diagnosticsIn = nullptr,
                            FeedbackSettings settingsIn = {});
        ~FeedbackCoordinator();

        FeedbackCoordinator(const FeedbackCoordinator&) = delete;
        FeedbackCoordinator& operator=(const FeedbackCoordinator&) = delete;

        void start(const DragPayload& payload,
                   std::optional<juce::Rectangle<float>> sourceBounds = std::nullopt,
                   std::optional<juce::Point<float>> pointer = std::nullopt);

        void updateZoneFeedback(const ZoneId& zoneId,
                                FeedbackState state,
                                std::optional<juce::Rectangle<float>> bounds = std::nullopt,
                                std::optional<InsertionPoint> insertionPoint = std::nullopt);

        // Returns false when the update was throttled or no ghost is active.
        bool updateGhostPosition(float x, float y);

        void showInvalid(const ZoneId& zoneId,
                         const juce::String& reason,
                         std::optional<juce::Rectangle<float>> bounds = std::nullopt);

        void clearZone(const ZoneId& zoneId);
        void clearAll();

        [[nodiscard]] std::vector<FeedbackOverlay> activeOverlays() const;
        [[nodiscard]] std::optional<FeedbackOverlay> ghost() const;
        [[nodiscard]] std::optional<FeedbackState> zoneState(const ZoneId& zoneId) const;
        [[nodiscard]] FeedbackStats stats() const;
        [[nodiscard]] const FeedbackSettings& settings() const noexcept { return feedbackSettings; }

        static juce::Rectangle<float> ghostSizeFor(std::optional<juce::Rectangle<float>> sourceBounds);
        static juce::Rectangle<float> indicatorBounds(const InsertionPoint& insertionPoint, float lineWidth);

    private:
        struct MarkerEntry
        {
            FeedbackOverlay overlay;
            std::uint64_t serial = 0;
            Runtime::ScheduledTask removal;
        };

        juce::Colour colourFor(FeedbackState state) const noexcept;
        void expireMarker(const ZoneId& zoneId, std::uint64_t serial, std::uint64_t ownerGeneration);
        void recordRenderTime(double elapsedMs);
        void announce(const juce::String& message) const;

        Runtime::TaskScheduler& scheduler;
        Runtime::AccessibilityAnnouncer* announcer = nullptr;
        Runtime::DropDiagnostics* diagnostics = nullptr;
        const FeedbackSettings feedbackSettings;

        mutable juce::CriticalSection lock;
        std::optional<FeedbackOverlay> ghostOverlay;
        std::optional<double> lastGhostUpdateMs;
        std::map<ZoneId, FeedbackOverlay> highlights;
        std::map<ZoneId, FeedbackOverlay> indicators;
        std::map<ZoneId, MarkerEntry> markers;
        std::map<ZoneId, FeedbackState> zoneStates;
        std::uint64_t generation = 0;
        std::uint64_t nextMarkerSerial = 1;

        FeedbackStats counters;
        int renderSamples = 0;

        Runtime::TaskOwnerGuard ownerGuard;
    };
}
