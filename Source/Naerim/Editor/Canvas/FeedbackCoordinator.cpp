#include "Naerim/Editor/Canvas/FeedbackCoordinator.h"

#include "Naerim/Runtime/AccessibilityAnnouncer.h"
#include "Naerim/Runtime/DropDiagnostics.h"
#include <algorithm>

namespace Naerim::Ui::Canvas
{
    namespace
    {
        constexpr auto kSource = "feedback";
        constexpr double kRenderSmoothing = 0.1;

        FeedbackSettings normalized(FeedbackSettings settings) noexcept
        {
            settings.fpsLimit = juce::jlimit(30, 120, settings.fpsLimit);
            settings.invalidMarkerMs = std::max(0, settings.invalidMarkerMs);
            settings.insertionLineWidth = std::max(0.5f, settings.insertionLineWidth);
            return settings;
        }
    }

    juce::String overlayKindToString(OverlayKind kind)
    {
        switch (kind)
        {
            case OverlayKind::ghost: return "ghost";
            case OverlayKind::highlight: return "highlight";
            case OverlayKind::insertionIndicator: return "insertion_indicator";
            case OverlayKind::invalidMarker: return "invalid_marker";
        }

        return "unknown";
    }

    FeedbackCoordinator::FeedbackCoordinator(Runtime::TaskScheduler& schedulerIn,
                                             Runtime::AccessibilityAnnouncer* announcerIn,
                                             Runtime::DropDiagnostics* diagnosticsIn,
                                             FeedbackSettings settingsIn)
        : scheduler(schedulerIn),
          announcer(announcerIn),
          diagnostics(diagnosticsIn),
          feedbackSettings(normalized(settingsIn))
    {
    }

    FeedbackCoordinator::~FeedbackCoordinator()
    {
        ownerGuard.revoke();

        const juce::ScopedLock sl(lock);
        for (auto& entry : markers)
            entry.second.removal.cancel();
    }

    void FeedbackCoordinator::start(const DragPayload& payload,
                                    std::optional<juce::Rectangle<float>> sourceBounds,
                                    std::optional<juce::Point<float>> pointer)
    {
        clearAll();

        const auto size = ghostSizeFor(sourceBounds);
        juce::Point<float> anchor;
        if (pointer.has_value())
            anchor = *pointer;
        else if (sourceBounds.has_value())
            anchor = sourceBounds->getPosition();

        FeedbackOverlay overlay;
        overlay.kind = OverlayKind::ghost;
        overlay.bounds = size.withPosition(anchor.x + feedbackSettings.ghostOffsetX,
                                           anchor.y + feedbackSettings.ghostOffsetY);
        overlay.state = FeedbackState::hover;
        overlay.colour = feedbackSettings.hoverHighlightColour;
        overlay.opacity = feedbackSettings.ghostOpacity;
        overlay.scale = feedbackSettings.ghostScale;
        overlay.label = payload.name();

        {
            const juce::ScopedLock sl(lock);
            ghostOverlay = overlay;
            lastGhostUpdateMs.reset();
        }

        announce("Started dragging " + payload.name() + " component from library");
    }

    void FeedbackCoordinator::updateZoneFeedback(const ZoneId& zoneId,
                                                 FeedbackState state,
                                                 std::optional<juce::Rectangle<float>> bounds,
                                                 std::optional<InsertionPoint> insertionPoint)
    {
        const auto startedMs = juce::Time::getMillisecondCounterHiRes();
        bool stateChanged = false;

        {
            const juce::ScopedLock sl(lock);
            counters.zoneUpdates += 1;

            const auto previous = zoneStates.find(zoneId);
            stateChanged = previous == zoneStates.end() || previous->second != state;
            zoneStates[zoneId] = state;

            if (bounds.has_value())
            {
                FeedbackOverlay highlight;
                highlight.kind = OverlayKind::highlight;
                highlight.zoneId = zoneId;
                highlight.bounds = bounds->expanded(kHighlightExpansion);
                highlight.state = state;
                highlight.colour = colourFor(state);
                highlight.opacity = feedbackSettings.highlightOpacity;
                highlight.label = feedbackStateToString(state);
                highlights[zoneId] = highlight;
            }
            else
            {
                highlights.erase(zoneId);
            }

            if (insertionPoint.has_value() && state != FeedbackState::invalid)
            {
                FeedbackOverlay indicator;
                indicator.kind = OverlayKind::insertionIndicator;
                indicator.zoneId = zoneId;
                indicator.bounds = indicatorBounds(*insertionPoint, feedbackSettings.insertionLineWidth);
                indicator.state = state;
                indicator.colour = feedbackSettings.insertionLineColour;
                indicator.opacity = 1.0f;
                indicators[zoneId] = indicator;
            }
            else
            {
                indicators.erase(zoneId);
            }
        }

        recordRenderTime(juce::Time::getMillisecondCounterHiRes() - startedMs);

        if (!stateChanged)
            return;

        switch (state)
        {
            case FeedbackState::valid: announce("Valid drop zone: " + zoneId); break;
            case FeedbackState::invalid: announce("Invalid drop zone"); break;
            case FeedbackState::hover: announce("Hovering over " + zoneId); break;
        }
    }

    bool FeedbackCoordinator::updateGhostPosition(float x, float y)
    {
        const auto nowMs = scheduler.nowMs();

        const juce::ScopedLock sl(lock);
        if (!ghostOverlay.has_value())
            return false;

        if (lastGhostUpdateMs.has_value() && nowMs - *lastGhostUpdateMs < feedbackSettings.frameBudgetMs())
        {
            counters.ghostUpdatesThrottled += 1;
            return false;
        }

        ghostOverlay->bounds.setPosition(x + feedbackSettings.ghostOffsetX, y + feedbackSettings.ghostOffsetY);
        lastGhostUpdateMs = nowMs;
        counters.ghostUpdatesApplied += 1;
        return true;
    }

    void FeedbackCoordinator::showInvalid(const ZoneId& zoneId,
                                          const juce::String& reason,
                                          std::optional<juce::Rectangle<float>> bounds)
    {
        {
            const juce::ScopedLock sl(lock);
            zoneStates[zoneId] = FeedbackState::invalid;
            indicators.erase(zoneId);

            auto markerBounds = bounds.value_or(juce::Rectangle<float>());
            if (bounds.has_value())
            {
                FeedbackOverlay highlight;
                highlight.kind = OverlayKind::highlight;
                highlight.zoneId = zoneId;
                highlight.bounds = bounds->expanded(kHighlightExpansion);
                highlight.state = FeedbackState::invalid;
                highlight.colour = colourFor(FeedbackState::invalid);
                highlight.opacity = feedbackSettings.highlightOpacity;
                highlight.label = feedbackStateToString(FeedbackState::invalid);
                highlights[zoneId] = highlight;
            }
            else if (const auto existing = highlights.find(zoneId); existing != highlights.end())
            {
                existing->second.state = FeedbackState::invalid;
                existing->second.colour = colourFor(FeedbackState::invalid);
                existing->second.label = feedbackStateToString(FeedbackState::invalid);
                markerBounds = existing->second.bounds.reduced(kHighlightExpansion);
            }

            if (const auto previous = markers.find(zoneId); previous != markers.end())
                previous->second.removal.cancel();

            MarkerEntry entry;
            entry.serial = nextMarkerSerial++;
            entry.overlay.kind = OverlayKind::invalidMarker;
            entry.overlay.zoneId = zoneId;
            entry.overlay.bounds = markerBounds;
            entry.overlay.state = FeedbackState::invalid;
            entry.overlay.colour = colourFor(FeedbackState::invalid);
            entry.overlay.opacity = 1.0f;
            entry.overlay.label = reason;

            const auto serial = entry.serial;
            const auto ownerGeneration = generation;
            entry.removal = scheduler.schedule(feedbackSettings.invalidMarkerMs,
                                               ownerGuard.wrap([this, zoneId, serial, ownerGeneration]
                                                               {
                                                                   expireMarker(zoneId, serial, ownerGeneration);
                                                               }),
                                               "feedback.invalid_marker");
            markers[zoneId] = std::move(entry);
            counters.invalidMarkersShown += 1;
        }

        if (diagnostics != nullptr)
            diagnostics->debug("Feedback", "invalid zone=" + zoneId + " reason=" + reason);

        announce("Drop not allowed: " + reason);
    }

    void FeedbackCoordinator::clearZone(const ZoneId& zoneId)
    {
        bool removed = false;
        {
            const juce::ScopedLock sl(lock);
            removed = highlights.erase(zoneId) > 0;
            removed = indicators.erase(zoneId) > 0 || removed;
            zoneStates.erase(zoneId);

            if (const auto marker = markers.find(zoneId); marker != markers.end())
            {
                marker->second.removal.cancel();
                markers.erase(marker);
                removed = true;
            }
        }

        if (removed)
            announce("Left drop zone " + zoneId);
    }

    void FeedbackCoordinator::clearAll()
    {
        bool hadFeedback = false;
        {
            const juce::ScopedLock sl(lock);
            hadFeedback = ghostOverlay.has_value() || !highlights.empty() || !indicators.empty() || !markers.empty();

            for (auto& entry : markers)
                entry.second.removal.cancel();

            ghostOverlay.reset();
            lastGhostUpdateMs.reset();
            highlights.clear();
            indicators.clear();
            markers.clear();
            zoneStates.clear();
            generation += 1;
        }

        if (hadFeedback)
            announce("Drag feedback cleared");
    }

    std::vector<FeedbackOverlay> FeedbackCoordinator::activeOverlays() const
    {
        const juce::ScopedLock sl(lock);
        std::vector<FeedbackOverlay> overlays;
        overlays.reserve(highlights.size() + indicators.size() + markers.size() + 1);

        for (const auto& entry : highlights)
            overlays.push_back(entry.second);
        for (const auto& entry : indicators)
            overlays.push_back(entry.second);
        for (const auto& entry : markers)
            overlays.push_back(entry.second.overlay);
        if (ghostOverlay.has_value())
            overlays.push_back(*ghostOverlay);

        return overlays;
    }

    std::optional<FeedbackOverlay> FeedbackCoordinator::ghost() const
    {
        const juce::ScopedLock sl(lock);
        return ghostOverlay;
    }

    std::optional<FeedbackState> FeedbackCoordinator::zoneState(const ZoneId& zoneId) const
    {
        const juce::ScopedLock sl(lock);
        if (const auto it = zoneStates.find(zoneId); it != zoneStates.end())
            return it->second;
        return std::nullopt;
    }

    FeedbackStats FeedbackCoordinator::stats() const
    {
        const juce::ScopedLock sl(lock);
        auto result = counters;
        result.activeOverlays = static_cast<int>(highlights.size() + indicators.size() + markers.size())
                              + (ghostOverlay.has_value() ? 1 : 0);
        result.pendingRemovals = static_cast<int>(std::count_if(markers.begin(),
                                                                markers.end(),
                                                                [](const auto& entry)
                                                                {
                                                                    return entry.second.removal.isPending();
                                                                }));
        return result;
    }

    juce::Rectangle<float> FeedbackCoordinator::ghostSizeFor(std::optional<juce::Rectangle<float>> sourceBounds)
    {
        if (!sourceBounds.has_value() || !isPositiveBounds(*sourceBounds))
            return { kDefaultGhostWidth, kDefaultGhostHeight };

        return { std::min(kMaxGhostWidth, sourceBounds->getWidth()),
                 std::min(kMaxGhostHeight, sourceBounds->getHeight()) };
    }

    juce::Rectangle<float> FeedbackCoordinator::indicatorBounds(const InsertionPoint& insertionPoint, float lineWidth)
    {
        const auto& p = insertionPoint.position;
        const auto half = kIndicatorLength * 0.5f;

        if (insertionPoint.orientation == InsertionOrientation::vertical)
            return { p.x - lineWidth * 0.5f, p.y - half, lineWidth, kIndicatorLength };

        return { p.x - half, p.y - lineWidth * 0.5f, kIndicatorLength, lineWidth };
    }

    juce::Colour FeedbackCoordinator::colourFor(FeedbackState state) const noexcept
    {
        switch (state)
        {
            case FeedbackState::valid: return feedbackSettings.validHighlightColour;
            case FeedbackState::invalid: return feedbackSettings.invalidHighlightColour;
            case FeedbackState::hover: return feedbackSettings.hoverHighlightColour;
        }

        return feedbackSettings.hoverHighlightColour;
    }

    void FeedbackCoordinator::expireMarker(const ZoneId& zoneId, std::uint64_t serial, std::uint64_t ownerGeneration)
    {
        {
            const juce::ScopedLock sl(lock);
            if (ownerGeneration != generation)
                return;

            const auto marker = markers.find(zoneId);
            if (marker == markers.end() || marker->second.serial != serial)
                return;

            markers.erase(marker);
            counters.invalidMarkersExpired += 1;
        }

        announce("Invalid marker cleared for " + zoneId);
    }

    void FeedbackCoordinator::recordRenderTime(double elapsedMs)
    {
        bool slow = false;
        {
            const juce::ScopedLock sl(lock);
            if (renderSamples == 0)
                counters.averageRenderMs = elapsedMs;
            else
                counters.averageRenderMs = kRenderSmoothing * elapsedMs + (1.0 - kRenderSmoothing) * counters.averageRenderMs;
            renderSamples += 1;

            slow = elapsedMs > feedbackSettings.frameBudgetMs();
            if (slow)
                counters.slowRenders += 1;
        }

        if (slow && diagnostics != nullptr)
            diagnostics->warning("Feedback", "zone feedback update took " + juce::String(elapsedMs, 2) + " ms");
    }

    void FeedbackCoordinator::announce(const juce::String& message) const
    {
        if (announcer != nullptr)
            announcer->announce(kSource, message);
    }
}
