#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <cmath>
#include <optional>

namespace Naerim
{
    enum class LogLevel
    {
        off,
        error,
        warning,
        info,
        debug
    };

    inline juce::String logLevelToKey(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::off: return "off";
            case LogLevel::error: return "error";
            case LogLevel::warning: return "warning";
            case LogLevel::info: return "info";
            case LogLevel::debug: return "debug";
        }

        return "off";
    }

    inline std::optional<LogLevel> logLevelFromKey(const juce::String& value)
    {
        const auto normalized = value.trim().toLowerCase();
        if (normalized == "off") return LogLevel::off;
        if (normalized == "error") return LogLevel::error;
        if (normalized == "warning" || normalized == "warn") return LogLevel::warning;
        if (normalized == "info") return LogLevel::info;
        if (normalized == "debug" || normalized == "trace") return LogLevel::debug;
        return std::nullopt;
    }

    struct DiagnosticsSettings
    {
        LogLevel logLevel = LogLevel::warning;
        int queryLogStride = 30;
    };

    struct IndexSettings
    {
        int maxCacheEntries = 1000;
        int gridThreshold = 256;
        float gridCellSize = 64.0f;
    };

    struct FeedbackSettings
    {
        juce::Colour validHighlightColour { 0xff5e6ad2 };
        juce::Colour invalidHighlightColour { 0xffef4444 };
        juce::Colour hoverHighlightColour { 0xff06b6d4 };
        float highlightOpacity = 0.2f;

        juce::Colour insertionLineColour { 0xff5e6ad2 };
        float insertionLineWidth = 2.0f;

        float ghostOpacity = 0.7f;
        float ghostScale = 0.9f;
        float ghostOffsetX = 10.0f;
        float ghostOffsetY = 10.0f;

        int fpsLimit = 60;
        int invalidMarkerMs = 1000;

        double frameBudgetMs() const noexcept
        {
            return 1000.0 / static_cast<double>(fpsLimit > 0 ? fpsLimit : 60);
        }
    };

    struct SessionSettings
    {
        int cancelResetDelayMs = 100;
        double durationSmoothing = 0.1;
    };

    struct ControllerSettings
    {
        int maxNestingDepth = 10;
        float edgeInsertionFraction = 0.2f;
        bool snapToGrid = false;
        float gridSize = 20.0f;
    };

    struct EngineConfig
    {
        IndexSettings index;
        FeedbackSettings feedback;
        SessionSettings session;
        ControllerSettings controller;
        DiagnosticsSettings diagnostics;
    };

    inline juce::Result validateEngineConfig(const EngineConfig& config)
    {
        if (config.index.maxCacheEntries < 2)
            return juce::Result::fail("index.max_cache_entries must be >= 2");
        if (config.index.gridThreshold < 0)
            return juce::Result::fail("index.grid_threshold must be >= 0");
        if (!std::isfinite(config.index.gridCellSize) || config.index.gridCellSize <= 1.0f)
            return juce::Result::fail("index.grid_cell_size must be > 1");

        const auto& feedback = config.feedback;
        if (!(feedback.highlightOpacity >= 0.0f && feedback.highlightOpacity <= 1.0f))
            return juce::Result::fail("feedback.highlight_opacity must be within [0, 1]");
        if (!(feedback.ghostOpacity >= 0.0f && feedback.ghostOpacity <= 1.0f))
            return juce::Result::fail("feedback.ghost_opacity must be within [0, 1]");
        if (!std::isfinite(feedback.ghostScale) || feedback.ghostScale <= 0.0f)
            return juce::Result::fail("feedback.ghost_scale must be > 0");
        if (!std::isfinite(feedback.ghostOffsetX) || !std::isfinite(feedback.ghostOffsetY))
            return juce::Result::fail("feedback ghost offset must be finite");
        if (!std::isfinite(feedback.insertionLineWidth) || feedback.insertionLineWidth <= 0.0f)
            return juce::Result::fail("feedback.insertion_line_width must be > 0");
        if (feedback.fpsLimit < 30 || feedback.fpsLimit > 120)
            return juce::Result::fail("feedback.fps_limit must be within [30, 120]");
        if (feedback.invalidMarkerMs < 0)
            return juce::Result::fail("feedback.invalid_marker_ms must be >= 0");

        if (config.session.cancelResetDelayMs < 0)
            return juce::Result::fail("session.cancel_reset_delay_ms must be >= 0");
        if (!(config.session.durationSmoothing > 0.0 && config.session.durationSmoothing <= 1.0))
            return juce::Result::fail("session.duration_smoothing must be within (0, 1]");

        if (config.controller.maxNestingDepth < 0)
            return juce::Result::fail("controller.max_nesting_depth must be >= 0");
        if (!(config.controller.edgeInsertionFraction >= 0.0f && config.controller.edgeInsertionFraction < 0.5f))
            return juce::Result::fail("controller.edge_insertion_fraction must be within [0, 0.5)");
        if (!std::isfinite(config.controller.gridSize) || config.controller.gridSize <= 0.0f)
            return juce::Result::fail("controller.grid_size must be > 0");

        if (config.diagnostics.queryLogStride < 1)
            return juce::Result::fail("diagnostics.query_log_stride must be >= 1");

        return juce::Result::ok();
    }
}
