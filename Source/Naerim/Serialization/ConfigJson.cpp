#include "Naerim/Serialization/ConfigJson.h"

#include "Naerim/Serialization/JsonFields.h"
#include <memory>

namespace Naerim::Serialization
{
    namespace
    {
        template <typename Target, typename Parsed>
        void assignIfSet(Target& target, const std::optional<Parsed>& parsed)
        {
            if (parsed.has_value())
                target = static_cast<Target>(*parsed);
        }

        juce::Result sectionProps(const juce::NamedValueSet& root,
                                  const juce::Identifier& key,
                                  const juce::NamedValueSet*& propsOut)
        {
            propsOut = nullptr;
            if (!root.contains(key))
                return juce::Result::ok();

            const auto* object = root[key].getDynamicObject();
            if (object == nullptr)
                return juce::Result::fail(key.toString() + " must be object");

            propsOut = &object->getProperties();
            return juce::Result::ok();
        }

        juce::Result parseColour(const juce::NamedValueSet& props,
                                 const juce::Identifier& key,
                                 juce::Colour& out,
                                 const juce::String& context)
        {
            std::optional<juce::String> text;
            if (auto result = Fields::parseOptionalString(props, key, text, context); result.failed())
                return result;
            if (!text.has_value())
                return juce::Result::ok();

            const auto colour = colourFromString(*text);
            if (!colour.has_value())
                return juce::Result::fail(Fields::describe(context, key) + " must be #RRGGBB or #AARRGGBB");

            out = *colour;
            return juce::Result::ok();
        }

        juce::Result parseIndex(const juce::NamedValueSet& props, IndexSettings& settings)
        {
            std::optional<int> maxCacheEntries;
            std::optional<int> gridThreshold;
            std::optional<float> gridCellSize;

            if (auto result = Fields::parseOptionalInt(props, "max_cache_entries", maxCacheEntries, "index"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalInt(props, "grid_threshold", gridThreshold, "index"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "grid_cell_size", gridCellSize, "index"); result.failed())
                return result;

            assignIfSet(settings.maxCacheEntries, maxCacheEntries);
            assignIfSet(settings.gridThreshold, gridThreshold);
            assignIfSet(settings.gridCellSize, gridCellSize);
            return juce::Result::ok();
        }

        juce::Result parseFeedback(const juce::NamedValueSet& props, FeedbackSettings& settings)
        {
            if (auto result = parseColour(props, "valid_colour", settings.validHighlightColour, "feedback"); result.failed())
                return result;
            if (auto result = parseColour(props, "invalid_colour", settings.invalidHighlightColour, "feedback"); result.failed())
                return result;
            if (auto result = parseColour(props, "hover_colour", settings.hoverHighlightColour, "feedback"); result.failed())
                return result;
            if (auto result = parseColour(props, "insertion_line_colour", settings.insertionLineColour, "feedback"); result.failed())
                return result;

            std::optional<float> highlightOpacity;
            std::optional<float> insertionLineWidth;
            std::optional<float> ghostOpacity;
            std::optional<float> ghostScale;
            std::optional<float> ghostOffsetX;
            std::optional<float> ghostOffsetY;
            std::optional<int> fpsLimit;
            std::optional<int> invalidMarkerMs;

            if (auto result = Fields::parseOptionalFloat(props, "highlight_opacity", highlightOpacity, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "insertion_line_width", insertionLineWidth, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "ghost_opacity", ghostOpacity, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "ghost_scale", ghostScale, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "ghost_offset_x", ghostOffsetX, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "ghost_offset_y", ghostOffsetY, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalInt(props, "fps_limit", fpsLimit, "feedback"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalInt(props, "invalid_marker_ms", invalidMarkerMs, "feedback"); result.failed())
                return result;

            assignIfSet(settings.highlightOpacity, highlightOpacity);
            assignIfSet(settings.insertionLineWidth, insertionLineWidth);
            assignIfSet(settings.ghostOpacity, ghostOpacity);
            assignIfSet(settings.ghostScale, ghostScale);
            assignIfSet(settings.ghostOffsetX, ghostOffsetX);
            assignIfSet(settings.ghostOffsetY, ghostOffsetY);
            assignIfSet(settings.fpsLimit, fpsLimit);
            assignIfSet(settings.invalidMarkerMs, invalidMarkerMs);
            return juce::Result::ok();
        }

        juce::Result parseSession(const juce::NamedValueSet& props, SessionSettings& settings)
        {
            std::optional<int> cancelResetDelayMs;
            std::optional<float> durationSmoothing;

            if (auto result = Fields::parseOptionalInt(props, "cancel_reset_delay_ms", cancelResetDelayMs, "session"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "duration_smoothing", durationSmoothing, "session"); result.failed())
                return result;

            assignIfSet(settings.cancelResetDelayMs, cancelResetDelayMs);
            assignIfSet(settings.durationSmoothing, durationSmoothing);
            return juce::Result::ok();
        }

        juce::Result parseController(const juce::NamedValueSet& props, ControllerSettings& settings)
        {
            std::optional<int> maxNestingDepth;
            std::optional<float> edgeInsertionFraction;
            std::optional<bool> snapToGrid;
            std::optional<float> gridSize;

            if (auto result = Fields::parseOptionalInt(props, "max_nesting_depth", maxNestingDepth, "controller"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "edge_insertion_fraction", edgeInsertionFraction, "controller"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalBool(props, "snap_to_grid", snapToGrid, "controller"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalFloat(props, "grid_size", gridSize, "controller"); result.failed())
                return result;

            assignIfSet(settings.maxNestingDepth, maxNestingDepth);
            assignIfSet(settings.edgeInsertionFraction, edgeInsertionFraction);
            assignIfSet(settings.snapToGrid, snapToGrid);
            assignIfSet(settings.gridSize, gridSize);
            return juce::Result::ok();
        }

        juce::Result parseDiagnostics(const juce::NamedValueSet& props, DiagnosticsSettings& settings)
        {
            std::optional<juce::String> logLevel;
            std::optional<int> queryLogStride;

            if (auto result = Fields::parseOptionalString(props, "log_level", logLevel, "diagnostics"); result.failed())
                return result;
            if (auto result = Fields::parseOptionalInt(props, "query_log_stride", queryLogStride, "diagnostics"); result.failed())
                return result;

            if (logLevel.has_value())
            {
                const auto level = logLevelFromKey(*logLevel);
                if (!level.has_value())
                    return juce::Result::fail("diagnostics.log_level is unknown: " + *logLevel);
                settings.logLevel = *level;
            }

            assignIfSet(settings.queryLogStride, queryLogStride);
            return juce::Result::ok();
        }
    }

    std::optional<juce::Colour> colourFromString(const juce::String& text)
    {
        auto hex = text.trim();
        if (hex.startsWithChar('#'))
            hex = hex.substring(1);

        if (hex.isEmpty() || !hex.containsOnly("0123456789abcdefABCDEF"))
            return std::nullopt;
        if (hex.length() == 6)
            hex = "ff" + hex;
        if (hex.length() != 8)
            return std::nullopt;

        return juce::Colour(static_cast<juce::uint32>(hex.getHexValue64()));
    }

    juce::String colourToString(juce::Colour colour)
    {
        return "#" + colour.toDisplayString(colour.getAlpha() != 0xff);
    }

    juce::Result engineConfigFromVar(const juce::var& record, EngineConfig& configInOut)
    {
        if (auto result = Fields::requireObject(record, "config"); result.failed())
            return result;

        const auto& root = record.getDynamicObject()->getProperties();
        auto next = configInOut;

        const juce::NamedValueSet* props = nullptr;
        if (auto result = sectionProps(root, "index", props); result.failed())
            return result;
        if (props != nullptr)
        {
            if (auto result = parseIndex(*props, next.index); result.failed())
                return result;
        }

        if (auto result = sectionProps(root, "feedback", props); result.failed())
            return result;
        if (props != nullptr)
        {
            if (auto result = parseFeedback(*props, next.feedback); result.failed())
                return result;
        }

        if (auto result = sectionProps(root, "session", props); result.failed())
            return result;
        if (props != nullptr)
        {
            if (auto result = parseSession(*props, next.session); result.failed())
                return result;
        }

        if (auto result = sectionProps(root, "controller", props); result.failed())
            return result;
        if (props != nullptr)
        {
            if (auto result = parseController(*props, next.controller); result.failed())
                return result;
        }

        if (auto result = sectionProps(root, "diagnostics", props); result.failed())
            return result;
        if (props != nullptr)
        {
            if (auto result = parseDiagnostics(*props, next.diagnostics); result.failed())
                return result;
        }

        if (auto result = validateEngineConfig(next); result.failed())
            return result;

        configInOut = next;
        return juce::Result::ok();
    }

    juce::Result engineConfigFromJsonString(const juce::String& json, EngineConfig& configInOut)
    {
        juce::var parsed;
        const auto parseResult = juce::JSON::parse(json, parsed);
        if (parseResult.failed())
            return juce::Result::fail("config JSON parse failed: " + parseResult.getErrorMessage());

        return engineConfigFromVar(parsed, configInOut);
    }

    juce::Result loadEngineConfigFromFile(const juce::File& file, EngineConfig& configInOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("config file not found: " + file.getFullPathName());

        return engineConfigFromJsonString(file.loadFileAsString(), configInOut);
    }

    juce::var engineConfigToVar(const EngineConfig& config)
    {
        auto index = std::make_unique<juce::DynamicObject>();
        index->setProperty("max_cache_entries", config.index.maxCacheEntries);
        index->setProperty("grid_threshold", config.index.gridThreshold);
        index->setProperty("grid_cell_size", config.index.gridCellSize);

        const auto& fb = config.feedback;
        auto feedback = std::make_unique<juce::DynamicObject>();
        feedback->setProperty("valid_colour", colourToString(fb.validHighlightColour));
        feedback->setProperty("invalid_colour", colourToString(fb.invalidHighlightColour));
        feedback->setProperty("hover_colour", colourToString(fb.hoverHighlightColour));
        feedback->setProperty("highlight_opacity", fb.highlightOpacity);
        feedback->setProperty("insertion_line_colour", colourToString(fb.insertionLineColour));
        feedback->setProperty("insertion_line_width", fb.insertionLineWidth);
        feedback->setProperty("ghost_opacity", fb.ghostOpacity);
        feedback->setProperty("ghost_scale", fb.ghostScale);
        feedback->setProperty("ghost_offset_x", fb.ghostOffsetX);
        feedback->setProperty("ghost_offset_y", fb.ghostOffsetY);
        feedback->setProperty("fps_limit", fb.fpsLimit);
        feedback->setProperty("invalid_marker_ms", fb.invalidMarkerMs);

        auto session = std::make_unique<juce::DynamicObject>();
        session->setProperty("cancel_reset_delay_ms", config.session.cancelResetDelayMs);
        session->setProperty("duration_smoothing", config.session.durationSmoothing);

        auto controller = std::make_unique<juce::DynamicObject>();
        controller->setProperty("max_nesting_depth", config.controller.maxNestingDepth);
        controller->setProperty("edge_insertion_fraction", config.controller.edgeInsertionFraction);
        controller->setProperty("snap_to_grid", config.controller.snapToGrid);
        controller->setProperty("grid_size", config.controller.gridSize);

        auto diagnostics = std::make_unique<juce::DynamicObject>();
        diagnostics->setProperty("log_level", logLevelToKey(config.diagnostics.logLevel));
        diagnostics->setProperty("query_log_stride", config.diagnostics.queryLogStride);

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("index", juce::var(index.release()));
        root->setProperty("feedback", juce::var(feedback.release()));
        root->setProperty("session", juce::var(session.release()));
        root->setProperty("controller", juce::var(controller.release()));
        root->setProperty("diagnostics", juce::var(diagnostics.release()));
        return juce::var(root.release());
    }

    juce::Result saveEngineConfigToFile(const juce::File& file, const EngineConfig& config)
    {
        const auto json = juce::JSON::toString(engineConfigToVar(config), false);
        if (!file.replaceWithText(json))
            return juce::Result::fail("failed to write config file: " + file.getFullPathName());
        return juce::Result::ok();
    }
}
