#pragma once

#include "Naerim/Public/EngineConfig.h"

namespace Naerim::Serialization
{
    // Missing sections and keys keep the values already in configInOut. The
    // target is only written when the whole record parses and validates.
    juce::Result engineConfigFromVar(const juce::var& record, EngineConfig& configInOut);
    juce::Result engineConfigFromJsonString(const juce::String& json, EngineConfig& configInOut);
    juce::Result loadEngineConfigFromFile(const juce::File& file, EngineConfig& configInOut);

    juce::var engineConfigToVar(const EngineConfig& config);
    juce::Result saveEngineConfigToFile(const juce::File& file, const EngineConfig& config);

    std::optional<juce::Colour> colourFromString(const juce::String& text);
    juce::String colourToString(juce::Colour colour);
}
