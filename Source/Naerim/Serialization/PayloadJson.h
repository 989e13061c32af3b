#pragma once

#include "Naerim/Public/DragPayload.h"
#include <optional>

namespace Naerim::Serialization
{
    juce::var payloadToVar(const DragPayload& payload);
    juce::String payloadToJsonString(const DragPayload& payload);

    juce::Result payloadFromVar(const juce::var& record,
                                std::optional<DragPayload>& payloadOut,
                                PayloadField* failedFieldOut = nullptr);

    juce::Result payloadFromJsonString(const juce::String& json,
                                       std::optional<DragPayload>& payloadOut,
                                       PayloadField* failedFieldOut = nullptr);
}
