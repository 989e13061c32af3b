#pragma once

#include "Naerim/Public/Types.h"
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace Naerim::Core
{
    // Uniform-grid broad phase. Candidates are a superset of the zones that can
    // hit a point or region; callers still run the exact bounds test.
    class ZoneGrid
    {
    public:
        static constexpr int kMaxCellsPerZone = 4096;

        explicit ZoneGrid(float cellSizeIn = 64.0f);

        void setCellSize(float size);
        float cellSize() const noexcept;

        void insert(const ZoneId& id, juce::Rectangle<float> bounds);
        void update(const ZoneId& id, juce::Rectangle<float> bounds);
        bool remove(const ZoneId& id);
        void clear();

        int size() const noexcept;
        int oversizedCount() const noexcept;

        std::vector<ZoneId> candidates(juce::Point<float> point) const;
        std::vector<ZoneId> candidates(juce::Rectangle<float> area) const;

    private:
        struct Placement
        {
            juce::Rectangle<float> bounds;
            std::vector<std::int64_t> cellKeys;
            bool oversized = false;
        };

        static std::int64_t makeCellKey(int x, int y) noexcept;
        int cellIndex(float coordinate) const noexcept;
        std::vector<std::int64_t> cellsForBounds(juce::Rectangle<float> bounds) const;
        std::int64_t cellCountForBounds(juce::Rectangle<float> bounds) const noexcept;
        std::vector<ZoneId> collect(const std::vector<std::int64_t>& cellKeys) const;
        void unlink(const ZoneId& id, const Placement& placement);

        float gridCellSize = 64.0f;
        std::map<ZoneId, Placement> placements;
        std::unordered_map<std::int64_t, std::vector<ZoneId>> cellToIds;
        std::vector<ZoneId> oversizedIds;
    };
}
