#include "Naerim/Core/ZoneGrid.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace Naerim::Core
{
    ZoneGrid::ZoneGrid(float cellSizeIn)
    {
        setCellSize(cellSizeIn);
    }

    void ZoneGrid::setCellSize(float size)
    {
        if (!std::isfinite(size) || size <= 1.0f || size == gridCellSize)
            return;

        gridCellSize = size;

        std::vector<std::pair<ZoneId, juce::Rectangle<float>>> existing;
        existing.reserve(placements.size());
        for (const auto& [id, placement] : placements)
            existing.emplace_back(id, placement.bounds);

        clear();
        for (const auto& [id, bounds] : existing)
            insert(id, bounds);
    }

    float ZoneGrid::cellSize() const noexcept
    {
        return gridCellSize;
    }

    void ZoneGrid::insert(const ZoneId& id, juce::Rectangle<float> bounds)
    {
        if (const auto it = placements.find(id); it != placements.end())
        {
            unlink(id, it->second);
            placements.erase(it);
        }

        Placement placement;
        placement.bounds = bounds;

        if (!isFiniteBounds(bounds) || cellCountForBounds(bounds) > kMaxCellsPerZone)
        {
            placement.oversized = true;
            oversizedIds.push_back(id);
        }
        else
        {
            placement.cellKeys = cellsForBounds(bounds);
            for (const auto key : placement.cellKeys)
                cellToIds[key].push_back(id);
        }

        placements.emplace(id, std::move(placement));
    }

    void ZoneGrid::update(const ZoneId& id, juce::Rectangle<float> bounds)
    {
        insert(id, bounds);
    }

    bool ZoneGrid::remove(const ZoneId& id)
    {
        const auto it = placements.find(id);
        if (it == placements.end())
            return false;

        unlink(id, it->second);
        placements.erase(it);
        return true;
    }

    void ZoneGrid::clear()
    {
        placements.clear();
        cellToIds.clear();
        oversizedIds.clear();
    }

    int ZoneGrid::size() const noexcept
    {
        return static_cast<int>(placements.size());
    }

    int ZoneGrid::oversizedCount() const noexcept
    {
        return static_cast<int>(oversizedIds.size());
    }

    std::vector<ZoneId> ZoneGrid::candidates(juce::Point<float> point) const
    {
        return collect({ makeCellKey(cellIndex(point.x), cellIndex(point.y)) });
    }

    std::vector<ZoneId> ZoneGrid::candidates(juce::Rectangle<float> area) const
    {
        if (cellCountForBounds(area) > kMaxCellsPerZone)
        {
            std::vector<ZoneId> everything;
            everything.reserve(placements.size());
            for (const auto& entry : placements)
                everything.push_back(entry.first);
            return everything;
        }

        return collect(cellsForBounds(area));
    }

    std::int64_t ZoneGrid::makeCellKey(int x, int y) noexcept
    {
        return (static_cast<std::int64_t>(x) << 32) | (static_cast<std::uint32_t>(y));
    }

    int ZoneGrid::cellIndex(float coordinate) const noexcept
    {
        constexpr auto lowest = static_cast<double>(std::numeric_limits<int>::min() / 2);
        constexpr auto highest = static_cast<double>(std::numeric_limits<int>::max() / 2);
        const auto cell = std::floor(static_cast<double>(coordinate) / static_cast<double>(gridCellSize));
        return static_cast<int>(juce::jlimit(lowest, highest, cell));
    }

    std::int64_t ZoneGrid::cellCountForBounds(juce::Rectangle<float> bounds) const noexcept
    {
        if (!isFiniteBounds(bounds))
            return std::numeric_limits<std::int64_t>::max();

        const auto columns = static_cast<std::int64_t>(cellIndex(bounds.getRight())) - cellIndex(bounds.getX()) + 1;
        const auto rows = static_cast<std::int64_t>(cellIndex(bounds.getBottom())) - cellIndex(bounds.getY()) + 1;
        return columns * rows;
    }

    std::vector<std::int64_t> ZoneGrid::cellsForBounds(juce::Rectangle<float> bounds) const
    {
        std::vector<std::int64_t> keys;

        const int left = cellIndex(bounds.getX());
        const int right = cellIndex(bounds.getRight());
        const int top = cellIndex(bounds.getY());
        const int bottom = cellIndex(bounds.getBottom());

        keys.reserve(static_cast<size_t>((right - left + 1) * (bottom - top + 1)));
        for (int y = top; y <= bottom; ++y)
        {
            for (int x = left; x <= right; ++x)
                keys.push_back(makeCellKey(x, y));
        }

        return keys;
    }

    std::vector<ZoneId> ZoneGrid::collect(const std::vector<std::int64_t>& cellKeys) const
    {
        std::set<ZoneId> unique(oversizedIds.begin(), oversizedIds.end());
        for (const auto key : cellKeys)
        {
            const auto it = cellToIds.find(key);
            if (it == cellToIds.end())
                continue;

            unique.insert(it->second.begin(), it->second.end());
        }

        return std::vector<ZoneId>(unique.begin(), unique.end());
    }

    void ZoneGrid::unlink(const ZoneId& id, const Placement& placement)
    {
        if (placement.oversized)
        {
            oversizedIds.erase(std::remove(oversizedIds.begin(), oversizedIds.end(), id), oversizedIds.end());
            return;
        }

        for (const auto key : placement.cellKeys)
        {
            const auto it = cellToIds.find(key);
            if (it == cellToIds.end())
                continue;

            auto& ids = it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty())
                cellToIds.erase(it);
        }
    }
}
