#include "Naerim/Core/SpatialDropIndex.h"

#include "Naerim/Runtime/DropDiagnostics.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace Naerim::Core
{
    namespace
    {
        constexpr float kCanvasPadding = 100.0f;
        const juce::Rectangle<float> kDefaultCanvasBounds { 0.0f, 0.0f, 2000.0f, 2000.0f };

        // Bit pattern, so two distinct floats never share a cache entry.
        juce::String floatKey(float value)
        {
            std::uint32_t bits = 0;
            std::memcpy(&bits, &value, sizeof(bits));
            return juce::String::toHexString(static_cast<juce::int64>(bits));
        }

        IndexSettings normalized(IndexSettings settings) noexcept
        {
            settings.maxCacheEntries = std::max(2, settings.maxCacheEntries);
            settings.gridThreshold = std::max(0, settings.gridThreshold);
            if (!std::isfinite(settings.gridCellSize) || settings.gridCellSize <= 1.0f)
                settings.gridCellSize = 64.0f;
            return settings;
        }

        juce::String describeBounds(const juce::Rectangle<float>& bounds)
        {
            return juce::String(bounds.getX()) + "," + juce::String(bounds.getY()) + ","
                 + juce::String(bounds.getWidth()) + "," + juce::String(bounds.getHeight());
        }

        void eraseId(std::vector<ZoneId>& ids, const ZoneId& id)
        {
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        }
    }

    SpatialDropIndex::SpatialDropIndex(IndexSettings settingsIn, Runtime::DropDiagnostics* diagnosticsIn)
        : indexSettings(normalized(settingsIn)),
          diagnostics(diagnosticsIn),
          grid(indexSettings.gridCellSize)
    {
        syncGridMode();
    }

    void SpatialDropIndex::setSettings(IndexSettings nextSettings)
    {
        const juce::ScopedLock sl(lock);
        indexSettings = normalized(nextSettings);
        grid.setCellSize(indexSettings.gridCellSize);
        syncGridMode();
        invalidateCache();
    }

    IndexSettings SpatialDropIndex::settings() const
    {
        const juce::ScopedLock sl(lock);
        return indexSettings;
    }

    juce::Result SpatialDropIndex::addZone(const ZoneId& id,
                                           juce::Rectangle<float> bounds,
                                           int depth,
                                           std::optional<ZoneId> parentId,
                                           AcceptSet accepts,
                                           ZoneConstraints constraints)
    {
        DropZone zone;
        zone.id = id;
        zone.bounds = bounds;
        zone.depth = depth;
        zone.parentId = std::move(parentId);
        zone.accepts = std::move(accepts);
        zone.constraints = std::move(constraints);
        return addZone(zone);
    }

    juce::Result SpatialDropIndex::addZone(const DropZone& zone)
    {
        auto result = juce::Result::ok();
        {
            const juce::ScopedLock sl(lock);

            if (zone.id.trim().isEmpty())
                result = juce::Result::fail("zone.id must not be empty");
            else if (zonesById.count(zone.id) > 0)
                result = juce::Result::fail("zone.id is already registered: " + zone.id);
            else if (!isFiniteBounds(zone.bounds))
                result = juce::Result::fail("zone.bounds must be finite");
            else if (!isPositiveBounds(zone.bounds))
                result = juce::Result::fail("zone.bounds must have positive width and height");
            else if (zone.depth < 0)
                result = juce::Result::fail("zone.depth must be >= 0");
            else if (zone.parentId.has_value() && *zone.parentId == zone.id)
                result = juce::Result::fail("zone.parentId must not reference the zone itself");
            else if (zone.parentId.has_value() && zonesById.count(*zone.parentId) == 0)
                result = juce::Result::fail("zone.parentId is not registered: " + *zone.parentId);

            if (result.wasOk())
            {
                ZoneRecord record;
                record.zone = zone;
                record.sequence = nextSequence++;
                zonesById.emplace(zone.id, std::move(record));

                depthBuckets[zone.depth].push_back(zone.id);
                if (zone.parentId.has_value())
                    childrenById[*zone.parentId].push_back(zone.id);

                if (gridActive)
                    grid.insert(zone.id, zone.bounds);
                syncGridMode();
                invalidateCache();
            }
        }

        if (diagnostics != nullptr)
        {
            if (result.failed())
                diagnostics->warning("Index", "addZone rejected: " + result.getErrorMessage());
            else
                diagnostics->debug("Index", "zone added id=" + zone.id
                                                + " depth=" + juce::String(zone.depth)
                                                + " bounds=" + describeBounds(zone.bounds));
        }

        return result;
    }

    bool SpatialDropIndex::removeZone(const ZoneId& id)
    {
        std::vector<ZoneId> removed;
        {
            const juce::ScopedLock sl(lock);

            const auto* root = findRecord(id);
            if (root != nullptr)
            {
                if (root->zone.parentId.has_value())
                {
                    if (const auto siblings = childrenById.find(*root->zone.parentId); siblings != childrenById.end())
                        eraseId(siblings->second, id);
                }

                collectSubtree(id, removed);
                for (const auto& removedId : removed)
                {
                    const auto it = zonesById.find(removedId);
                    if (it == zonesById.end())
                        continue;

                    const auto depth = it->second.zone.depth;
                    if (const auto bucket = depthBuckets.find(depth); bucket != depthBuckets.end())
                    {
                        eraseId(bucket->second, removedId);
                        if (bucket->second.empty())
                            depthBuckets.erase(bucket);
                    }

                    childrenById.erase(removedId);
                    if (gridActive)
                        grid.remove(removedId);
                    zonesById.erase(it);
                }

                syncGridMode();
                invalidateCache();
            }
        }

        if (removed.empty())
        {
            if (diagnostics != nullptr)
                diagnostics->debug("Index", "removeZone ignored unknown id=" + id);
            return false;
        }

        if (diagnostics != nullptr)
            diagnostics->debug("Index", "zone removed id=" + id + " total=" + juce::String(static_cast<int>(removed.size())));
        return true;
    }

    bool SpatialDropIndex::updateBounds(const ZoneId& id, juce::Rectangle<float> bounds)
    {
        bool known = false;
        bool applied = false;
        {
            const juce::ScopedLock sl(lock);
            if (const auto it = zonesById.find(id); it != zonesById.end())
            {
                known = true;
                if (isPositiveBounds(bounds))
                {
                    it->second.zone.bounds = bounds;
                    if (gridActive)
                        grid.update(id, bounds);
                    invalidateCache();
                    applied = true;
                }
            }
        }

        if (diagnostics != nullptr)
        {
            if (!known)
                diagnostics->debug("Index", "updateBounds ignored unknown id=" + id);
            else if (!applied)
                diagnostics->warning("Index", "updateBounds rejected id=" + id + " bounds=" + describeBounds(bounds));
        }

        return applied;
    }

    bool SpatialDropIndex::updateConstraints(const ZoneId& id, const ZoneConstraintsPatch& patch)
    {
        bool known = false;
        {
            const juce::ScopedLock sl(lock);
            if (const auto it = zonesById.find(id); it != zonesById.end())
            {
                applyConstraintsPatch(it->second.zone.constraints, patch);
                invalidateCache();
                known = true;
            }
        }

        if (!known && diagnostics != nullptr)
            diagnostics->debug("Index", "updateConstraints ignored unknown id=" + id);
        return known;
    }

    bool SpatialDropIndex::setAccepts(const ZoneId& id, AcceptSet accepts)
    {
        bool known = false;
        {
            const juce::ScopedLock sl(lock);
            if (const auto it = zonesById.find(id); it != zonesById.end())
            {
                it->second.zone.accepts = std::move(accepts);
                invalidateCache();
                known = true;
            }
        }

        if (!known && diagnostics != nullptr)
            diagnostics->debug("Index", "setAccepts ignored unknown id=" + id);
        return known;
    }

    QueryResult SpatialDropIndex::queryPoint(float x, float y, const juce::String& acceptType)
    {
        const juce::Point<float> point(x, y);
        return runQuery("point",
                        pointSignature(x, y, acceptType),
                        acceptType,
                        [this, point]
                        {
                            return grid.candidates(point);
                        },
                        [x, y](const DropZone& zone)
                        {
                            return containsInclusive(zone.bounds, x, y);
                        });
    }

    QueryResult SpatialDropIndex::queryRegion(juce::Rectangle<float> area,
                                              const juce::String& acceptType,
                                              bool fullyContained)
    {
        return runQuery("region",
                        regionSignature(area, acceptType, fullyContained),
                        acceptType,
                        [this, area]
                        {
                            return grid.candidates(area);
                        },
                        [area, fullyContained](const DropZone& zone)
                        {
                            if (fullyContained)
                                return containsRect(area, zone.bounds);
                            return intersectsStrict(zone.bounds, area);
                        });
    }

    std::optional<DropZone> SpatialDropIndex::nearest(float x,
                                                      float y,
                                                      float maxDistance,
                                                      const juce::String& acceptType) const
    {
        const juce::Point<float> target(x, y);

        const juce::ScopedLock sl(lock);
        const ZoneRecord* best = nullptr;
        float bestDistance = maxDistance;

        for (const auto& entry : zonesById)
        {
            const auto& record = entry.second;
            if (!acceptsType(record.zone.accepts, acceptType))
                continue;

            const auto distance = record.zone.centre().getDistanceFrom(target);
            if (!(distance < maxDistance))
                continue;

            const bool closer = best == nullptr || distance < bestDistance;
            const bool tieButOlder = best != nullptr && distance == bestDistance && record.sequence < best->sequence;
            if (closer || tieButOlder)
            {
                best = &record;
                bestDistance = distance;
            }
        }

        if (best == nullptr)
            return std::nullopt;
        return best->zone;
    }

    std::vector<DropZone> SpatialDropIndex::getHierarchy(const ZoneId& id) const
    {
        const juce::ScopedLock sl(lock);
        std::vector<DropZone> chain;

        for (const auto* record = findRecord(id); record != nullptr;)
        {
            chain.push_back(record->zone);
            if (!record->zone.parentId.has_value())
                break;
            record = findRecord(*record->zone.parentId);
        }

        std::reverse(chain.begin(), chain.end());
        return chain;
    }

    std::vector<DropZone> SpatialDropIndex::getChildren(const ZoneId& id) const
    {
        const juce::ScopedLock sl(lock);
        std::vector<DropZone> children;

        const auto it = childrenById.find(id);
        if (it == childrenById.end())
            return children;

        for (const auto& childId : it->second)
        {
            if (const auto* record = findRecord(childId))
                children.push_back(record->zone);
        }

        return children;
    }

    std::optional<DropZone> SpatialDropIndex::findZone(const ZoneId& id) const
    {
        const juce::ScopedLock sl(lock);
        if (const auto* record = findRecord(id))
            return record->zone;
        return std::nullopt;
    }

    bool SpatialDropIndex::contains(const ZoneId& id) const
    {
        const juce::ScopedLock sl(lock);
        return zonesById.count(id) > 0;
    }

    std::vector<DropZone> SpatialDropIndex::allZones() const
    {
        const juce::ScopedLock sl(lock);
        std::vector<const ZoneRecord*> records;
        records.reserve(zonesById.size());
        for (const auto& entry : zonesById)
            records.push_back(&entry.second);

        std::sort(records.begin(),
                  records.end(),
                  [](const ZoneRecord* lhs, const ZoneRecord* rhs)
                  {
                      return lhs->sequence < rhs->sequence;
                  });

        std::vector<DropZone> zones;
        zones.reserve(records.size());
        for (const auto* record : records)
            zones.push_back(record->zone);
        return zones;
    }

    int SpatialDropIndex::size() const
    {
        const juce::ScopedLock sl(lock);
        return static_cast<int>(zonesById.size());
    }

    juce::Rectangle<float> SpatialDropIndex::canvasBounds() const
    {
        const juce::ScopedLock sl(lock);
        if (zonesById.empty())
            return kDefaultCanvasBounds;

        auto left = std::numeric_limits<float>::max();
        auto top = std::numeric_limits<float>::max();
        auto right = std::numeric_limits<float>::lowest();
        auto bottom = std::numeric_limits<float>::lowest();

        for (const auto& entry : zonesById)
        {
            const auto& bounds = entry.second.zone.bounds;
            left = std::min(left, bounds.getX());
            top = std::min(top, bounds.getY());
            right = std::max(right, bounds.getRight());
            bottom = std::max(bottom, bounds.getBottom());
        }

        return juce::Rectangle<float>::leftTopRightBottom(left - kCanvasPadding,
                                                          top - kCanvasPadding,
                                                          right + kCanvasPadding,
                                                          bottom + kCanvasPadding);
    }

    IndexStats SpatialDropIndex::stats() const
    {
        const juce::ScopedLock sl(lock);
        IndexStats result;
        result.totalZones = static_cast<int>(zonesById.size());
        result.totalQueries = totalQueries;
        result.cacheHits = cacheHits;
        result.cacheHitRate = totalQueries > 0 ? static_cast<double>(cacheHits) / totalQueries : 0.0;
        result.averageQueryTimeMs = totalQueries > 0 ? totalQueryTimeMs / totalQueries : 0.0;
        result.cacheSize = static_cast<int>(cache.size());
        result.maxDepth = depthBuckets.empty() ? 0 : depthBuckets.begin()->first;
        result.gridActive = gridActive;
        return result;
    }

    bool SpatialDropIndex::isGridActive() const
    {
        const juce::ScopedLock sl(lock);
        return gridActive;
    }

    void SpatialDropIndex::clear()
    {
        {
            const juce::ScopedLock sl(lock);
            zonesById.clear();
            depthBuckets.clear();
            childrenById.clear();
            grid.clear();
            gridActive = false;
            syncGridMode();
            invalidateCache();
            totalQueries = 0;
            cacheHits = 0;
            totalQueryTimeMs = 0.0;
        }

        if (diagnostics != nullptr)
            diagnostics->debug("Index", "index cleared");
    }

    void SpatialDropIndex::clearCache()
    {
        const juce::ScopedLock sl(lock);
        invalidateCache();
    }

    juce::String SpatialDropIndex::pointSignature(float x, float y, const juce::String& acceptType)
    {
        return "point_" + floatKey(x) + "_" + floatKey(y) + "_" + acceptType;
    }

    juce::String SpatialDropIndex::regionSignature(juce::Rectangle<float> area,
                                                   const juce::String& acceptType,
                                                   bool fullyContained)
    {
        return "region_" + floatKey(area.getX()) + "_" + floatKey(area.getY())
             + "_" + floatKey(area.getWidth()) + "_" + floatKey(area.getHeight())
             + "_" + (fullyContained ? "1" : "0") + "_" + acceptType;
    }

    QueryResult SpatialDropIndex::runQuery(const juce::String& queryKind,
                                           const juce::String& signature,
                                           const juce::String& acceptType,
                                           const std::function<std::vector<ZoneId>()>& broadPhase,
                                           const HitTest& hitTest)
    {
        const auto startedMs = juce::Time::getMillisecondCounterHiRes();
        QueryResult result;

        {
            const juce::ScopedLock sl(lock);
            ++totalQueries;

            if (const auto cached = cache.find(signature); cached != cache.end())
            {
                result = cached->second;
                result.cacheHit = true;
                result.zonesExamined = 0;
                ++cacheHits;
            }
            else
            {
                const auto candidates = scanCandidates(broadPhase);
                result.zonesExamined = static_cast<int>(candidates.size());

                std::vector<const ZoneRecord*> hits;
                for (const auto* record : candidates)
                {
                    if (hitTest(record->zone) && acceptsType(record->zone.accepts, acceptType))
                        hits.push_back(record);
                }

                std::stable_sort(hits.begin(),
                                 hits.end(),
                                 [](const ZoneRecord* lhs, const ZoneRecord* rhs)
                                 {
                                     if (lhs->zone.depth != rhs->zone.depth)
                                         return lhs->zone.depth > rhs->zone.depth;
                                     return lhs->zone.area() < rhs->zone.area();
                                 });

                result.zones.reserve(hits.size());
                for (const auto* record : hits)
                    result.zones.push_back(record->zone);
            }

            result.queryTimeMs = juce::Time::getMillisecondCounterHiRes() - startedMs;
            totalQueryTimeMs += result.queryTimeMs;

            if (!result.cacheHit)
                storeInCache(signature, result);
        }

        logQuery(queryKind, signature, result);
        return result;
    }

    std::vector<const SpatialDropIndex::ZoneRecord*> SpatialDropIndex::scanCandidates(
        const std::function<std::vector<ZoneId>()>& broadPhase) const
    {
        std::vector<const ZoneRecord*> records;

        if (!gridActive)
        {
            records.reserve(zonesById.size());
            for (const auto& bucket : depthBuckets)
            {
                for (const auto& id : bucket.second)
                {
                    if (const auto* record = findRecord(id))
                        records.push_back(record);
                }
            }

            return records;
        }

        for (const auto& id : broadPhase())
        {
            if (const auto* record = findRecord(id))
                records.push_back(record);
        }

        // Same visiting order as the bucket scan.
        std::sort(records.begin(),
                  records.end(),
                  [](const ZoneRecord* lhs, const ZoneRecord* rhs)
                  {
                      if (lhs->zone.depth != rhs->zone.depth)
                          return lhs->zone.depth > rhs->zone.depth;
                      return lhs->sequence < rhs->sequence;
                  });
        return records;
    }

    void SpatialDropIndex::storeInCache(const juce::String& signature, const QueryResult& result)
    {
        cache[signature] = result;
        cacheOrder.push_back(signature);

        const auto ceiling = static_cast<size_t>(indexSettings.maxCacheEntries);
        if (cache.size() <= ceiling)
            return;

        const auto keep = ceiling / 2;
        while (cache.size() > keep && !cacheOrder.empty())
        {
            cache.erase(cacheOrder.front());
            cacheOrder.pop_front();
        }
    }

    void SpatialDropIndex::invalidateCache()
    {
        cache.clear();
        cacheOrder.clear();
    }

    void SpatialDropIndex::syncGridMode()
    {
        const bool shouldBeActive = static_cast<int>(zonesById.size()) >= indexSettings.gridThreshold;
        if (shouldBeActive == gridActive)
            return;

        grid.clear();
        gridActive = shouldBeActive;
        if (!gridActive)
            return;

        for (const auto& entry : zonesById)
            grid.insert(entry.first, entry.second.zone.bounds);
    }

    void SpatialDropIndex::collectSubtree(const ZoneId& id, std::vector<ZoneId>& out) const
    {
        out.push_back(id);

        const auto it = childrenById.find(id);
        if (it == childrenById.end())
            return;

        for (const auto& childId : it->second)
            collectSubtree(childId, out);
    }

    const SpatialDropIndex::ZoneRecord* SpatialDropIndex::findRecord(const ZoneId& id) const
    {
        const auto it = zonesById.find(id);
        return it == zonesById.end() ? nullptr : &it->second;
    }

    void SpatialDropIndex::logQuery(const juce::String& queryKind,
                                    const juce::String& signature,
                                    const QueryResult& result) const
    {
        if (diagnostics == nullptr || !diagnostics->shouldLogQuery())
            return;

        diagnostics->debug("Index", Runtime::DropDiagnostics::formatQuerySummary(queryKind, signature, result));
    }
}
