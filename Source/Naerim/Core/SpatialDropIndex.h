#pragma once

#include "Naerim/Core/ZoneGrid.h"
#include "Naerim/Public/EngineConfig.h"
#include "Naerim/Public/Types.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace Naerim::Runtime
{
    class DropDiagnostics;
}

namespace Naerim::Core
{
    struct IndexStats
    {
        int totalZones = 0;
        int totalQueries = 0;
        int cacheHits = 0;
        double cacheHitRate = 0.0;
        double averageQueryTimeMs = 0.0;
        int cacheSize = 0;
        int maxDepth = 0;
        bool gridActive = false;
    };

    // Owns every registered drop zone. Queries hand out value snapshots, so a
    // result stays valid after the zone it names is moved or removed.
    class SpatialDropIndex
    {
    public:
        explicit SpatialDropIndex(IndexSettings settingsIn = {},
                                  Runtime::DropDiagnostics* diagnosticsIn = nullptr);

        SpatialDropIndex(const SpatialDropIndex&) = delete;
        SpatialDropIndex& operator=(const SpatialDropIndex&) = delete;

        void setSettings(IndexSettings nextSettings);
        [[nodiscard]] IndexSettings settings() const;

        juce::Result addZone(const ZoneId& id,
                             juce::Rectangle<float> bounds,
                             int depth,
                             std::optional<ZoneId> parentId = std::nullopt,
                             AcceptSet accepts = {},
                             ZoneConstraints constraints = {});
        juce::Result addZone(const DropZone& zone);

        bool removeZone(const ZoneId& id);
        bool updateBounds(const ZoneId& id, juce::Rectangle<float> bounds);
        bool updateConstraints(const ZoneId& id, const ZoneConstraintsPatch& patch);
        bool setAccepts(const ZoneId& id, AcceptSet accepts);

        QueryResult queryPoint(float x, float y, const juce::String& acceptType = {});
        QueryResult queryRegion(juce::Rectangle<float> area,
                                const juce::String& acceptType = {},
                                bool fullyContained = false);
        std::optional<DropZone> nearest(float x,
                                        float y,
                                        float maxDistance = 100.0f,
                                        const juce::String& acceptType = {}) const;

        [[nodiscard]] std::vector<DropZone> getHierarchy(const ZoneId& id) const;
        [[nodiscard]] std::vector<DropZone> getChildren(const ZoneId& id) const;
        [[nodiscard]] std::optional<DropZone> findZone(const ZoneId& id) const;
        [[nodiscard]] bool contains(const ZoneId& id) const;
        [[nodiscard]] std::vector<DropZone> allZones() const;
        [[nodiscard]] int size() const;
        [[nodiscard]] juce::Rectangle<float> canvasBounds() const;
        [[nodiscard]] IndexStats stats() const;
        [[nodiscard]] bool isGridActive() const;

        void clear();
        void clearCache();

        static juce::String pointSignature(float x, float y, const juce::String& acceptType);
        static juce::String regionSignature(juce::Rectangle<float> area, const juce::String& acceptType, bool fullyContained);

    private:
        struct ZoneRecord
        {
            DropZone zone;
            std::uint64_t sequence = 0;
        };

        using HitTest = std::function<bool(const DropZone&)>;

        QueryResult runQuery(const juce::String& queryKind,
                             const juce::String& signature,
                             const juce::String& acceptType,
                             const std::function<std::vector<ZoneId>()>& broadPhase,
                             const HitTest& hitTest);
        std::vector<const ZoneRecord*> scanCandidates(const std::function<std::vector<ZoneId>()>& broadPhase) const;
        void storeInCache(const juce::String& signature, const QueryResult& result);
        void invalidateCache();
        void syncGridMode();
        void collectSubtree(const ZoneId& id, std::vector<ZoneId>& out) const;
        const ZoneRecord* findRecord(const ZoneId& id) const;
        void logQuery(const juce::String& queryKind, const juce::String& signature, const QueryResult& result) const;

        mutable juce::CriticalSection lock;
        IndexSettings indexSettings {};
        Runtime::DropDiagnostics* diagnostics = nullptr;

        std::map<ZoneId, ZoneRecord> zonesById;
        std::map<int, std::vector<ZoneId>, std::greater<int>> depthBuckets;
        std::map<ZoneId, std::vector<ZoneId>> childrenById;
        std::uint64_t nextSequence = 1;

        ZoneGrid grid;
        bool gridActive = false;

        std::map<juce::String, QueryResult> cache;
        std::deque<juce::String> cacheOrder;

        int totalQueries = 0;
        int cacheHits = 0;
        double totalQueryTimeMs = 0.0;
    };
}
