#include "NaerimSmokeSupport.h"

#include "Naerim/Core/DropValidator.h"
#include "Naerim/Core/SpatialDropIndex.h"
#include "Naerim/Core/ZoneGrid.h"
#include "Naerim/Serialization/PayloadJson.h"
#include <algorithm>
#include <limits>

using namespace Naerim;
using namespace Naerim::Smoke;

namespace
{
    ZoneConstraints containerConstraints(std::optional<int> maxChildren, int childCount)
    {
        ZoneConstraints constraints;
        constraints.kind = DropZoneKind::container;
        constraints.maxChildren = maxChildren;
        constraints.childCount = childCount;
        return constraints;
    }

    ZoneConstraints slotConstraints(std::optional<juce::String> requiredType, bool exclusive, bool occupied)
    {
        ZoneConstraints constraints;
        constraints.kind = DropZoneKind::slot;
        constraints.requiredType = std::move(requiredType);
        constraints.exclusive = exclusive;
        constraints.occupied = occupied;
        return constraints;
    }

    juce::Result buildNestedLayout(Core::SpatialDropIndex& index)
    {
        if (auto r = index.addZone("canvas", { 0.0f, 0.0f, 1000.0f, 1000.0f }, 0); r.failed())
            return r;
        if (auto r = index.addZone("panel", { 100.0f, 100.0f, 400.0f, 400.0f }, 1, ZoneId("canvas")); r.failed())
            return r;
        if (auto r = index.addZone("card", { 150.0f, 150.0f, 100.0f, 100.0f }, 2, ZoneId("panel")); r.failed())
            return r;
        return index.addZone("sidebar", { 120.0f, 120.0f, 300.0f, 300.0f }, 1, ZoneId("canvas"));
    }

    juce::Result testPayloadCreation()
    {
        PayloadField failed = PayloadField::record;
        std::optional<DragPayload> payload;

        DragPayloadFields fields;
        fields.id = "  btn-1 ";
        fields.type = "button";
        fields.name = "<b>Hero</b>";
        fields.category = "basic";
        if (auto r = DragPayload::create(fields, payload, &failed); r.failed())
            return juce::Result::fail("valid payload rejected: " + r.getErrorMessage());

        if (payload->id() != "btn-1")
            return juce::Result::fail("id was not trimmed");
        if (payload->name() != "bHero/b")
            return juce::Result::fail("markup not stripped from name: " + payload->name());
        if (payload->sourceId().isEmpty())
            return juce::Result::fail("missing source id was not generated");

        fields.name = juce::String::repeatedString("x", 150);
        if (DragPayload::create(fields, payload).failed() || payload->name().length() != DragPayload::kMaxTextLength)
            return juce::Result::fail("long name was not truncated");

        fields.name = "   ";
        if (DragPayload::create(fields, payload, &failed).wasOk() || failed != PayloadField::name)
            return juce::Result::fail("blank name accepted");
        if (payload.has_value())
            return juce::Result::fail("failed create left a payload behind");

        fields.name = "Hero";
        fields.category = "<>";
        if (DragPayload::create(fields, payload, &failed).wasOk() || failed != PayloadField::category)
            return juce::Result::fail("category made only of markup accepted");

        fields.category = "basic";
        fields.type = "widget-x";
        if (DragPayload::create(fields, payload).failed())
            return juce::Result::fail("unknown component type should only be logged");

        return juce::Result::ok();
    }

    juce::Result testPayloadJsonRoundTrip()
    {
        PropertyBag properties;
        properties.set("label", "Go");
        properties.set("constraints", makeObject({ { "min_width", 120 }, { "invalid_parents", juce::Array<juce::var> { "slot" } } }));

        const auto original = makePayload("button", "btn-7", "Submit \"Now\"", "forms", properties, "palette");
        if (!original.has_value())
            return juce::Result::fail("payload creation failed");

        const auto json = Serialization::payloadToJsonString(*original);
        std::optional<DragPayload> restored;
        if (auto r = Serialization::payloadFromJsonString(json, restored); r.failed())
            return juce::Result::fail("round trip parse failed: " + r.getErrorMessage());

        if (*restored != *original)
            return juce::Result::fail("round trip changed the payload: " + json);
        if (static_cast<int>(restored->constraint("min_width")) != 120)
            return juce::Result::fail("nested constraint lost");

        const juce::String messy = "  <script>alert('x')</script>\t& more  ";
        if (DragPayload::sanitize(DragPayload::sanitize(messy)) != DragPayload::sanitize(messy))
            return juce::Result::fail("sanitize is not idempotent");

        return juce::Result::ok();
    }

    juce::Result testPayloadJsonRejectsBadRecords()
    {
        struct Case
        {
            const char* json;
            PayloadField field;
        };

        const std::vector<Case> cases {
            { "{not json", PayloadField::record },
            { "[1, 2]", PayloadField::record },
            { R"({"id":"a","type":"button","name":"A"})", PayloadField::category },
            { R"({"id":"  ","type":"button","name":"A","category":"basic"})", PayloadField::id },
            { R"({"id":"a","type":7,"name":"A","category":"basic"})", PayloadField::type },
            { R"({"id":"a","type":"button","name":"A","category":"basic","properties":"x"})", PayloadField::properties },
            { R"({"id":"a","type":"button","name":"A","category":"basic","metadata":[1]})", PayloadField::metadata }
        };

        for (const auto& c : cases)
        {
            std::optional<DragPayload> payload;
            PayloadField failed = PayloadField::sourceId;
            if (Serialization::payloadFromJsonString(c.json, payload, &failed).wasOk())
                return juce::Result::fail(juce::String("accepted bad record: ") + c.json);
            if (failed != c.field)
                return juce::Result::fail(juce::String("wrong field reported for ") + c.json + ": " + payloadFieldToKey(failed));
            if (payload.has_value())
                return juce::Result::fail("failed parse produced a payload");
        }

        return juce::Result::ok();
    }

    juce::Result testQueryPointOrdering()
    {
        Core::SpatialDropIndex index;
        if (auto r = buildNestedLayout(index); r.failed())
            return r;

        const auto inner = index.queryPoint(160.0f, 160.0f);
        if (!idsEqual(inner.ids(), { "card", "sidebar", "panel", "canvas" }))
            return juce::Result::fail("unexpected order at (160,160): " + joinIds(inner.ids()));

        const auto edge = index.queryPoint(500.0f, 500.0f);
        if (!idsEqual(edge.ids(), { "panel", "canvas" }))
            return juce::Result::fail("edges must count as inside: " + joinIds(edge.ids()));

        if (!index.queryPoint(1001.0f, 5.0f).empty())
            return juce::Result::fail("point outside every zone returned hits");

        for (const auto& zone : index.queryPoint(300.0f, 300.0f).zones)
        {
            if (!containsInclusive(zone.bounds, 300.0f, 300.0f))
                return juce::Result::fail("result zone does not contain the query point: " + zone.id);
        }

        const auto region = index.queryRegion({ 140.0f, 140.0f, 20.0f, 20.0f });
        if (!idsEqual(region.ids(), { "card", "sidebar", "panel", "canvas" }))
            return juce::Result::fail("unexpected region order: " + joinIds(region.ids()));

        const auto contained = index.queryRegion({ 100.0f, 100.0f, 400.0f, 400.0f }, {}, true);
        if (!idsEqual(contained.ids(), { "card", "sidebar", "panel" }))
            return juce::Result::fail("unexpected fully-contained result: " + joinIds(contained.ids()));

        return juce::Result::ok();
    }

    juce::Result testAcceptFiltering()
    {
        Core::SpatialDropIndex index;
        if (auto r = index.addZone("buttons", { 0.0f, 0.0f, 100.0f, 100.0f }, 2, std::nullopt, { "button" }); r.failed())
            return r;
        if (auto r = index.addZone("anything", { 0.0f, 0.0f, 200.0f, 200.0f }, 1, std::nullopt, { kWildcardType }); r.failed())
            return r;
        if (auto r = index.addZone("open", { 0.0f, 0.0f, 300.0f, 300.0f }, 0); r.failed())
            return r;

        if (!idsEqual(index.queryPoint(50.0f, 50.0f, "image").ids(), { "anything", "open" }))
            return juce::Result::fail("image should skip the button-only zone");
        if (!idsEqual(index.queryPoint(50.0f, 50.0f, "button").ids(), { "buttons", "anything", "open" }))
            return juce::Result::fail("button should match every zone");

        if (!index.setAccepts("open", { "text" }))
            return juce::Result::fail("setAccepts on a known zone failed");
        if (!idsEqual(index.queryPoint(50.0f, 50.0f, "image").ids(), { "anything" }))
            return juce::Result::fail("accept change was not picked up");

        return juce::Result::ok();
    }

    juce::Result testCacheHitsAndInvalidation()
    {
        Core::SpatialDropIndex index;
        if (auto r = buildNestedLayout(index); r.failed())
            return r;

        const auto first = index.queryPoint(160.0f, 160.0f);
        const auto second = index.queryPoint(160.0f, 160.0f);
        if (first.cacheHit || !second.cacheHit)
            return juce::Result::fail("second identical query should be a cache hit");
        if (first.ids() != second.ids() || second.zonesExamined != 0)
            return juce::Result::fail("cached result differs from the scan");

        const auto expectMiss = [&index](const juce::String& step) -> juce::Result
        {
            if (index.queryPoint(160.0f, 160.0f).cacheHit)
                return juce::Result::fail("cache survived " + step);
            if (!index.queryPoint(160.0f, 160.0f).cacheHit)
                return juce::Result::fail("cache not repopulated after " + step);
            return juce::Result::ok();
        };

        if (auto r = index.addZone("badge", { 155.0f, 155.0f, 10.0f, 10.0f }, 3, ZoneId("card")); r.failed())
            return r;
        if (!index.queryPoint(160.0f, 160.0f).ids().front().equals("badge"))
            return juce::Result::fail("new zone missing from the next query");
        if (!index.queryPoint(160.0f, 160.0f).cacheHit)
            return juce::Result::fail("repeat after add should hit");

        if (!index.updateBounds("badge", { 400.0f, 400.0f, 10.0f, 10.0f }))
            return juce::Result::fail("updateBounds failed");
        if (auto r = expectMiss("updateBounds"); r.failed())
            return r;

        ZoneConstraintsPatch patch;
        patch.occupied = true;
        if (!index.updateConstraints("card", patch))
            return juce::Result::fail("updateConstraints failed");
        if (auto r = expectMiss("updateConstraints"); r.failed())
            return r;

        if (!index.removeZone("badge"))
            return juce::Result::fail("removeZone failed");
        if (auto r = expectMiss("removeZone"); r.failed())
            return r;

        if (index.updateBounds("card", { 0.0f, 0.0f, 0.0f, 10.0f }))
            return juce::Result::fail("zero-width bounds accepted");

        const auto stats = index.stats();
        if (stats.totalQueries <= stats.cacheHits || stats.cacheHits < 4)
            return juce::Result::fail("unexpected cache statistics");

        return juce::Result::ok();
    }

    juce::Result testCacheEviction()
    {
        IndexSettings settings;
        settings.maxCacheEntries = 4;
        Core::SpatialDropIndex index(settings);
        if (auto r = index.addZone("canvas", { 0.0f, 0.0f, 100.0f, 100.0f }, 0); r.failed())
            return r;

        for (int i = 0; i < 5; ++i)
            index.queryPoint(static_cast<float>(i), 1.0f);

        if (index.stats().cacheSize != 2)
            return juce::Result::fail("cache should shrink to half after overflow, size="
                                      + juce::String(index.stats().cacheSize));
        if (!index.queryPoint(4.0f, 1.0f).cacheHit)
            return juce::Result::fail("newest entry was evicted");
        if (index.queryPoint(0.0f, 1.0f).cacheHit)
            return juce::Result::fail("oldest entry survived eviction");

        return juce::Result::ok();
    }

    juce::Result testRemoveCascadesToDescendants()
    {
        Core::SpatialDropIndex index;
        if (auto r = index.addZone("root", { 0.0f, 0.0f, 500.0f, 500.0f }, 0); r.failed())
            return r;
        if (auto r = index.addZone("child", { 10.0f, 10.0f, 200.0f, 200.0f }, 1, ZoneId("root")); r.failed())
            return r;
        if (auto r = index.addZone("grandchild", { 20.0f, 20.0f, 50.0f, 50.0f }, 2, ZoneId("child")); r.failed())
            return r;
        if (auto r = index.addZone("second", { 300.0f, 300.0f, 100.0f, 100.0f }, 1, ZoneId("root")); r.failed())
            return r;
        if (auto r = index.addZone("other", { 600.0f, 0.0f, 100.0f, 100.0f }, 0); r.failed())
            return r;

        if (!index.removeZone("child"))
            return juce::Result::fail("removeZone(child) failed");
        if (index.size() != 3 || index.contains("grandchild"))
            return juce::Result::fail("subtree not removed with its root");
        if (!idsEqual(index.queryPoint(30.0f, 30.0f).ids(), { "root" }))
            return juce::Result::fail("removed zone still reachable");

        if (!index.removeZone("root") || index.size() != 1)
            return juce::Result::fail("removing root should leave only the unrelated zone");
        if (!index.getHierarchy("second").empty())
            return juce::Result::fail("hierarchy of removed zone should be empty");
        if (index.removeZone("root"))
            return juce::Result::fail("second remove of the same id should report false");

        if (auto r = index.addZone("root", { 0.0f, 0.0f, 10.0f, 10.0f }, 0); r.failed())
            return juce::Result::fail("id could not be reused after removal: " + r.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result testAddZoneRejections()
    {
        Core::SpatialDropIndex index;
        if (auto r = index.addZone("canvas", { 0.0f, 0.0f, 100.0f, 100.0f }, 0); r.failed())
            return r;

        const auto nan = std::numeric_limits<float>::quiet_NaN();
        const std::vector<std::pair<const char*, juce::Result>> cases {
            { "empty id", index.addZone("  ", { 0.0f, 0.0f, 10.0f, 10.0f }, 0) },
            { "duplicate id", index.addZone("canvas", { 0.0f, 0.0f, 10.0f, 10.0f }, 0) },
            { "zero width", index.addZone("flat", { 0.0f, 0.0f, 0.0f, 10.0f }, 0) },
            { "nan bounds", index.addZone("nan", { nan, 0.0f, 10.0f, 10.0f }, 0) },
            { "negative depth", index.addZone("deep", { 0.0f, 0.0f, 10.0f, 10.0f }, -1) },
            { "self parent", index.addZone("loop", { 0.0f, 0.0f, 10.0f, 10.0f }, 1, ZoneId("loop")) },
            { "unknown parent", index.addZone("orphan", { 0.0f, 0.0f, 10.0f, 10.0f }, 1, ZoneId("missing")) }
        };

        for (const auto& [name, result] : cases)
        {
            if (result.wasOk())
                return juce::Result::fail(juce::String("accepted invalid zone: ") + name);
        }

        if (index.size() != 1)
            return juce::Result::fail("rejected zones were registered");

        return juce::Result::ok();
    }

    juce::Result testHierarchyNearestAndCanvas()
    {
        Core::SpatialDropIndex index;
        if (index.canvasBounds() != juce::Rectangle<float>(0.0f, 0.0f, 2000.0f, 2000.0f))
            return juce::Result::fail("empty index should report the default canvas");

        if (auto r = buildNestedLayout(index); r.failed())
            return r;

        std::vector<ZoneId> chain;
        for (const auto& zone : index.getHierarchy("card"))
            chain.push_back(zone.id);
        if (!idsEqual(chain, { "canvas", "panel", "card" }))
            return juce::Result::fail("unexpected hierarchy: " + joinIds(chain));

        std::vector<ZoneId> children;
        for (const auto& zone : index.getChildren("canvas"))
            children.push_back(zone.id);
        if (!idsEqual(children, { "panel", "sidebar" }))
            return juce::Result::fail("unexpected children: " + joinIds(children));

        const auto near = index.nearest(205.0f, 205.0f, 20.0f);
        if (!near.has_value() || near->id != "card")
            return juce::Result::fail("nearest should pick the card centre");
        if (index.nearest(205.0f, 205.0f, 5.0f).has_value())
            return juce::Result::fail("nearest ignored maxDistance");

        if (!sameRect(index.canvasBounds(), { -100.0f, -100.0f, 1200.0f, 1200.0f }))
            return juce::Result::fail("canvas bounds should pad the union by 100");

        if (index.stats().maxDepth != 2)
            return juce::Result::fail("maxDepth statistic is wrong");

        return juce::Result::ok();
    }

    juce::Result testGridModeMatchesLinearScan()
    {
        IndexSettings linearSettings;
        linearSettings.gridThreshold = 100000;
        IndexSettings gridSettings;
        gridSettings.gridThreshold = 0;
        gridSettings.gridCellSize = 50.0f;

        Core::SpatialDropIndex linear(linearSettings);
        Core::SpatialDropIndex gridded(gridSettings);
        if (linear.isGridActive() || !gridded.isGridActive())
            return juce::Result::fail("grid mode flags are wrong");

        juce::Random random(0x5eed);
        for (int i = 0; i < 300; ++i)
        {
            const juce::Rectangle<float> bounds(random.nextFloat() * 900.0f,
                                                random.nextFloat() * 900.0f,
                                                1.0f + random.nextFloat() * 200.0f,
                                                1.0f + random.nextFloat() * 200.0f);
            const auto depth = random.nextInt(6);
            const auto id = "zone-" + juce::String(i);
            AcceptSet accepts;
            if (i % 3 == 0)
                accepts.insert("button");

            if (auto r = linear.addZone(id, bounds, depth, std::nullopt, accepts); r.failed())
                return r;
            if (auto r = gridded.addZone(id, bounds, depth, std::nullopt, accepts); r.failed())
                return r;
        }

        if (auto r = gridded.addZone("huge", { -5000.0f, -5000.0f, 20000.0f, 20000.0f }, 0); r.failed())
            return r;
        if (auto r = linear.addZone("huge", { -5000.0f, -5000.0f, 20000.0f, 20000.0f }, 0); r.failed())
            return r;

        for (int i = 0; i < 200; ++i)
        {
            const auto x = random.nextFloat() * 1100.0f - 50.0f;
            const auto y = random.nextFloat() * 1100.0f - 50.0f;
            const juce::String type = (i % 2 == 0) ? "image" : "";
            if (linear.queryPoint(x, y, type).ids() != gridded.queryPoint(x, y, type).ids())
                return juce::Result::fail("point query diverged at " + juce::String(x) + "," + juce::String(y));

            const juce::Rectangle<float> area(x, y, random.nextFloat() * 150.0f + 1.0f, random.nextFloat() * 150.0f + 1.0f);
            if (linear.queryRegion(area, type).ids() != gridded.queryRegion(area, type).ids())
                return juce::Result::fail("region query diverged");
        }

        for (int i = 0; i < 300; i += 7)
        {
            const auto id = "zone-" + juce::String(i);
            const juce::Rectangle<float> moved(static_cast<float>(i), static_cast<float>(i), 40.0f, 40.0f);
            linear.updateBounds(id, moved);
            gridded.updateBounds(id, moved);
        }

        for (int i = 1; i < 300; i += 11)
        {
            linear.removeZone("zone-" + juce::String(i));
            gridded.removeZone("zone-" + juce::String(i));
        }

        for (int i = 0; i < 100; ++i)
        {
            const auto x = random.nextFloat() * 1000.0f;
            const auto y = random.nextFloat() * 1000.0f;
            if (linear.queryPoint(x, y).ids() != gridded.queryPoint(x, y).ids())
                return juce::Result::fail("point query diverged after mutations");
        }

        return juce::Result::ok();
    }

    juce::Result testZoneGridIncrementalUpdates()
    {
        Core::ZoneGrid grid(10.0f);
        grid.insert("a", { 0.0f, 0.0f, 15.0f, 15.0f });
        grid.insert("b", { 30.0f, 30.0f, 5.0f, 5.0f });

        const auto contains = [](const std::vector<ZoneId>& ids, const char* id)
        {
            return std::find(ids.begin(), ids.end(), ZoneId(id)) != ids.end();
        };

        if (!contains(grid.candidates(juce::Point<float>(12.0f, 12.0f)), "a"))
            return juce::Result::fail("spanning zone missing from a covered cell");
        if (contains(grid.candidates(juce::Point<float>(12.0f, 12.0f)), "b"))
            return juce::Result::fail("distant zone returned as candidate");

        grid.update("b", { 0.0f, 0.0f, 5.0f, 5.0f });
        if (!contains(grid.candidates(juce::Point<float>(2.0f, 2.0f)), "b"))
            return juce::Result::fail("moved zone not found at its new cell");
        if (contains(grid.candidates(juce::Point<float>(32.0f, 32.0f)), "b"))
            return juce::Result::fail("moved zone still listed at its old cell");

        grid.insert("wide", { -100000.0f, -100000.0f, 200000.0f, 200000.0f });
        if (grid.oversizedCount() != 1 || !contains(grid.candidates(juce::Point<float>(500.0f, 500.0f)), "wide"))
            return juce::Result::fail("oversized zone should be returned everywhere");

        if (!grid.remove("a") || grid.remove("a") || grid.size() != 2)
            return juce::Result::fail("remove bookkeeping is wrong");

        return juce::Result::ok();
    }

    juce::Result testValidatorRules()
    {
        Core::SpatialDropIndex index;
        Core::DropValidator validator(index);

        if (auto r = index.addZone("list", { 0.0f, 0.0f, 200.0f, 200.0f }, 0, std::nullopt, { "button" }, containerConstraints(2, 2)); r.failed())
            return r;
        if (auto r = index.addZone("hero", { 300.0f, 0.0f, 100.0f, 100.0f }, 0, std::nullopt, {}, slotConstraints(juce::String("image"), true, false)); r.failed())
            return r;
        if (auto r = index.addZone("taken", { 500.0f, 0.0f, 100.0f, 100.0f }, 0, std::nullopt, {}, slotConstraints(std::nullopt, true, true)); r.failed())
            return r;
        if (auto r = index.addZone("shared", { 700.0f, 0.0f, 100.0f, 100.0f }, 0, std::nullopt, {}, slotConstraints(std::nullopt, false, true)); r.failed())
            return r;

        auto narrow = containerConstraints(std::nullopt, 0);
        narrow.availableWidth = 200.0f;
        if (auto r = index.addZone("narrow", { 900.0f, 0.0f, 200.0f, 100.0f }, 0, std::nullopt, {}, narrow); r.failed())
            return r;

        const auto button = makePayload("button");
        const auto image = makePayload("image", "img-1", "Logo", "media");
        if (!button.has_value() || !image.has_value())
            return juce::Result::fail("payload creation failed");

        const auto typeRejection = validator.validate("list", *image);
        if (typeRejection.isValid || typeRejection.reason != "Component type 'image' not accepted")
            return juce::Result::fail("type rule should run before capacity: " + typeRejection.reason);
        if (typeRejection.violatedConstraints[0] != Core::ConstraintKey::accepts)
            return juce::Result::fail("type rejection key is wrong");

        const auto full = validator.validate("list", *button);
        if (full.isValid || full.reason != "Container already has maximum children (2)")
            return juce::Result::fail("full container accepted: " + full.reason);

        ZoneConstraintsPatch raise;
        raise.maxChildren = 3;
        if (!validator.updateConstraints("list", raise))
            return juce::Result::fail("updateConstraints failed");
        const auto roomy = validator.validate("list", *button);
        if (!roomy.isValid || roomy.reason != "Valid drop target")
            return juce::Result::fail("raised limit should accept: " + roomy.reason);

        const auto wrongType = validator.validate("hero", *button);
        if (wrongType.isValid || wrongType.reason != "Slot requires 'image' component"
            || wrongType.suggestedAction != "Use a image component instead")
            return juce::Result::fail("slot type requirement not enforced: " + wrongType.reason);
        if (!validator.validate("hero", *image).isValid)
            return juce::Result::fail("matching slot type rejected");

        if (validator.validate("taken", *button).reason != "Slot is already occupied")
            return juce::Result::fail("occupied exclusive slot accepted");
        if (!validator.validate("shared", *button).isValid)
            return juce::Result::fail("non-exclusive slot should accept while occupied");

        PropertyBag wide;
        wide.set("constraints", makeObject({ { "min_width", 300 } }));
        const auto large = makePayload("table", "tbl-1", "Grid", "data", wide);
        const auto tooLarge = validator.validate("narrow", *large);
        if (tooLarge.isValid || tooLarge.reason != "Component too large for drop zone"
            || tooLarge.violatedConstraints[0] != Core::ConstraintKey::minWidth)
            return juce::Result::fail("size rule not enforced: " + tooLarge.reason);

        PropertyBag picky;
        picky.set("constraints", makeObject({ { "invalid_parents", juce::Array<juce::var> { "slot" } } }));
        const auto nav = makePayload("nav", "nav-1", "Menu", "navigation", picky);
        const auto excluded = validator.validate("shared", *nav);
        if (excluded.isValid || excluded.reason != "Component cannot be placed in slot")
            return juce::Result::fail("invalid parent rule not enforced: " + excluded.reason);
        if (!validator.validate("narrow", *nav).isValid)
            return juce::Result::fail("invalid parent rule applied to the wrong kind");

        const auto unknown = validator.validate("ghost", *button);
        if (unknown.isValid || unknown.violatedConstraints[0] != Core::ConstraintKey::zone)
            return juce::Result::fail("unknown zone should be rejected");

        return juce::Result::ok();
    }

    juce::Result testAcceptsWildcardAndEmpty()
    {
        for (const auto& type : { "button", "image", "widget-x" })
        {
            if (!acceptsType({}, type) || !acceptsType({ kWildcardType }, type))
                return juce::Result::fail(juce::String("open accept set rejected ") + type);
        }

        if (acceptsType({ "button" }, "image") || !acceptsType({ "button" }, "button"))
            return juce::Result::fail("explicit accept set mismatch");

        return juce::Result::ok();
    }

    juce::Result testNestedDropScenario()
    {
        Core::SpatialDropIndex index;
        Core::DropValidator validator(index);

        if (auto r = index.addZone("A", { 0.0f, 0.0f, 200.0f, 200.0f }, 0, std::nullopt, { "button" }); r.failed())
            return r;
        if (auto r = index.addZone("B", { 50.0f, 50.0f, 50.0f, 50.0f }, 1, ZoneId("A"), { kWildcardType }); r.failed())
            return r;

        if (!idsEqual(index.queryPoint(60.0f, 60.0f).ids(), { "B", "A" }))
            return juce::Result::fail("expected [B, A] at (60,60)");

        const auto image = makePayload("image", "img-1", "Logo", "media");
        if (!validator.validate("B", *image).isValid)
            return juce::Result::fail("B should accept an image");

        const auto onA = validator.validate("A", *image);
        if (onA.isValid || onA.reason != "Component type 'image' not accepted")
            return juce::Result::fail("A should reject an image by type: " + onA.reason);

        return juce::Result::ok();
    }
}

int main()
{
    const TestList tests = {
        { "PayloadCreation", testPayloadCreation },
        { "PayloadJsonRoundTrip", testPayloadJsonRoundTrip },
        { "PayloadJsonRejectsBadRecords", testPayloadJsonRejectsBadRecords },
        { "QueryPointOrdering", testQueryPointOrdering },
        { "AcceptFiltering", testAcceptFiltering },
        { "CacheHitsAndInvalidation", testCacheHitsAndInvalidation },
        { "CacheEviction", testCacheEviction },
        { "RemoveCascadesToDescendants", testRemoveCascadesToDescendants },
        { "AddZoneRejections", testAddZoneRejections },
        { "HierarchyNearestAndCanvas", testHierarchyNearestAndCanvas },
        { "GridModeMatchesLinearScan", testGridModeMatchesLinearScan },
        { "ZoneGridIncrementalUpdates", testZoneGridIncrementalUpdates },
        { "ValidatorRules", testValidatorRules },
        { "AcceptsWildcardAndEmpty", testAcceptsWildcardAndEmpty },
        { "NestedDropScenario", testNestedDropScenario }
    };

    return runTests(tests, "Naerim index smoke passed.");
}
