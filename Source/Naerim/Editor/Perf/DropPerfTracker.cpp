#include "Naerim/Editor/Perf/DropPerfTracker.h"

#include "Naerim/Runtime/DropDiagnostics.h"
#include <algorithm>
#include <cmath>

namespace Naerim::Ui::Perf
{
    namespace
    {
        constexpr DropOperation kOperations[] = { DropOperation::beginDrag, DropOperation::dragOver, DropOperation::drop };

        size_t slotOf(DropOperation operation) noexcept
        {
            return static_cast<size_t>(operation);
        }

        // Nearest-rank percentile over sorted values.
        double percentile(const std::vector<double>& sorted, double fraction)
        {
            const auto rank = static_cast<size_t>(std::ceil(fraction * static_cast<double>(sorted.size())));
            return sorted[std::min(sorted.size(), std::max<size_t>(1, rank)) - 1];
        }
    }

    juce::String dropOperationToKey(DropOperation operation)
    {
        switch (operation)
        {
            case DropOperation::beginDrag: return "begin_drag";
            case DropOperation::dragOver: return "drag_over";
            case DropOperation::drop: return "drop";
        }

        return "drag_over";
    }

    DropPerfTracker::Scope::Scope(DropPerfTracker& ownerIn, DropOperation operationIn)
        : owner(ownerIn),
          operation(operationIn),
          startedMs(juce::Time::getMillisecondCounterHiRes())
    {
    }

    DropPerfTracker::Scope::~Scope()
    {
        owner.record(operation, juce::Time::getMillisecondCounterHiRes() - startedMs);
    }

    DropPerfTracker::DropPerfTracker(double frameBudgetMsIn, int samplesPerOperationIn, Runtime::DropDiagnostics* diagnosticsIn)
        : budgetMs(frameBudgetMsIn > 0.0 && std::isfinite(frameBudgetMsIn) ? frameBudgetMsIn : 1000.0 / 60.0),
          capacity(static_cast<size_t>(std::max(1, samplesPerOperationIn))),
          diagnostics(diagnosticsIn)
    {
    }

    void DropPerfTracker::record(DropOperation operation, double elapsedMs)
    {
        if (!std::isfinite(elapsedMs) || elapsedMs < 0.0)
            return;

        const auto overBudget = elapsedMs > budgetMs;
        {
            const juce::ScopedLock sl(lock);
            auto& slot = samples[slotOf(operation)];
            if (slot.ring.size() < capacity)
                slot.ring.push_back(elapsedMs);
            else
                slot.ring[slot.next] = elapsedMs;

            slot.next = (slot.next + 1) % capacity;
            if (overBudget)
                slot.overBudget += 1;
        }

        if (overBudget && diagnostics != nullptr)
            diagnostics->warning("Perf", dropOperationToKey(operation) + " took " + juce::String(elapsedMs, 2)
                                             + " ms, frame budget " + juce::String(budgetMs, 2) + " ms");
    }

    std::optional<PerfSummary> DropPerfTracker::summaryFor(DropOperation operation) const
    {
        const juce::ScopedLock sl(lock);
        if (samples[slotOf(operation)].ring.empty())
            return std::nullopt;
        return summarizeLocked(operation);
    }

    std::vector<PerfSummary> DropPerfTracker::summarize() const
    {
        const juce::ScopedLock sl(lock);
        std::vector<PerfSummary> result;
        for (const auto operation : kOperations)
        {
            if (!samples[slotOf(operation)].ring.empty())
                result.push_back(summarizeLocked(operation));
        }

        return result;
    }

    void DropPerfTracker::clear()
    {
        const juce::ScopedLock sl(lock);
        for (auto& slot : samples)
            slot = {};
    }

    PerfSummary DropPerfTracker::summarizeLocked(DropOperation operation) const
    {
        const auto& slot = samples[slotOf(operation)];
        auto sorted = slot.ring;
        std::sort(sorted.begin(), sorted.end());

        PerfSummary summary;
        summary.operation = operation;
        summary.count = static_cast<int>(sorted.size());
        summary.p50Ms = percentile(sorted, 0.50);
        summary.p95Ms = percentile(sorted, 0.95);
        summary.maxMs = sorted.back();
        summary.overFrameBudget = slot.overBudget;
        return summary;
    }
}
