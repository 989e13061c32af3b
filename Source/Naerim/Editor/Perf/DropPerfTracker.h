#pragma once

#include <juce_core/juce_core.h>
#include <array>
#include <optional>
#include <vector>

namespace Naerim::Runtime
{
    class DropDiagnostics;
}

namespace Naerim::Ui::Perf
{
    enum class DropOperation
    {
        beginDrag,
        dragOver,
        drop
    };

    juce::String dropOperationToKey(DropOperation operation);

    struct PerfSummary
    {
        DropOperation operation = DropOperation::dragOver;
        int count = 0;
        double p50Ms = 0.0;
        double p95Ms = 0.0;
        double maxMs = 0.0;
        int overFrameBudget = 0;
    };

    // Latency of the pointer-driven drag operations, measured against the
    // feedback frame budget. Keeps the newest samples per operation.
    class DropPerfTracker
    {
    public:
        class Scope
        {
        public:
            Scope(DropPerfTracker& ownerIn, DropOperation operationIn);
            ~Scope();

            Scope(const Scope&) = delete;
            Scope& operator=(const Scope&) = delete;

        private:
            DropPerfTracker& owner;
            DropOperation operation;
            double startedMs = 0.0;
        };

        explicit DropPerfTracker(double frameBudgetMsIn = 1000.0 / 60.0,
                                 int samplesPerOperationIn = 512,
                                 Runtime::DropDiagnostics* diagnosticsIn = nullptr);

        void record(DropOperation operation, double elapsedMs);
        [[nodiscard]] std::optional<PerfSummary> summaryFor(DropOperation operation) const;
        [[nodiscard]] std::vector<PerfSummary> summarize() const;
        [[nodiscard]] double frameBudgetMs() const noexcept { return budgetMs; }
        void clear();

    private:
        struct Samples
        {
            std::vector<double> ring;
            size_t next = 0;
            int overBudget = 0;
        };

        static constexpr size_t kOperationCount = 3;

        PerfSummary summarizeLocked(DropOperation operation) const;

        const double budgetMs;
        const size_t capacity;
        Runtime::DropDiagnostics* diagnostics = nullptr;

        mutable juce::CriticalSection lock;
        std::array<Samples, kOperationCount> samples;
    };
}
