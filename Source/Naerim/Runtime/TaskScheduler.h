#pragma once

#include <juce_core/juce_core.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace Naerim::Runtime
{
    // Handle to a task queued on a TaskScheduler. Copies share the same task;
    // cancel() is idempotent and a no-op once the task has started.
    class ScheduledTask
    {
    public:
        ScheduledTask() = default;

        bool cancel() noexcept;
        [[nodiscard]] bool isPending() const noexcept;
        [[nodiscard]] bool hasFired() const noexcept;
        [[nodiscard]] bool isValid() const noexcept { return state != nullptr; }

    private:
        friend class TaskScheduler;

        enum class Status
        {
            pending,
            cancelled,
            fired
        };

        struct State
        {
            std::atomic<Status> status { Status::pending };
        };

        explicit ScheduledTask(std::shared_ptr<State> stateIn);

        std::shared_ptr<State> state;
    };

    class TaskScheduler
    {
    public:
        using Task = std::function<void()>;

        virtual ~TaskScheduler() = default;

        ScheduledTask schedule(double delayMs, Task task, const juce::String& label = {});
        [[nodiscard]] int pendingCount() const;
        void cancelAll();

        [[nodiscard]] virtual double nowMs() const = 0;

    protected:
        // Runs every task due at or before nowValue, outside the queue lock.
        int runDueTasks(double nowValue);
        [[nodiscard]] bool nextDueMs(double& dueOut) const;

        virtual void taskQueued() {}

    private:
        struct Entry
        {
            double dueMs = 0.0;
            std::uint64_t sequence = 0;
            Task task;
            juce::String label;
            std::shared_ptr<ScheduledTask::State> state;
        };

        std::vector<Entry> takeDueEntries(double nowValue);
        static void runGuarded(Entry& entry);

        mutable juce::CriticalSection lock;
        std::vector<Entry> entries;
        std::uint64_t nextSequence = 1;
    };

    // Wrapped tasks reach their owner only while it is alive. revoke() waits for
    // a wrapped task that is already running.
    class TaskOwnerGuard
    {
    public:
        TaskOwnerGuard();
        ~TaskOwnerGuard();

        TaskOwnerGuard(const TaskOwnerGuard&) = delete;
        TaskOwnerGuard& operator=(const TaskOwnerGuard&) = delete;

        TaskScheduler::Task wrap(TaskScheduler::Task task) const;
        void revoke();

    private:
        struct State
        {
            juce::CriticalSection lock;
            bool alive = true;
        };

        std::shared_ptr<State> state;
    };

    // Fires tasks from a dedicated background thread.
    class ThreadTaskScheduler final : public TaskScheduler,
                                      private juce::Thread
    {
    public:
        ThreadTaskScheduler();
        ~ThreadTaskScheduler() override;

        [[nodiscard]] double nowMs() const override;

    private:
        void run() override;
        void taskQueued() override;

        juce::WaitableEvent wakeEvent;
    };

    // Time only moves when advance() is called. Used by hosts that drive the
    // engine from their own frame clock, and by tests.
    class ManualTaskScheduler final : public TaskScheduler
    {
    public:
        explicit ManualTaskScheduler(double startMs = 0.0);

        [[nodiscard]] double nowMs() const override;
        int advance(double deltaMs);
        int runPending();

    private:
        std::atomic<double> currentMs;
    };
}
