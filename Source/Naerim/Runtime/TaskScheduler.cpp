#include "Naerim/Runtime/TaskScheduler.h"

#include <algorithm>
#include <cmath>

namespace Naerim::Runtime
{
    ScheduledTask::ScheduledTask(std::shared_ptr<State> stateIn)
        : state(std::move(stateIn))
    {
    }

    bool ScheduledTask::cancel() noexcept
    {
        if (state == nullptr)
            return false;

        auto expected = Status::pending;
        return state->status.compare_exchange_strong(expected, Status::cancelled);
    }

    bool ScheduledTask::isPending() const noexcept
    {
        return state != nullptr && state->status.load() == Status::pending;
    }

    bool ScheduledTask::hasFired() const noexcept
    {
        return state != nullptr && state->status.load() == Status::fired;
    }

    ScheduledTask TaskScheduler::schedule(double delayMs, Task task, const juce::String& label)
    {
        if (task == nullptr)
            return {};

        if (!std::isfinite(delayMs) || delayMs < 0.0)
            delayMs = 0.0;

        auto state = std::make_shared<ScheduledTask::State>();
        {
            const juce::ScopedLock sl(lock);
            Entry entry;
            entry.dueMs = nowMs() + delayMs;
            entry.sequence = nextSequence++;
            entry.task = std::move(task);
            entry.label = label;
            entry.state = state;
            entries.push_back(std::move(entry));
        }

        taskQueued();
        return ScheduledTask(std::move(state));
    }

    int TaskScheduler::pendingCount() const
    {
        const juce::ScopedLock sl(lock);
        return static_cast<int>(std::count_if(entries.begin(),
                                              entries.end(),
                                              [](const Entry& entry)
                                              {
                                                  return entry.state->status.load() == ScheduledTask::Status::pending;
                                              }));
    }

    void TaskScheduler::cancelAll()
    {
        std::vector<Entry> dropped;
        {
            const juce::ScopedLock sl(lock);
            dropped.swap(entries);
        }

        for (auto& entry : dropped)
        {
            auto expected = ScheduledTask::Status::pending;
            entry.state->status.compare_exchange_strong(expected, ScheduledTask::Status::cancelled);
        }
    }

    int TaskScheduler::runDueTasks(double nowValue)
    {
        int executed = 0;

        // Tasks queued by a running task with no delay fire in the same pass.
        for (auto due = takeDueEntries(nowValue); !due.empty(); due = takeDueEntries(nowValue))
        {
            for (auto& entry : due)
            {
                auto expected = ScheduledTask::Status::pending;
                if (!entry.state->status.compare_exchange_strong(expected, ScheduledTask::Status::fired))
                    continue;

                runGuarded(entry);
                ++executed;
            }
        }

        return executed;
    }

    bool TaskScheduler::nextDueMs(double& dueOut) const
    {
        const juce::ScopedLock sl(lock);
        bool found = false;
        for (const auto& entry : entries)
        {
            if (entry.state->status.load() != ScheduledTask::Status::pending)
                continue;

            if (!found || entry.dueMs < dueOut)
                dueOut = entry.dueMs;
            found = true;
        }

        return found;
    }

    std::vector<TaskScheduler::Entry> TaskScheduler::takeDueEntries(double nowValue)
    {
        std::vector<Entry> due;

        const juce::ScopedLock sl(lock);
        auto keep = std::stable_partition(entries.begin(),
                                          entries.end(),
                                          [nowValue](const Entry& entry)
                                          {
                                              if (entry.state->status.load() != ScheduledTask::Status::pending)
                                                  return false;
                                              return entry.dueMs > nowValue;
                                          });

        for (auto it = keep; it != entries.end(); ++it)
        {
            if (it->state->status.load() == ScheduledTask::Status::pending)
                due.push_back(std::move(*it));
        }
        entries.erase(keep, entries.end());

        std::sort(due.begin(),
                  due.end(),
                  [](const Entry& lhs, const Entry& rhs)
                  {
                      if (lhs.dueMs != rhs.dueMs)
                          return lhs.dueMs < rhs.dueMs;
                      return lhs.sequence < rhs.sequence;
                  });
        return due;
    }

    void TaskScheduler::runGuarded(Entry& entry)
    {
        try
        {
            entry.task();
        }
        catch (const std::exception& e)
        {
            juce::Logger::writeToLog("[Naerim][Scheduler] error: task '" + entry.label + "' threw: " + juce::String(e.what()));
        }
        catch (...)
        {
            juce::Logger::writeToLog("[Naerim][Scheduler] error: task '" + entry.label + "' threw a non-standard exception");
        }
    }

    TaskOwnerGuard::TaskOwnerGuard()
        : state(std::make_shared<State>())
    {
    }

    TaskOwnerGuard::~TaskOwnerGuard()
    {
        revoke();
    }

    TaskScheduler::Task TaskOwnerGuard::wrap(TaskScheduler::Task task) const
    {
        return [guarded = state, task = std::move(task)]
        {
            const juce::ScopedLock sl(guarded->lock);
            if (guarded->alive)
                task();
        };
    }

    void TaskOwnerGuard::revoke()
    {
        const juce::ScopedLock sl(state->lock);
        state->alive = false;
    }

    ThreadTaskScheduler::ThreadTaskScheduler()
        : juce::Thread("Naerim Task Scheduler")
    {
        startThread();
    }

    ThreadTaskScheduler::~ThreadTaskScheduler()
    {
        cancelAll();
        signalThreadShouldExit();
        wakeEvent.signal();
        stopThread(2000);
    }

    double ThreadTaskScheduler::nowMs() const
    {
        return juce::Time::getMillisecondCounterHiRes();
    }

    void ThreadTaskScheduler::run()
    {
        while (!threadShouldExit())
        {
            runDueTasks(nowMs());

            double dueMs = 0.0;
            if (!nextDueMs(dueMs))
            {
                wakeEvent.wait(-1);
                continue;
            }

            const auto waitMs = static_cast<int>(std::ceil(dueMs - nowMs()));
            if (waitMs > 0)
                wakeEvent.wait(waitMs);
        }
    }

    void ThreadTaskScheduler::taskQueued()
    {
        wakeEvent.signal();
    }

    ManualTaskScheduler::ManualTaskScheduler(double startMs)
        : currentMs(startMs)
    {
    }

    double ManualTaskScheduler::nowMs() const
    {
        return currentMs.load();
    }

    int ManualTaskScheduler::advance(double deltaMs)
    {
        if (std::isfinite(deltaMs) && deltaMs > 0.0)
            currentMs.store(currentMs.load() + deltaMs);

        return runDueTasks(currentMs.load());
    }

    int ManualTaskScheduler::runPending()
    {
        return runDueTasks(currentMs.load());
    }
}
