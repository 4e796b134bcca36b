#pragma once

#include "corvus/tasks/executors.hpp"
#include "corvus/tasks/progress_channel.hpp"
#include "corvus/tasks/task.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace corvus::tasks
{

struct AppliedEvent
{
    TaskId taskId = 0;
    ProgressEvent::Type eventType = ProgressEvent::Type::Update;
    bool applied = false; // false when no task matched or the task had already finished
    TaskStatus status;    // status after the event, valid when applied
};

// Ordered registry of submitted tasks. Dispatch and event consumption happen
// on the caller's thread; every dispatched task runs on a worker thread of
// its own and reports back through the progress channel.
class TaskManager
{
public:
    explicit TaskManager(ExecutorContext context = {});
    ~TaskManager();

    TaskManager(const TaskManager &) = delete;
    TaskManager &operator=(const TaskManager &) = delete;

    TaskId addTask(TaskKind kind, std::string description);
    TaskId addTask(TaskKind kind);

    std::vector<Task> getTasks() const;
    std::optional<Task> findTask(TaskId id) const;

    // Starts every Pending task and returns how many worker threads started.
    // A task whose thread cannot be created fails with an Error event.
    std::size_t processPendingTasks();

    // Blocks for one event and applies it. True only for an applied Completed.
    bool waitForEvent();
    std::optional<bool> pollEvent();

    std::optional<AppliedEvent> applyNextEvent();
    std::optional<AppliedEvent> tryApplyNextEvent();

    std::size_t runningExecutors() const;
    ProgressSender progressSender() const;
    void waitForIdle();

private:
    struct Worker
    {
        TaskId taskId = 0;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    AppliedEvent apply(const TaskEvent &event);
    void reapFinishedWorkers();

    ExecutorContext context_;
    std::shared_ptr<ProgressChannel> channel_;

    mutable std::mutex mutex_;
    std::vector<Task> tasks_;

    mutable std::mutex workersMutex_;
    std::vector<std::unique_ptr<Worker>> workers_;
};

} // namespace corvus::tasks
