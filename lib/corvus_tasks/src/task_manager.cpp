#include "corvus/tasks/task_manager.hpp"

#include "corvus/log.hpp"

#include <algorithm>
#include <system_error>

namespace corvus::tasks
{
namespace
{

std::atomic<TaskId> nextTaskId{1};

std::string taskLabel(TaskId id)
{
    return "task " + std::to_string(id);
}

} // namespace

TaskManager::TaskManager(ExecutorContext context)
    : context_(std::move(context)),
      channel_(std::make_shared<ProgressChannel>())
{
}

TaskManager::~TaskManager()
{
    waitForIdle();
    channel_->close();
}

TaskId TaskManager::addTask(TaskKind kind, std::string description)
{
    const TaskId id = nextTaskId.fetch_add(1, std::memory_order_relaxed);
    Task task;
    task.id = id;
    task.kind = std::move(kind);
    task.status = TaskStatus::pending();
    task.description = std::move(description);

    CORVUS_LOG_INFO(taskLabel(id) + " queued: " + task.description);
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
    return id;
}

TaskId TaskManager::addTask(TaskKind kind)
{
    std::string description = describeTask(kind);
    return addTask(std::move(kind), std::move(description));
}

std::vector<Task> TaskManager::getTasks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

std::optional<Task> TaskManager::findTask(TaskId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const Task &task) { return task.id == id; });
    if (it == tasks_.end())
        return std::nullopt;
    return *it;
}

std::size_t TaskManager::processPendingTasks()
{
    reapFinishedWorkers();

    std::vector<std::pair<TaskId, TaskKind>> launch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &task : tasks_)
        {
            if (task.status.state != TaskState::Pending)
                continue;
            task.status = TaskStatus::inProgress(0.0f);
            launch.emplace_back(task.id, task.kind);
        }
    }

    std::size_t started = 0;
    for (auto &[id, kind] : launch)
    {
        CORVUS_LOG_DEBUG(taskLabel(id) + " dispatched (" + taskKindName(kind) + ")");
        auto worker = std::make_unique<Worker>();
        worker->taskId = id;
        Worker *raw = worker.get();
        ProgressSender sender(channel_);
        try
        {
            worker->thread = std::thread([this, raw, id = id, kind = std::move(kind), sender]() {
                log::setThreadName(taskLabel(id));
                runTask(id, kind, context_, sender);
                log::clearThreadName();
                raw->finished.store(true, std::memory_order_release);
            });
        }
        catch (const std::system_error &error)
        {
            // Already InProgress; the Error event moves it to Failed.
            std::string reason = std::string("cannot start worker: ") + error.what();
            CORVUS_LOG_ERROR(taskLabel(id) + ": " + reason);
            channel_->send({id, ProgressEvent::error(std::move(reason))});
            continue;
        }

        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.push_back(std::move(worker));
        ++started;
    }
    return started;
}

bool TaskManager::waitForEvent()
{
    std::optional<AppliedEvent> applied = applyNextEvent();
    return applied && applied->applied && applied->eventType == ProgressEvent::Type::Completed;
}

std::optional<bool> TaskManager::pollEvent()
{
    std::optional<AppliedEvent> applied = tryApplyNextEvent();
    if (!applied)
        return std::nullopt;
    return applied->applied && applied->eventType == ProgressEvent::Type::Completed;
}

std::optional<AppliedEvent> TaskManager::applyNextEvent()
{
    std::optional<TaskEvent> event = channel_->receive();
    if (!event)
        return std::nullopt;
    return apply(*event);
}

std::optional<AppliedEvent> TaskManager::tryApplyNextEvent()
{
    std::optional<TaskEvent> event = channel_->tryReceive();
    if (!event)
        return std::nullopt;
    return apply(*event);
}

AppliedEvent TaskManager::apply(const TaskEvent &event)
{
    AppliedEvent result;
    result.taskId = event.taskId;
    result.eventType = event.event.type;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&event](const Task &task) { return task.id == event.taskId; });
    if (it == tasks_.end())
    {
        CORVUS_LOG_DEBUG("ignoring " + std::string(progressEventTypeName(event.event.type)) + " event for unknown " +
                         taskLabel(event.taskId));
        return result;
    }
    if (it->status.isTerminal())
    {
        CORVUS_LOG_DEBUG("ignoring " + std::string(progressEventTypeName(event.event.type)) + " event for finished " +
                         taskLabel(event.taskId));
        result.status = it->status;
        return result;
    }

    switch (event.event.type)
    {
    case ProgressEvent::Type::Update:
        it->status = TaskStatus::inProgress(std::clamp(event.event.progress, 0.0f, 1.0f));
        break;
    case ProgressEvent::Type::Completed:
        it->status = TaskStatus::completed();
        CORVUS_LOG_INFO(taskLabel(it->id) + " completed: " + it->description);
        break;
    case ProgressEvent::Type::Error:
        it->status = TaskStatus::failed(event.event.message);
        CORVUS_LOG_ERROR(taskLabel(it->id) + " failed: " + event.event.message);
        break;
    }
    result.applied = true;
    result.status = it->status;
    return result;
}

std::size_t TaskManager::runningExecutors() const
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(), [](const auto &worker) {
        return !worker->finished.load(std::memory_order_acquire);
    }));
}

ProgressSender TaskManager::progressSender() const
{
    return ProgressSender(channel_);
}

void TaskManager::waitForIdle()
{
    std::vector<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    for (auto &worker : workers)
    {
        if (worker->thread.joinable())
            worker->thread.join();
    }
}

void TaskManager::reapFinishedWorkers()
{
    std::lock_guard<std::mutex> lock(workersMutex_);
    auto finished = std::stable_partition(workers_.begin(), workers_.end(), [](const auto &worker) {
        return !worker->finished.load(std::memory_order_acquire);
    });
    for (auto it = finished; it != workers_.end(); ++it)
    {
        if ((*it)->thread.joinable())
            (*it)->thread.join();
    }
    workers_.erase(finished, workers_.end());
}

} // namespace corvus::tasks
