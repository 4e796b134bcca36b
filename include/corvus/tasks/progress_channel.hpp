#pragma once

#include "corvus/tasks/task.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace corvus::tasks
{

struct ProgressEvent
{
    enum class Type
    {
        Update,
        Completed,
        Error
    };

    Type type = Type::Update;
    float progress = 0.0f;
    std::string message;

    static ProgressEvent update(float progress) { return {Type::Update, progress, {}}; }
    static ProgressEvent completed() { return {Type::Completed, 1.0f, {}}; }
    static ProgressEvent error(std::string message) { return {Type::Error, 0.0f, std::move(message)}; }
};

const char *progressEventTypeName(ProgressEvent::Type type) noexcept;

struct TaskEvent
{
    TaskId taskId = 0;
    ProgressEvent event;
};

// Unbounded multi-producer queue. Events queued before close() are still
// delivered; receive() returns nullopt only once the queue is closed and empty.
class ProgressChannel
{
public:
    ProgressChannel() = default;
    ProgressChannel(const ProgressChannel &) = delete;
    ProgressChannel &operator=(const ProgressChannel &) = delete;

    bool send(TaskEvent event);

    std::optional<TaskEvent> receive();
    std::optional<TaskEvent> tryReceive();
    std::optional<TaskEvent> receiveFor(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    std::optional<TaskEvent> popLocked();

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<TaskEvent> queue_;
    bool closed_ = false;
};

// Write end handed to executors. Copies share the same channel.
class ProgressSender
{
public:
    ProgressSender() = default;
    explicit ProgressSender(std::shared_ptr<ProgressChannel> channel)
        : channel_(std::move(channel))
    {
    }

    bool send(TaskId taskId, ProgressEvent event) const;
    bool valid() const noexcept { return static_cast<bool>(channel_); }

private:
    std::shared_ptr<ProgressChannel> channel_;
};

} // namespace corvus::tasks
