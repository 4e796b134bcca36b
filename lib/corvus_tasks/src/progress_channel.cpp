#include "corvus/tasks/progress_channel.hpp"

namespace corvus::tasks
{

const char *progressEventTypeName(ProgressEvent::Type type) noexcept
{
    switch (type)
    {
    case ProgressEvent::Type::Update:
        return "update";
    case ProgressEvent::Type::Completed:
        return "completed";
    case ProgressEvent::Type::Error:
        return "error";
    }
    return "unknown";
}

bool ProgressChannel::send(TaskEvent event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        queue_.push_back(std::move(event));
    }
    available_.notify_one();
    return true;
}

std::optional<TaskEvent> ProgressChannel::receive()
{
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !queue_.empty() || closed_; });
    return popLocked();
}

std::optional<TaskEvent> ProgressChannel::tryReceive()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked();
}

std::optional<TaskEvent> ProgressChannel::receiveFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    return popLocked();
}

void ProgressChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool ProgressChannel::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressChannel::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::optional<TaskEvent> ProgressChannel::popLocked()
{
    if (queue_.empty())
        return std::nullopt;
    TaskEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

bool ProgressSender::send(TaskId taskId, ProgressEvent event) const
{
    if (!channel_)
        return false;
    return channel_->send(TaskEvent{taskId, std::move(event)});
}

} // namespace corvus::tasks
