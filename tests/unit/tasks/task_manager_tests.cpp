#include <gtest/gtest.h>

#include "corvus/tasks/task_manager.hpp"
#include "support/temp_directory.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>
#include <unistd.h>

using namespace corvus::tasks;
using corvus::test::readFile;
using corvus::test::TempDirectory;
using corvus::test::writeFile;

namespace fs = std::filesystem;

namespace
{

// Applies events until the task reaches a terminal state.
TaskStatus waitForTerminal(TaskManager &manager, TaskId id)
{
    for (;;)
    {
        std::optional<Task> task = manager.findTask(id);
        if (!task)
            return {};
        if (task->status.isTerminal())
            return task->status;
        if (!manager.applyNextEvent())
            return task->status;
    }
}

// Command runner that blocks until released, so a task can be observed mid-flight.
struct Gate
{
    std::mutex mutex;
    std::condition_variable changed;
    bool open = false;
    int waiting = 0;

    CommandResult pass()
    {
        std::unique_lock<std::mutex> lock(mutex);
        ++waiting;
        changed.notify_all();
        changed.wait(lock, [this] { return open; });
        CommandResult result;
        result.launched = true;
        result.exitCode = 0;
        return result;
    }

    void waitForCallers(int count)
    {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait(lock, [this, count] { return waiting >= count; });
    }

    void release()
    {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
        changed.notify_all();
    }
};

} // namespace

TEST(TaskManager, NewTasksArePendingWithUniqueIds)
{
    TaskManager manager;
    TaskId first = manager.addTask(CreateDirectoryOperation{"/tmp/a"}, "first");
    TaskId second = manager.addTask(CreateDirectoryOperation{"/tmp/b"}, "second");
    EXPECT_NE(first, second);

    auto tasks = manager.getTasks();
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].id, first);
    EXPECT_EQ(tasks[1].id, second);
    EXPECT_EQ(tasks[0].description, "first");
    EXPECT_EQ(tasks[0].status.state, TaskState::Pending);
    EXPECT_EQ(tasks[1].status.state, TaskState::Pending);
}

TEST(TaskManager, IdsAreUniqueAcrossManagers)
{
    std::set<TaskId> ids;
    for (int i = 0; i < 3; ++i)
    {
        TaskManager manager;
        ids.insert(manager.addTask(DeleteOperation{"/nonexistent"}));
        ids.insert(manager.addTask(DeleteOperation{"/nonexistent"}));
    }
    EXPECT_EQ(ids.size(), 6u);
}

TEST(TaskManager, DefaultDescriptionComesFromOperation)
{
    TaskManager manager;
    TaskId id = manager.addTask(CopyOperation{"/home/u/a.txt", "/home/u/dir/a.txt"});
    auto task = manager.findTask(id);
    ASSERT_TRUE(task);
    EXPECT_EQ(task->description, "Copy \"a.txt\" -> \"/home/u/dir\"");
    EXPECT_FALSE(manager.findTask(id + 1000));
}

TEST(TaskManager, CopyTaskCompletes)
{
    TempDirectory temp("manager-copy");
    writeFile(temp / "a.txt", "hi");
    fs::create_directory(temp / "dir");

    TaskManager manager;
    TaskId id = manager.addTask(CopyOperation{temp / "a.txt", temp / "dir" / "a.txt"}, "copy a");
    EXPECT_EQ(manager.processPendingTasks(), 1u);
    EXPECT_EQ(manager.findTask(id)->status.state, TaskState::InProgress);

    EXPECT_TRUE(manager.waitForEvent());
    EXPECT_EQ(manager.findTask(id)->status, TaskStatus::completed());
    EXPECT_EQ(readFile(temp / "dir" / "a.txt"), "hi");
    EXPECT_TRUE(fs::exists(temp / "a.txt"));
}

TEST(TaskManager, MoveTaskCompletes)
{
    TempDirectory temp("manager-move");
    writeFile(temp / "a.txt", "hi");
    fs::create_directory(temp / "dir");

    TaskManager manager;
    TaskId id = manager.addTask(MoveOperation{temp / "a.txt", temp / "dir" / "a.txt"});
    manager.processPendingTasks();
    EXPECT_TRUE(manager.waitForEvent());
    EXPECT_EQ(manager.findTask(id)->status.state, TaskState::Completed);
    EXPECT_FALSE(fs::exists(temp / "a.txt"));
    EXPECT_EQ(readFile(temp / "dir" / "a.txt"), "hi");
}

TEST(TaskManager, FailedDeleteRecordsReason)
{
    TaskManager manager;
    TaskId id = manager.addTask(DeleteOperation{"/nonexistent-corvus-manager-path"});
    manager.processPendingTasks();

    EXPECT_FALSE(manager.waitForEvent());
    auto task = manager.findTask(id);
    ASSERT_TRUE(task);
    EXPECT_EQ(task->status.state, TaskState::Failed);
    EXPECT_FALSE(task->status.failureReason.empty());
}

TEST(TaskManager, ArchiveTasksRunThroughManager)
{
    TempDirectory temp("manager-archive");
    writeFile(temp / "src" / "file1.txt", "content1");
    writeFile(temp / "src" / "sub" / "file2.txt", "content2");

    TaskManager manager;
    TaskId zip = manager.addTask(ArchiveOperation{{temp / "src"}, temp / "out.zip", "zip"});
    TaskId tar = manager.addTask(ArchiveOperation{{temp / "src"}, temp / "out.tar.gz", "tar.gz"});
    TaskId bad = manager.addTask(ArchiveOperation{{temp / "src"}, temp / "out.7z", "7z"});
    EXPECT_EQ(manager.processPendingTasks(), 3u);

    EXPECT_EQ(waitForTerminal(manager, zip).state, TaskState::Completed);
    EXPECT_EQ(waitForTerminal(manager, tar).state, TaskState::Completed);
    TaskStatus failed = waitForTerminal(manager, bad);
    EXPECT_EQ(failed.state, TaskState::Failed);
    EXPECT_EQ(failed.failureReason, "Unsupported archive format: 7z");

    EXPECT_GT(fs::file_size(temp / "out.zip"), 0u);
    EXPECT_GT(fs::file_size(temp / "out.tar.gz"), 0u);
    EXPECT_FALSE(fs::exists(temp / "out.7z"));
}

TEST(TaskManager, TasksAreDispatchedOnlyOnce)
{
    TempDirectory temp("manager-once");
    TaskManager manager;
    TaskId id = manager.addTask(CreateDirectoryOperation{temp / "made"});

    EXPECT_EQ(manager.processPendingTasks(), 1u);
    EXPECT_EQ(manager.processPendingTasks(), 0u);
    EXPECT_TRUE(manager.waitForEvent());
    EXPECT_EQ(manager.processPendingTasks(), 0u);

    manager.waitForIdle();
    EXPECT_FALSE(manager.pollEvent());
    EXPECT_EQ(manager.findTask(id)->status.state, TaskState::Completed);
}

TEST(TaskManager, UpdateEventsReportProgressButNotCompletion)
{
    TaskManager manager;
    TaskId id = manager.addTask(UnmountOperation{"/mnt/none"});
    ProgressSender sender = manager.progressSender();

    ASSERT_TRUE(sender.send(id, ProgressEvent::update(0.5f)));
    EXPECT_FALSE(manager.waitForEvent());
    auto task = manager.findTask(id);
    EXPECT_EQ(task->status.state, TaskState::InProgress);
    EXPECT_FLOAT_EQ(task->status.progress, 0.5f);

    ASSERT_TRUE(sender.send(id, ProgressEvent::update(4.0f)));
    auto applied = manager.applyNextEvent();
    ASSERT_TRUE(applied);
    EXPECT_TRUE(applied->applied);
    EXPECT_FLOAT_EQ(applied->status.progress, 1.0f);
}

TEST(TaskManager, EventsForUnknownTasksAreIgnored)
{
    TaskManager manager;
    TaskId id = manager.addTask(UnmountOperation{"/mnt/none"});
    manager.progressSender().send(id + 5000, ProgressEvent::completed());

    auto applied = manager.applyNextEvent();
    ASSERT_TRUE(applied);
    EXPECT_FALSE(applied->applied);
    EXPECT_EQ(manager.findTask(id)->status.state, TaskState::Pending);

    manager.progressSender().send(id + 5000, ProgressEvent::completed());
    EXPECT_FALSE(manager.waitForEvent());
}

TEST(TaskManager, TerminalStateIsFinal)
{
    TaskManager manager;
    TaskId id = manager.addTask(UnmountOperation{"/mnt/none"});
    ProgressSender sender = manager.progressSender();

    sender.send(id, ProgressEvent::error("boom"));
    sender.send(id, ProgressEvent::completed());
    sender.send(id, ProgressEvent::update(0.3f));

    EXPECT_FALSE(manager.waitForEvent());
    EXPECT_FALSE(manager.waitForEvent());
    auto late = manager.applyNextEvent();
    ASSERT_TRUE(late);
    EXPECT_FALSE(late->applied);

    auto task = manager.findTask(id);
    EXPECT_EQ(task->status, TaskStatus::failed("boom"));
}

TEST(TaskManager, PollEventDoesNotBlock)
{
    TaskManager manager;
    EXPECT_FALSE(manager.pollEvent().has_value());
    EXPECT_FALSE(manager.tryApplyNextEvent().has_value());

    TaskId id = manager.addTask(UnmountOperation{"/mnt/none"});
    manager.progressSender().send(id, ProgressEvent::completed());
    std::optional<bool> polled = manager.pollEvent();
    ASSERT_TRUE(polled.has_value());
    EXPECT_TRUE(*polled);
}

TEST(TaskManager, RunningExecutorsTracksInFlightTasks)
{
    Gate gate;
    ExecutorContext context;
    context.commandRunner = [&gate](const std::vector<std::string> &) { return gate.pass(); };

    TaskManager manager(context);
    TaskId first = manager.addTask(UnmountOperation{"/mnt/one"});
    TaskId second = manager.addTask(UnmountOperation{"/mnt/two"});
    EXPECT_EQ(manager.runningExecutors(), 0u);
    EXPECT_EQ(manager.processPendingTasks(), 2u);

    gate.waitForCallers(2);
    EXPECT_EQ(manager.runningExecutors(), 2u);
    EXPECT_EQ(manager.findTask(first)->status.state, TaskState::InProgress);

    gate.release();
    manager.waitForIdle();
    EXPECT_EQ(manager.runningExecutors(), 0u);

    EXPECT_TRUE(manager.waitForEvent());
    EXPECT_TRUE(manager.waitForEvent());
    EXPECT_EQ(manager.findTask(first)->status.state, TaskState::Completed);
    EXPECT_EQ(manager.findTask(second)->status.state, TaskState::Completed);
}

TEST(TaskManager, DestructionWaitsForRunningTasks)
{
    TempDirectory temp("manager-dtor");
    writeFile(temp / "big" / "a.txt", std::string(1 << 16, 'a'));
    {
        TaskManager manager;
        manager.addTask(CopyOperation{temp / "big", temp / "copy"});
        manager.processPendingTasks();
    }
    EXPECT_EQ(readFile(temp / "copy" / "a.txt").size(), static_cast<std::size_t>(1 << 16));
}

namespace
{

// Virtual memory currently mapped by this process, from /proc/self/statm.
rlim_t currentAddressSpace()
{
    std::ifstream statm("/proc/self/statm");
    unsigned long long pages = 0;
    statm >> pages;
    return static_cast<rlim_t>(pages) * static_cast<rlim_t>(sysconf(_SC_PAGESIZE));
}

// Dispatches more blocked tasks than the address-space limit leaves room
// for thread stacks. Returns 0 when every task still reached a terminal state.
int dispatchWithExhaustedThreads()
{
    Gate gate;
    ExecutorContext context;
    context.commandRunner = [&gate](const std::vector<std::string> &) { return gate.pass(); };

    TaskManager manager(context);
    std::vector<TaskId> ids;
    for (int i = 0; i < 400; ++i)
        ids.push_back(manager.addTask(UnmountOperation{"/mnt/" + std::to_string(i)}));

    rlimit limit{};
    limit.rlim_cur = currentAddressSpace() + 256ull * 1024 * 1024;
    limit.rlim_max = RLIM_INFINITY;
    if (setrlimit(RLIMIT_AS, &limit) != 0)
        return 10;

    std::size_t started = 0;
    try
    {
        started = manager.processPendingTasks();
    }
    catch (const std::exception &)
    {
        return 11;
    }
    limit.rlim_cur = RLIM_INFINITY;
    setrlimit(RLIMIT_AS, &limit);
    gate.release();

    if (started >= ids.size())
        return 12;
    if (manager.processPendingTasks() != 0)
        return 13;

    std::size_t failedToStart = 0;
    for (TaskId id : ids)
    {
        TaskStatus status = waitForTerminal(manager, id);
        if (!status.isTerminal())
            return 14;
        if (status.failureReason.rfind("cannot start worker: ", 0) == 0)
            ++failedToStart;
    }
    if (failedToStart + started != ids.size())
        return 15;
    return 0;
}

} // namespace

TEST(TaskManagerDeathTest, TasksWhoseWorkerCannotStartFail)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(std::exit(dispatchWithExhaustedThreads()), ::testing::ExitedWithCode(0), "");
}
