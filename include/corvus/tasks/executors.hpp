#pragma once

#include "corvus/tasks/command_runner.hpp"
#include "corvus/tasks/progress_channel.hpp"
#include "corvus/tasks/task.hpp"

#include <string>
#include <vector>

namespace corvus::tasks
{

struct ExecutorSettings
{
    std::vector<std::string> elevationCommand{"sudo", "-n"}; // prefix for chown, may be empty
    std::string chownCommand = "chown";
    std::string unmountCommand = "umount";
    int compressionLevel = -1;
};

struct ExecutorContext
{
    ExecutorSettings settings;
    CommandRunner commandRunner = runCommand;
};

struct ExecutionResult
{
    bool success = false;
    std::string errorMessage;

    static ExecutionResult ok() { return {true, {}}; }
    static ExecutionResult failure(std::string message) { return {false, std::move(message)}; }
};

namespace executors
{

ExecutionResult copy(const CopyOperation &operation, const ExecutorContext &context);
ExecutionResult move(const MoveOperation &operation, const ExecutorContext &context);
ExecutionResult remove(const DeleteOperation &operation, const ExecutorContext &context);
ExecutionResult createFile(const CreateFileOperation &operation, const ExecutorContext &context);
ExecutionResult createDirectory(const CreateDirectoryOperation &operation, const ExecutorContext &context);
ExecutionResult chmod(const ChmodOperation &operation, const ExecutorContext &context);
ExecutionResult chown(const ChownOperation &operation, const ExecutorContext &context);
ExecutionResult unmount(const UnmountOperation &operation, const ExecutorContext &context);
ExecutionResult archive(const ArchiveOperation &operation, const ExecutorContext &context);

} // namespace executors

ExecutionResult executeOperation(const TaskKind &kind, const ExecutorContext &context);

// Runs one task to completion and sends exactly one terminal event for it.
void runTask(TaskId id, const TaskKind &kind, const ExecutorContext &context, const ProgressSender &sender);

} // namespace corvus::tasks
