#include "corvus/tasks/executors.hpp"

#include "corvus/log.hpp"
#include "corvus/tasks/archive_builder.hpp"
#include "overloaded.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace corvus::tasks
{
namespace
{
namespace fs = std::filesystem;

ExecutionResult fail(const char *verb, const fs::path &path, const std::string &reason)
{
    return ExecutionResult::failure(std::string("cannot ") + verb + " '" + path.string() + "': " + reason);
}

ExecutionResult failErrno(const char *verb, const fs::path &path)
{
    return fail(verb, path, std::strerror(errno));
}

std::string trim(const std::string &text)
{
    const char *whitespace = " \t\r\n";
    std::size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return {};
    std::size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

ExecutionResult interpretCommand(const char *verb, const fs::path &path, const std::vector<std::string> &argv,
                                 const CommandResult &result)
{
    if (!result.launched)
        return fail(verb, path, result.launchError.empty() ? "command did not start" : result.launchError);
    if (result.exitCode == 0)
        return ExecutionResult::ok();

    std::string reason = trim(result.standardError);
    if (reason.empty())
        reason = argv.front() + " exited with status " + std::to_string(result.exitCode);
    return ExecutionResult::failure(std::move(reason));
}

ExecutionResult runExternal(const char *verb, const fs::path &path, std::vector<std::string> argv,
                            const ExecutorContext &context)
{
    if (!context.commandRunner)
        return fail(verb, path, "no command runner configured");
    CORVUS_LOG_DEBUG("running " + describeCommand(argv));
    CommandResult result = context.commandRunner(argv);
    return interpretCommand(verb, path, argv, result);
}

} // namespace

namespace executors
{

ExecutionResult copy(const CopyOperation &operation, const ExecutorContext &)
{
    std::error_code ec;
    auto options = fs::copy_options::overwrite_existing;
    if (fs::is_directory(operation.source, ec))
        options |= fs::copy_options::recursive;
    ec.clear();
    fs::copy(operation.source, operation.destination, options, ec);
    if (ec)
        return fail("copy", operation.source, ec.message());
    return ExecutionResult::ok();
}

ExecutionResult move(const MoveOperation &operation, const ExecutorContext &)
{
    std::error_code ec;
    fs::rename(operation.source, operation.destination, ec);
    if (ec)
        return fail("move", operation.source, ec.message());
    return ExecutionResult::ok();
}

ExecutionResult remove(const DeleteOperation &operation, const ExecutorContext &)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(operation.path, ec);
    if (ec || !fs::exists(status))
    {
        if (!ec)
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return fail("delete", operation.path, ec.message());
    }

    // A symbolic link to a directory is removed as a link, never followed.
    if (fs::is_directory(status))
        fs::remove_all(operation.path, ec);
    else
        fs::remove(operation.path, ec);
    if (ec)
        return fail("delete", operation.path, ec.message());
    return ExecutionResult::ok();
}

ExecutionResult createFile(const CreateFileOperation &operation, const ExecutorContext &)
{
    int fd = ::open(operation.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd == -1)
        return failErrno("create", operation.path);
    if (::close(fd) == -1)
        return failErrno("create", operation.path);
    return ExecutionResult::ok();
}

ExecutionResult createDirectory(const CreateDirectoryOperation &operation, const ExecutorContext &)
{
    if (::mkdir(operation.path.c_str(), 0777) == -1)
        return failErrno("create", operation.path);
    return ExecutionResult::ok();
}

ExecutionResult chmod(const ChmodOperation &operation, const ExecutorContext &)
{
    if (::chmod(operation.path.c_str(), static_cast<mode_t>(operation.mode)) == -1)
        return failErrno("chmod", operation.path);
    return ExecutionResult::ok();
}

ExecutionResult chown(const ChownOperation &operation, const ExecutorContext &context)
{
    if (operation.owner.empty())
        return fail("chown", operation.path, "no owner given");
    std::vector<std::string> argv = context.settings.elevationCommand;
    argv.push_back(context.settings.chownCommand);
    argv.push_back(operation.owner);
    argv.push_back(operation.path.string());
    return runExternal("chown", operation.path, std::move(argv), context);
}

ExecutionResult unmount(const UnmountOperation &operation, const ExecutorContext &context)
{
    std::vector<std::string> argv{context.settings.unmountCommand, operation.path.string()};
    return runExternal("unmount", operation.path, std::move(argv), context);
}

ExecutionResult archive(const ArchiveOperation &operation, const ExecutorContext &context)
{
    ArchiveOptions options;
    options.compressionLevel = context.settings.compressionLevel;
    std::string error;
    if (!buildArchive(operation.paths, operation.destination, operation.format, options, &error))
        return ExecutionResult::failure(std::move(error));
    return ExecutionResult::ok();
}

} // namespace executors

ExecutionResult executeOperation(const TaskKind &kind, const ExecutorContext &context)
{
    return std::visit(detail::Overloaded{
                          [&](const CopyOperation &op) { return executors::copy(op, context); },
                          [&](const MoveOperation &op) { return executors::move(op, context); },
                          [&](const DeleteOperation &op) { return executors::remove(op, context); },
                          [&](const CreateFileOperation &op) { return executors::createFile(op, context); },
                          [&](const CreateDirectoryOperation &op) { return executors::createDirectory(op, context); },
                          [&](const ChmodOperation &op) { return executors::chmod(op, context); },
                          [&](const ChownOperation &op) { return executors::chown(op, context); },
                          [&](const UnmountOperation &op) { return executors::unmount(op, context); },
                          [&](const ArchiveOperation &op) { return executors::archive(op, context); },
                      },
                      kind);
}

void runTask(TaskId id, const TaskKind &kind, const ExecutorContext &context, const ProgressSender &sender)
{
    ExecutionResult result;
    try
    {
        result = executeOperation(kind, context);
    }
    catch (const std::exception &error)
    {
        result = ExecutionResult::failure(error.what());
    }

    ProgressEvent event = ProgressEvent::completed();
    if (!result.success)
    {
        CORVUS_LOG_WARN("task " + std::to_string(id) + " (" + taskKindName(kind) + ") failed: " + result.errorMessage);
        event = ProgressEvent::error(result.errorMessage);
    }
    else
    {
        CORVUS_LOG_DEBUG("task " + std::to_string(id) + " (" + taskKindName(kind) + ") finished");
    }

    if (!sender.send(id, std::move(event)))
        CORVUS_LOG_DEBUG("task " + std::to_string(id) + ": progress channel closed, result dropped");
}

} // namespace corvus::tasks
