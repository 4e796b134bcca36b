#include "corvus/cli/task_cli.hpp"

#include "corvus/app_info.hpp"
#include "corvus/tasks/task_manager.hpp"

#include <ostream>

namespace corvus::cli
{
namespace
{

constexpr std::string_view kToolId = "corvus-tasks";

void assignError(std::string *errorMessage, std::string text)
{
    if (errorMessage)
        *errorMessage = std::move(text);
}

bool expectCount(const std::vector<std::string> &words, std::size_t count, const char *usage,
                 std::string *errorMessage)
{
    if (words.size() == count + 1)
        return true;
    assignError(errorMessage, words.front() + " expects " + usage);
    return false;
}

// Accepts "--name value" and "--name=value".
bool optionValue(int argc, const char *const *argv, int &index, const std::string &name, std::string &value,
                 std::string *errorMessage)
{
    std::string arg = argv[index];
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0)
    {
        value = arg.substr(prefix.size());
    }
    else if (index + 1 < argc)
    {
        value = argv[++index];
    }
    else
    {
        assignError(errorMessage, name + " requires a value");
        return false;
    }
    if (value.empty())
    {
        assignError(errorMessage, name + " requires a value");
        return false;
    }
    return true;
}

} // namespace

std::optional<tasks::TaskKind> parseOperation(const std::vector<std::string> &words, std::string *errorMessage)
{
    if (words.empty())
    {
        assignError(errorMessage, "--run requires an operation");
        return std::nullopt;
    }

    const std::string &name = words.front();
    if (name == "copy" || name == "move")
    {
        if (!expectCount(words, 2, "SOURCE DEST", errorMessage))
            return std::nullopt;
        if (name == "copy")
            return tasks::CopyOperation{words[1], words[2]};
        return tasks::MoveOperation{words[1], words[2]};
    }
    if (name == "delete")
    {
        if (!expectCount(words, 1, "PATH", errorMessage))
            return std::nullopt;
        return tasks::DeleteOperation{words[1]};
    }
    if (name == "mkfile")
    {
        if (!expectCount(words, 1, "PATH", errorMessage))
            return std::nullopt;
        return tasks::CreateFileOperation{words[1]};
    }
    if (name == "mkdir")
    {
        if (!expectCount(words, 1, "PATH", errorMessage))
            return std::nullopt;
        return tasks::CreateDirectoryOperation{words[1]};
    }
    if (name == "chmod")
    {
        if (!expectCount(words, 2, "MODE PATH", errorMessage))
            return std::nullopt;
        auto mode = tasks::parseOctalMode(words[1]);
        if (!mode)
        {
            assignError(errorMessage, "invalid octal mode '" + words[1] + "'");
            return std::nullopt;
        }
        return tasks::ChmodOperation{words[2], *mode};
    }
    if (name == "chown")
    {
        if (!expectCount(words, 2, "OWNER PATH", errorMessage))
            return std::nullopt;
        return tasks::ChownOperation{words[2], words[1]};
    }
    if (name == "unmount")
    {
        if (!expectCount(words, 1, "PATH", errorMessage))
            return std::nullopt;
        return tasks::UnmountOperation{words[1]};
    }
    if (name == "archive")
    {
        if (words.size() < 4)
        {
            assignError(errorMessage, "archive expects FORMAT DEST PATH...");
            return std::nullopt;
        }
        tasks::ArchiveOperation operation;
        operation.format = words[1];
        operation.destination = words[2];
        operation.paths.assign(words.begin() + 3, words.end());
        return operation;
    }

    assignError(errorMessage, "unknown operation '" + name + "'");
    return std::nullopt;
}

bool parseTaskArguments(int argc, const char *const *argv, TaskArguments &arguments, std::string *errorMessage)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            arguments.showHelp = true;
        }
        else if (arg == "--no-default-options")
        {
            arguments.loadDefaults = false;
        }
        else if (arg == "--config" || arg.rfind("--config=", 0) == 0)
        {
            std::string value;
            if (!optionValue(argc, argv, i, "--config", value, errorMessage))
                return false;
            arguments.configFiles.emplace_back(value);
        }
        else if (arg == "--log-file" || arg.rfind("--log-file=", 0) == 0)
        {
            std::string value;
            if (!optionValue(argc, argv, i, "--log-file", value, errorMessage))
                return false;
            arguments.logFile = std::filesystem::path(value);
        }
        else if (arg == "--run")
        {
            std::vector<std::string> words(argv + i + 1, argv + argc);
            arguments.operation = parseOperation(words, errorMessage);
            return arguments.operation.has_value();
        }
        else
        {
            assignError(errorMessage, "unknown option '" + arg + "'");
            return false;
        }
    }
    return true;
}

void printUsage(std::ostream &out)
{
    const auto &info = appinfo::requireTool(kToolId);
    out << info.executable << " - " << info.shortDescription << "\n\n"
        << "Usage: " << info.executable << " [options] [--run OPERATION ARGS...]\n"
        << "  --config FILE          Load options from FILE (repeatable)\n"
        << "  --no-default-options   Do not load saved defaults\n"
        << "  --log-file FILE        Append log lines to FILE\n"
        << "  --run OPERATION ...    Run one operation and exit\n\n"
        << "Operations:\n"
        << "  copy SOURCE DEST\n"
        << "  move SOURCE DEST\n"
        << "  delete PATH\n"
        << "  mkfile PATH\n"
        << "  mkdir PATH\n"
        << "  chmod MODE PATH        MODE is octal, e.g. 755\n"
        << "  chown OWNER PATH       OWNER is user or user:group\n"
        << "  unmount PATH\n"
        << "  archive FORMAT DEST PATH...   FORMAT is zip, tar or tar.gz\n\n"
        << "Without --run the interactive task log is started.\n"
        << "Set CORVUS_LOG_LEVEL to error, warn, info, debug or trace to override the log level." << std::endl;
}

int runSingleTask(const tasks::TaskKind &kind, const tasks::ExecutorContext &context, std::ostream &out,
                  std::ostream &err)
{
    tasks::TaskManager manager(context);
    const tasks::TaskId id = manager.addTask(kind);
    manager.processPendingTasks();

    while (auto applied = manager.applyNextEvent())
    {
        if (applied->taskId == id && applied->applied && applied->status.isTerminal())
            break;
    }

    std::optional<tasks::Task> task = manager.findTask(id);
    if (task && task->status.state == tasks::TaskState::Completed)
    {
        out << "done: " << task->description << std::endl;
        return 0;
    }
    err << "failed: " << (task ? task->status.failureReason : std::string("task lost")) << std::endl;
    return 1;
}

} // namespace corvus::cli
