#pragma once

#include "corvus/tasks/executors.hpp"
#include "corvus/tasks/task.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace corvus::cli
{

struct TaskArguments
{
    bool showHelp = false;
    bool loadDefaults = true;
    std::vector<std::filesystem::path> configFiles;
    std::optional<std::filesystem::path> logFile;
    std::optional<tasks::TaskKind> operation; // set by --run
};

// Options come first; --run consumes the remaining words as one operation.
bool parseTaskArguments(int argc, const char *const *argv, TaskArguments &arguments,
                        std::string *errorMessage = nullptr);

std::optional<tasks::TaskKind> parseOperation(const std::vector<std::string> &words,
                                              std::string *errorMessage = nullptr);

void printUsage(std::ostream &out);

// Submits one task, waits for its terminal event and reports it.
// Returns the process exit status.
int runSingleTask(const tasks::TaskKind &kind, const tasks::ExecutorContext &context, std::ostream &out,
                  std::ostream &err);

} // namespace corvus::cli
