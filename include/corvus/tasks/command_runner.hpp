#pragma once

#include <functional>
#include <string>
#include <vector>

namespace corvus::tasks
{

struct CommandResult
{
    bool launched = false;
    int exitCode = -1; // 128 + signal when the child was killed
    std::string standardOutput;
    std::string standardError;
    std::string launchError;
};

using CommandRunner = std::function<CommandResult(const std::vector<std::string> &argv)>;

// Spawns argv[0] from PATH with stdin on /dev/null and both output streams
// captured. Blocks until the child exits.
CommandResult runCommand(const std::vector<std::string> &argv);

std::string describeCommand(const std::vector<std::string> &argv);

} // namespace corvus::tasks
