#include "corvus/tasks/command_runner.hpp"

#include "corvus/log.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace corvus::tasks
{
namespace
{

int waitForChild(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return status;
}

void closePipe(int (&fds)[2])
{
    for (int &fd : fds)
    {
        if (fd != -1)
        {
            close(fd);
            fd = -1;
        }
    }
}

// Reads both pipes until each reports end of file. Draining them together
// keeps a chatty child from blocking on a full stderr pipe.
void drainPipes(int stdoutFd, int stderrFd, std::string &out, std::string &err)
{
    constexpr std::size_t kBufferSize = 8192;
    std::array<char, kBufferSize> buffer{};

    pollfd fds[2] = {{stdoutFd, POLLIN, 0}, {stderrFd, POLLIN, 0}};
    std::string *sinks[2] = {&out, &err};
    int openCount = 2;
    while (openCount > 0)
    {
        int ready = poll(fds, 2, -1);
        if (ready == -1)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        for (int i = 0; i < 2; ++i)
        {
            if (fds[i].fd == -1 || fds[i].revents == 0)
                continue;
            ssize_t bytesRead = read(fds[i].fd, buffer.data(), buffer.size());
            if (bytesRead > 0)
            {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(bytesRead));
                continue;
            }
            if (bytesRead == -1 && errno == EINTR)
                continue;
            fds[i].fd = -1;
            --openCount;
        }
    }
}

} // namespace

CommandResult runCommand(const std::vector<std::string> &command)
{
    CommandResult result;
    if (command.empty() || command.front().empty())
    {
        result.launchError = "empty command";
        return result;
    }

    int stdoutPipe[2]{-1, -1};
    int stderrPipe[2]{-1, -1};
    if (pipe2(stdoutPipe, O_CLOEXEC) == -1 || pipe2(stderrPipe, O_CLOEXEC) == -1)
    {
        result.launchError = std::string("cannot create pipe: ") + std::strerror(errno);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    std::vector<char *> argv;
    argv.reserve(command.size() + 1);
    for (const auto &token : command)
        argv.push_back(const_cast<char *>(token.c_str()));
    argv.push_back(nullptr);

    CORVUS_LOG_DEBUG("spawning " + describeCommand(command));

    pid_t childPid = -1;
    int spawnStatus = posix_spawnp(&childPid, command.front().c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(stdoutPipe[1]);
    stdoutPipe[1] = -1;
    close(stderrPipe[1]);
    stderrPipe[1] = -1;

    if (spawnStatus != 0)
    {
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        result.launchError = "cannot run '" + command.front() + "': " + std::strerror(spawnStatus);
        return result;
    }

    result.launched = true;
    drainPipes(stdoutPipe[0], stderrPipe[0], result.standardOutput, result.standardError);
    closePipe(stdoutPipe);
    closePipe(stderrPipe);

    result.exitCode = waitForChild(childPid);
    CORVUS_LOG_DEBUG(command.front() + " exited with status " + std::to_string(result.exitCode));
    return result;
}

std::string describeCommand(const std::vector<std::string> &argv)
{
    std::string text;
    for (const auto &token : argv)
    {
        if (!text.empty())
            text.push_back(' ');
        if (token.find_first_of(" \t'\"") == std::string::npos && !token.empty())
        {
            text += token;
            continue;
        }
        text.push_back('\'');
        for (char ch : token)
        {
            if (ch == '\'')
                text += "'\\''";
            else
                text.push_back(ch);
        }
        text.push_back('\'');
    }
    return text;
}

} // namespace corvus::tasks
