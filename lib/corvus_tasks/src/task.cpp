#include "corvus/tasks/task.hpp"

#include "overloaded.hpp"

#include <cmath>
#include <cstdio>

namespace corvus::tasks
{
namespace
{
namespace fs = std::filesystem;
using detail::Overloaded;

std::string quoted(const fs::path &path)
{
    return "\"" + path.string() + "\"";
}

// Short label for an operand: the file name when there is one, otherwise
// the whole path ("/" or "dir/").
std::string quotedName(const fs::path &path)
{
    fs::path name = path.filename();
    if (name.empty())
        return quoted(path);
    return quoted(name);
}

std::string destinationDirectory(const fs::path &destination)
{
    fs::path parent = destination.parent_path();
    return parent.empty() ? quoted(".") : quoted(parent);
}

} // namespace

const char *taskKindName(const TaskKind &kind) noexcept
{
    return std::visit(Overloaded{
                          [](const CopyOperation &) { return "copy"; },
                          [](const MoveOperation &) { return "move"; },
                          [](const DeleteOperation &) { return "delete"; },
                          [](const CreateFileOperation &) { return "mkfile"; },
                          [](const CreateDirectoryOperation &) { return "mkdir"; },
                          [](const ChmodOperation &) { return "chmod"; },
                          [](const ChownOperation &) { return "chown"; },
                          [](const UnmountOperation &) { return "unmount"; },
                          [](const ArchiveOperation &) { return "archive"; },
                      },
                      kind);
}

std::string describeTask(const TaskKind &kind)
{
    return std::visit(Overloaded{
                          [](const CopyOperation &op) {
                              return "Copy " + quotedName(op.source) + " -> " + destinationDirectory(op.destination);
                          },
                          [](const MoveOperation &op) {
                              return "Move " + quotedName(op.source) + " -> " + destinationDirectory(op.destination);
                          },
                          [](const DeleteOperation &op) { return "Delete " + quotedName(op.path); },
                          [](const CreateFileOperation &op) { return "Create " + quoted(op.path); },
                          [](const CreateDirectoryOperation &op) { return "Create " + quoted(op.path); },
                          [](const ChmodOperation &op) {
                              char mode[16];
                              std::snprintf(mode, sizeof(mode), "%o", static_cast<unsigned>(op.mode));
                              return "Chmod " + quotedName(op.path) + " to " + mode;
                          },
                          [](const ChownOperation &op) { return "Chown " + quotedName(op.path) + " to " + op.owner; },
                          [](const UnmountOperation &op) { return "Unmount " + quoted(op.path); },
                          [](const ArchiveOperation &op) {
                              return "Archive " + std::to_string(op.paths.size()) + " items to " +
                                     quoted(op.destination);
                          },
                      },
                      kind);
}

const char *taskStateName(TaskState state) noexcept
{
    switch (state)
    {
    case TaskState::Pending:
        return "pending";
    case TaskState::InProgress:
        return "running";
    case TaskState::Completed:
        return "done";
    case TaskState::Failed:
        return "failed";
    }
    return "unknown";
}

std::string formatStatus(const TaskStatus &status)
{
    switch (status.state)
    {
    case TaskState::InProgress:
    {
        int percent = static_cast<int>(std::lround(status.progress * 100.0f));
        return std::string(taskStateName(status.state)) + " " + std::to_string(percent) + "%";
    }
    case TaskState::Failed:
        return std::string(taskStateName(status.state)) + ": " + status.failureReason;
    case TaskState::Pending:
    case TaskState::Completed:
        break;
    }
    return taskStateName(status.state);
}

std::optional<ArchiveFormat> parseArchiveFormat(std::string_view tag) noexcept
{
    if (tag == "zip")
        return ArchiveFormat::Zip;
    if (tag == "tar")
        return ArchiveFormat::Tar;
    if (tag == "tar.gz")
        return ArchiveFormat::TarGz;
    return std::nullopt;
}

const char *archiveFormatTag(ArchiveFormat format) noexcept
{
    switch (format)
    {
    case ArchiveFormat::Zip:
        return "zip";
    case ArchiveFormat::Tar:
        return "tar";
    case ArchiveFormat::TarGz:
        return "tar.gz";
    }
    return "zip";
}

const char *archiveExtension(ArchiveFormat format) noexcept
{
    switch (format)
    {
    case ArchiveFormat::Zip:
        return ".zip";
    case ArchiveFormat::Tar:
        return ".tar";
    case ArchiveFormat::TarGz:
        return ".tar.gz";
    }
    return ".zip";
}

std::filesystem::path archiveDestination(const std::filesystem::path &directory, const std::string &name,
                                         std::string_view formatTag)
{
    // Unknown tags still get a name; the archive task itself rejects the tag.
    ArchiveFormat format = parseArchiveFormat(formatTag).value_or(ArchiveFormat::Zip);
    return directory / (name + archiveExtension(format));
}

std::optional<std::uint32_t> parseOctalMode(std::string_view text) noexcept
{
    if (text.empty() || text.size() > 11)
        return std::nullopt;
    std::uint32_t mode = 0;
    for (char ch : text)
    {
        if (ch < '0' || ch > '7')
            return std::nullopt;
        std::uint64_t next = (static_cast<std::uint64_t>(mode) << 3) | static_cast<std::uint32_t>(ch - '0');
        if (next > 0xFFFFFFFFull)
            return std::nullopt;
        mode = static_cast<std::uint32_t>(next);
    }
    return mode;
}

} // namespace corvus::tasks
