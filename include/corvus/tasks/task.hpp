#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace corvus::tasks
{

using TaskId = std::uint64_t;

struct CopyOperation
{
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct MoveOperation
{
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct DeleteOperation
{
    std::filesystem::path path;
};

struct CreateFileOperation
{
    std::filesystem::path path;
};

struct CreateDirectoryOperation
{
    std::filesystem::path path;
};

struct ChmodOperation
{
    std::filesystem::path path;
    std::uint32_t mode = 0;
};

struct ChownOperation
{
    std::filesystem::path path;
    std::string owner; // "user" or "user:group"
};

struct UnmountOperation
{
    std::filesystem::path path;
};

struct ArchiveOperation
{
    std::vector<std::filesystem::path> paths;
    std::filesystem::path destination;
    std::string format; // "zip", "tar" or "tar.gz"
};

using TaskKind = std::variant<CopyOperation,
                              MoveOperation,
                              DeleteOperation,
                              CreateFileOperation,
                              CreateDirectoryOperation,
                              ChmodOperation,
                              ChownOperation,
                              UnmountOperation,
                              ArchiveOperation>;

enum class TaskState
{
    Pending,
    InProgress,
    Completed,
    Failed
};

struct TaskStatus
{
    TaskState state = TaskState::Pending;
    float progress = 0.0f;     // meaningful while InProgress, 0.0 to 1.0
    std::string failureReason; // set only when Failed

    static TaskStatus pending() { return {}; }
    static TaskStatus inProgress(float progress) { return {TaskState::InProgress, progress, {}}; }
    static TaskStatus completed() { return {TaskState::Completed, 1.0f, {}}; }
    static TaskStatus failed(std::string reason) { return {TaskState::Failed, 0.0f, std::move(reason)}; }

    bool isTerminal() const noexcept { return state == TaskState::Completed || state == TaskState::Failed; }

    bool operator==(const TaskStatus &) const = default;
};

struct Task
{
    TaskId id = 0;
    TaskKind kind;
    TaskStatus status;
    std::string description;
};

enum class ArchiveFormat
{
    Zip,
    Tar,
    TarGz
};

const char *taskKindName(const TaskKind &kind) noexcept;
std::string describeTask(const TaskKind &kind);
std::string formatStatus(const TaskStatus &status);
const char *taskStateName(TaskState state) noexcept;

std::optional<ArchiveFormat> parseArchiveFormat(std::string_view tag) noexcept;
const char *archiveFormatTag(ArchiveFormat format) noexcept;
const char *archiveExtension(ArchiveFormat format) noexcept;
std::filesystem::path archiveDestination(const std::filesystem::path &directory, const std::string &name,
                                         std::string_view formatTag);

std::optional<std::uint32_t> parseOctalMode(std::string_view text) noexcept;

} // namespace corvus::tasks
