#include "corvus/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace corvus::appinfo
{
namespace
{

constexpr std::array<ToolInfo, 1> kTools{{
    ToolInfo{
        "corvus-tasks",
        "corvus-tasks",
        "Tasks",
        "Run file operations in the background and follow their progress.",
        "Copy, move, delete, archive and change permissions without blocking the file manager.",
        "Tasks queues file operations and runs each one on a worker thread of its own, so long copies and archive "
        "builds never freeze the interface. Every request stays in the task log with its outcome: finished jobs are "
        "marked done, failed ones keep the reason reported by the file system or by the external tool. Run it "
        "without arguments for the interactive log, or with --run to execute a single operation from a script."},
}};

} // namespace

std::span<const ToolInfo> tools() noexcept
{
    return std::span<const ToolInfo>{kTools};
}

const ToolInfo *findTool(std::string_view id) noexcept
{
    auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info) { return info.id == id; });
    if (it == kTools.end())
        return nullptr;
    return &*it;
}

const ToolInfo &requireTool(std::string_view id)
{
    if (const ToolInfo *info = findTool(id))
        return *info;
    throw std::runtime_error("Unknown tool id: " + std::string{id});
}

} // namespace corvus::appinfo
