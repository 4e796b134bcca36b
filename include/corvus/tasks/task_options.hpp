#pragma once

#include "corvus/options.hpp"
#include "corvus/tasks/executors.hpp"

#include <string>

namespace corvus::tasks
{

inline constexpr const char *kOptionElevationCommand = "elevationCommand";
inline constexpr const char *kOptionChownCommand = "chownCommand";
inline constexpr const char *kOptionUnmountCommand = "unmountCommand";
inline constexpr const char *kOptionCompressionLevel = "compressionLevel";
inline constexpr const char *kOptionDefaultArchiveFormat = "defaultArchiveFormat";
inline constexpr const char *kOptionLogLevel = "logLevel";
inline constexpr const char *kOptionLogFile = "logFile";

void registerTaskOptions(config::OptionRegistry &registry);

ExecutorSettings executorSettingsFromOptions(const config::OptionRegistry &registry);

// Falls back to "zip" when the configured value is not a known format.
std::string defaultArchiveFormat(const config::OptionRegistry &registry);

} // namespace corvus::tasks
