#include "corvus/tasks/task_options.hpp"

#include "corvus/log.hpp"
#include "corvus/tasks/task.hpp"

#include <algorithm>

namespace corvus::tasks
{

void registerTaskOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionElevationCommand, config::OptionKind::StringList,
                             config::OptionValue(std::vector<std::string>{"sudo", "-n"}), "Elevation Command",
                             "Prefix used to run chown with elevated privileges. Leave empty to run it directly."});
    registry.registerOption({kOptionChownCommand, config::OptionKind::String,
                             config::OptionValue(std::string("chown")), "Chown Command",
                             "Utility that changes file ownership."});
    registry.registerOption({kOptionUnmountCommand, config::OptionKind::String,
                             config::OptionValue(std::string("umount")), "Unmount Command",
                             "Utility that detaches mounted file systems."});
    registry.registerOption({kOptionCompressionLevel, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(-1)), "Compression Level",
                             "zlib level 0-9 for zip and tar.gz archives; -1 uses the zlib default."});
    registry.registerOption({kOptionDefaultArchiveFormat, config::OptionKind::String,
                             config::OptionValue(std::string("zip")), "Default Archive Format",
                             "Format offered first when creating an archive: zip, tar or tar.gz."});
    registry.registerOption({kOptionLogLevel, config::OptionKind::String, config::OptionValue(std::string("info")),
                             "Log Level", "One of error, warn, info, debug or trace."});
    registry.registerOption({kOptionLogFile, config::OptionKind::String, config::OptionValue(std::string()),
                             "Log File", "Write log lines to this file instead of the default location."});
}

ExecutorSettings executorSettingsFromOptions(const config::OptionRegistry &registry)
{
    ExecutorSettings settings;
    settings.elevationCommand = registry.getStringList(kOptionElevationCommand);
    settings.elevationCommand.erase(std::remove(settings.elevationCommand.begin(), settings.elevationCommand.end(),
                                                std::string()),
                                    settings.elevationCommand.end());

    std::string chown = registry.getString(kOptionChownCommand, settings.chownCommand);
    if (!chown.empty())
        settings.chownCommand = chown;
    std::string unmount = registry.getString(kOptionUnmountCommand, settings.unmountCommand);
    if (!unmount.empty())
        settings.unmountCommand = unmount;

    std::int64_t level = registry.getInteger(kOptionCompressionLevel, -1);
    if (level < -1 || level > 9)
    {
        CORVUS_LOG_WARN("compressionLevel " + std::to_string(level) + " is out of range, using the zlib default");
        level = -1;
    }
    settings.compressionLevel = static_cast<int>(level);
    return settings;
}

std::string defaultArchiveFormat(const config::OptionRegistry &registry)
{
    std::string tag = registry.getString(kOptionDefaultArchiveFormat, "zip");
    if (!parseArchiveFormat(tag))
        return "zip";
    return tag;
}

} // namespace corvus::tasks
