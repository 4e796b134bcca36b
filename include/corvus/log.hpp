#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace corvus::log
{

enum class Level : std::uint8_t
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

using Handler = std::function<void(Level, std::string_view)>;

// Messages above the threshold are dropped. Until setLevel() is called the
// threshold comes from CORVUS_LOG_LEVEL, falling back to Info.
void setLevel(Level level) noexcept;
Level level() noexcept;
bool enabled(Level level) noexcept;

// Sinks are exclusive: a handler wins over a file, a file wins over stderr.
// The handler runs under the logger lock and must not log itself.
void setHandler(Handler handler);
bool setLogFile(const std::filesystem::path &path, std::string *errorMessage = nullptr);
void resetSink();

// Tags log lines from the calling thread. Clear it before the thread exits,
// since thread ids are reused.
void setThreadName(std::string name);
void clearThreadName();

void write(Level level, std::string_view message) noexcept;

const char *levelName(Level level) noexcept;
std::optional<Level> parseLevel(std::string_view text) noexcept;

} // namespace corvus::log

#define CORVUS_LOG_ERROR(msg) ::corvus::log::write(::corvus::log::Level::Error, (msg))
#define CORVUS_LOG_WARN(msg) ::corvus::log::write(::corvus::log::Level::Warn, (msg))
#define CORVUS_LOG_INFO(msg) ::corvus::log::write(::corvus::log::Level::Info, (msg))
#define CORVUS_LOG_DEBUG(msg)                                        \
    do                                                               \
    {                                                                \
        if (::corvus::log::enabled(::corvus::log::Level::Debug))     \
            ::corvus::log::write(::corvus::log::Level::Debug, (msg)); \
    } while (false)
#define CORVUS_LOG_TRACE(msg)                                        \
    do                                                               \
    {                                                                \
        if (::corvus::log::enabled(::corvus::log::Level::Trace))     \
            ::corvus::log::write(::corvus::log::Level::Trace, (msg)); \
    } while (false)
