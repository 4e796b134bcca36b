#include "corvus/log.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace corvus::log
{
namespace
{

struct LoggerState
{
    std::mutex mutex;
    std::optional<Level> threshold;
    Handler handler;
    std::ofstream file;
    std::unordered_map<std::thread::id, std::string> threadNames;
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

Level levelFromEnvironment() noexcept
{
    const char *value = std::getenv("CORVUS_LOG_LEVEL");
    if (!value)
        return Level::Info;
    return parseLevel(value).value_or(Level::Info);
}

// Caller holds the state mutex.
Level currentLevel(LoggerState &logger) noexcept
{
    if (!logger.threshold)
        logger.threshold = levelFromEnvironment();
    return *logger.threshold;
}

std::string threadTag(LoggerState &logger)
{
    auto it = logger.threadNames.find(std::this_thread::get_id());
    if (it != logger.threadNames.end())
        return it->second;
    std::ostringstream tag;
    tag << 'T' << std::this_thread::get_id();
    return tag.str();
}

std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return out.str();
}

} // namespace

void setLevel(Level level) noexcept
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().threshold = level;
}

Level level() noexcept
{
    auto &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    return currentLevel(logger);
}

bool enabled(Level candidate) noexcept
{
    return static_cast<std::uint8_t>(candidate) <= static_cast<std::uint8_t>(level());
}

void setHandler(Handler handler)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().handler = std::move(handler);
}

bool setLogFile(const std::filesystem::path &path, std::string *errorMessage)
{
    auto &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    if (logger.file.is_open())
        logger.file.close();

    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    logger.file.open(path, std::ios::app);
    if (!logger.file)
    {
        if (errorMessage)
            *errorMessage = "cannot open log file '" + path.string() + "': " + std::strerror(errno);
        return false;
    }
    return true;
}

void resetSink()
{
    auto &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.handler = nullptr;
    if (logger.file.is_open())
        logger.file.close();
}

void setThreadName(std::string name)
{
    auto &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.threadNames[std::this_thread::get_id()] = std::move(name);
}

void clearThreadName()
{
    auto &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.threadNames.erase(std::this_thread::get_id());
}

void write(Level messageLevel, std::string_view message) noexcept
{
    try
    {
        auto &logger = state();
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (static_cast<std::uint8_t>(messageLevel) > static_cast<std::uint8_t>(currentLevel(logger)))
            return;

        if (logger.handler)
        {
            logger.handler(messageLevel, message);
            return;
        }

        std::ostringstream line;
        line << '[' << timestamp() << "] [" << levelName(messageLevel) << "] [" << threadTag(logger) << "] "
             << message;

        if (logger.file.is_open())
            logger.file << line.str() << std::endl;
        else
            std::cerr << line.str() << std::endl;
    }
    catch (const std::exception &)
    {
        // Logging failures are dropped; the caller is usually reporting an error already.
    }
}

const char *levelName(Level value) noexcept
{
    switch (value)
    {
    case Level::Error:
        return "ERROR";
    case Level::Warn:
        return "WARN";
    case Level::Info:
        return "INFO";
    case Level::Debug:
        return "DEBUG";
    case Level::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

std::optional<Level> parseLevel(std::string_view text) noexcept
{
    auto matches = [text](std::string_view name) {
        if (text.size() != name.size())
            return false;
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(text[i])) != name[i])
                return false;
        }
        return true;
    };

    if (matches("error"))
        return Level::Error;
    if (matches("warn") || matches("warning"))
        return Level::Warn;
    if (matches("info"))
        return Level::Info;
    if (matches("debug"))
        return Level::Debug;
    if (matches("trace"))
        return Level::Trace;
    return std::nullopt;
}

} // namespace corvus::log
