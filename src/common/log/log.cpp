#include "convo/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace convo::log
{
namespace
{
std::mutex &logMutex()
{
    static std::mutex mutex;
    return mutex;
}

std::filesystem::path &logPath()
{
    static std::filesystem::path path;
    return path;
}

std::atomic<int> &threshold()
{
    static std::atomic<int> value{static_cast<int>(Level::Info)};
    return value;
}

std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

std::string_view levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void setLogFile(const std::filesystem::path &path)
{
    std::lock_guard<std::mutex> lock(logMutex());
    logPath() = path;
    if (!path.empty())
        std::ofstream(path, std::ios::trunc).close();
}

std::filesystem::path logFile()
{
    std::lock_guard<std::mutex> lock(logMutex());
    return logPath();
}

void setThreshold(Level level) noexcept
{
    threshold() = static_cast<int>(level);
}

void appendLog(Level level, const std::string &text)
{
    if (static_cast<int>(level) < threshold())
        return;
    std::lock_guard<std::mutex> lock(logMutex());
    if (logPath().empty())
        return;
    std::ofstream file(logPath(), std::ios::app);
    if (!file.is_open())
        return;
    file << timestamp() << " [" << levelName(level) << "] " << text;
    if (text.empty() || text.back() != '\n')
        file << '\n';
}

} // namespace convo::log
