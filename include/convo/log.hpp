#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace convo::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

std::string_view levelName(Level level) noexcept;

// Truncates the file and directs subsequent appendLog calls to it. An empty
// path disables logging.
void setLogFile(const std::filesystem::path &path);
std::filesystem::path logFile();

// Lines below the threshold are dropped. Defaults to Info.
void setThreshold(Level level) noexcept;

// Appends "<UTC timestamp> [LEVEL] text" to the log file. Safe to call from
// worker threads. Failures to open the file are ignored.
void appendLog(Level level, const std::string &text);

inline void debug(const std::string &text) { appendLog(Level::Debug, text); }
inline void info(const std::string &text) { appendLog(Level::Info, text); }
inline void warning(const std::string &text) { appendLog(Level::Warning, text); }
inline void error(const std::string &text) { appendLog(Level::Error, text); }

} // namespace convo::log
