#pragma once

#include "starmap/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace starmap {

/**
 * @brief Process-wide logging used through the LOG_* macros
 *
 * Falls back to SpdlogBackend (DefaultBackend without STARMAP_USE_SPDLOG)
 * on first use. Rejected edits are logged at warn level, so tests read them
 * back through the capture buffer.
 */
class Logger {
public:
    /// Replaces the active backend; nullptr restores the built-in one on next use
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);
    static void initialize();
    static void setLevel(LogLevel level);

    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    static void enableCapture(bool enable);
    /// Captured lines containing `pattern`, the last `maxLines` of them when nonzero
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);
    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace starmap

#define LOG_DEBUG(...) starmap::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  starmap::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  starmap::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) starmap::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
