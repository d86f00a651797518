#pragma once

#include "starmap/common/ILoggerBackend.h"
#include <mutex>

namespace starmap {

/**
 * @brief Plain stdout logger with no external dependencies
 *
 * Prints "[HH:MM:SS.mmm] [level] message" with ANSI level colours.
 * Used when starmap is built without STARMAP_USE_SPDLOG.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    const char* levelToString(LogLevel level);
    const char* levelToColor(LogLevel level);
    std::string getTimestamp();
};

}  // namespace starmap
