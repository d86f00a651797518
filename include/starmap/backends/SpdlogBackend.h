#pragma once

#include "starmap/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace starmap {

/// Colored console logger named "starmap"; level from LOG_LEVEL or SPDLOG_LEVEL
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace starmap
