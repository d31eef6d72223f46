#pragma once

#include "routegrid/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace routegrid {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink always, plus a file sink under logDir when requested.
 * The LOG_LEVEL (or SPDLOG_LEVEL) environment variable overrides the
 * initial debug level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace routegrid
