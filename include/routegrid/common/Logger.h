#pragma once

#include "routegrid/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace routegrid {

/**
 * @brief Logging facade used by the routing engine
 *
 * Messages go to the injected backend, or to SpdlogBackend when none was set.
 * Capture mode keeps a copy of every message in memory so tests and tools can
 * inspect what a rasterization pass reported.
 *
 * Example:
 * @code
 * routegrid::Logger::initialize();
 * routegrid::Logger::enableCapture(true);
 * LOG_DEBUG("Routing matrix {}x{}", rows, cols);
 * auto logs = routegrid::Logger::getCapturedLogs("Routing matrix");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Initialize default logger (console only)
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    /// Enable or disable in-memory capture of log messages
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return, newest kept (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag,
                         const std::string& message, const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace routegrid

#define LOG_TRACE(...) routegrid::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) routegrid::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  routegrid::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  routegrid::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) routegrid::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
