#pragma once

#include <source_location>
#include <string>

namespace routegrid {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the router in their own editor can forward routegrid
 * messages into their logging system by implementing this interface.
 *
 * Example:
 * @code
 * class EditorLogSink : public routegrid::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         console->append(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { console->setMinLevel(level); }
 *     void flush() override {}
 * };
 *
 * routegrid::Logger::setBackend(std::make_unique<EditorLogSink>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace routegrid
