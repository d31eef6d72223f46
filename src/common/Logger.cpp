#include "routegrid/common/Logger.h"
#include "routegrid/backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace routegrid {

std::unique_ptr<ILoggerBackend> Logger::backend_;
static std::mutex backend_mutex;

static bool capture_enabled_ = false;
static std::vector<std::string> captured_logs_;
static std::mutex capture_mutex_;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, "[trace] ", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, "[debug] ", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, "[info] ", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, "[warn] ", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, "[error] ", message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::dispatch(LogLevel level, const char* tag,
                      const std::string& message, const std::source_location& loc) {
    ensureBackend();
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, enhanced, loc);
    captureLog(tag + enhanced);
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    capture_enabled_ = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return capture_enabled_;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex_);

    std::vector<std::string> result;
    for (const auto& line : captured_logs_) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + (result.size() - maxLines));
    }

    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    captured_logs_.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_enabled_) {
        captured_logs_.push_back(message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "Unknown";
    }

    // Name starts after the last space outside template brackets
    int angle_count = 0;
    size_t name_start = 0;
    for (size_t i = 0; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (c == ' ' && angle_count == 0) name_start = i + 1;
    }

    std::string result;
    angle_count = 0;
    for (size_t i = name_start; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (angle_count == 0) result += c;
    }

    while (!result.empty() && (std::isspace(static_cast<unsigned char>(result[0])) ||
                               result[0] == '*' || result[0] == '&')) {
        result.erase(0, 1);
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "Unknown" : result;
}

}  // namespace routegrid
