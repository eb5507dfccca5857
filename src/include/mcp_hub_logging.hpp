#pragma once

#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/exception.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <fstream>

namespace duckdb {

enum class MCPHubLogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

class MCPHubLogger {
public:
    static MCPHubLogger& GetInstance();

    void SetLogLevel(MCPHubLogLevel level);
    MCPHubLogLevel GetLogLevel() const;

    void SetLogFile(const string &file_path);
    string GetLogFile() const;
    void EnableConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const;

    //! Case-insensitive; throws InvalidInputException for unknown names
    static MCPHubLogLevel ParseLogLevel(const string &name);
    static string LogLevelToString(MCPHubLogLevel level);

    template<typename... Args>
    void Log(MCPHubLogLevel level, const string &component, const string &format, Args&&... args) {
        if (level < current_level.load() || current_level.load() == MCPHubLogLevel::OFF) {
            return;
        }

        string message;
        try {
            message = StringUtil::Format(format, std::forward<Args>(args)...);
        } catch (const std::exception &) {
            message = format; // Fallback to raw format string
        }

        LogMessage(level, component, message);
    }

    void LogProtocolMessage(bool outgoing, const string &server, const string &json);
    void LogPerformanceMetric(const string &operation, double duration_ms, const string &details = "");

private:
    MCPHubLogger();
    ~MCPHubLogger();

    void LogMessage(MCPHubLogLevel level, const string &component, const string &message);
    string FormatLogEntry(MCPHubLogLevel level, const string &component, const string &message);
    string GetLevelString(MCPHubLogLevel level);
    string GetTimestamp();

    mutable std::mutex log_mutex;
    std::atomic<MCPHubLogLevel> current_level;
    bool console_logging = false;
    string log_file_path;
    std::ofstream log_file;
};

// Convenience macros
#define MCP_HUB_LOG_TRACE(component, format, ...) \
    MCPHubLogger::GetInstance().Log(MCPHubLogLevel::TRACE, component, format, ##__VA_ARGS__)

#define MCP_HUB_LOG_DEBUG(component, format, ...) \
    MCPHubLogger::GetInstance().Log(MCPHubLogLevel::DEBUG, component, format, ##__VA_ARGS__)

#define MCP_HUB_LOG_INFO(component, format, ...) \
    MCPHubLogger::GetInstance().Log(MCPHubLogLevel::INFO, component, format, ##__VA_ARGS__)

#define MCP_HUB_LOG_WARN(component, format, ...) \
    MCPHubLogger::GetInstance().Log(MCPHubLogLevel::WARN, component, format, ##__VA_ARGS__)

#define MCP_HUB_LOG_ERROR(component, format, ...) \
    MCPHubLogger::GetInstance().Log(MCPHubLogLevel::ERROR, component, format, ##__VA_ARGS__)

#define MCP_HUB_LOG_PROTOCOL(outgoing, server, json) \
    MCPHubLogger::GetInstance().LogProtocolMessage(outgoing, server, json)

#define MCP_HUB_LOG_PERF(operation, duration_ms, details) \
    MCPHubLogger::GetInstance().LogPerformanceMetric(operation, duration_ms, details)

// Performance timing helper
class MCPHubPerformanceTimer {
public:
    MCPHubPerformanceTimer(const string &operation, const string &details = "")
        : operation_name(operation), operation_details(details) {
        start_time = std::chrono::steady_clock::now();
    }

    ~MCPHubPerformanceTimer() {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        double duration_ms = duration.count() / 1000.0;
        MCP_HUB_LOG_PERF(operation_name, duration_ms, operation_details);
    }

private:
    string operation_name;
    string operation_details;
    std::chrono::steady_clock::time_point start_time;
};

#define MCP_HUB_PERF_TIMER(operation, details) \
    MCPHubPerformanceTimer _perf_timer(operation, details)

} // namespace duckdb
