#include "mcp_hub_logging.hpp"
#include <ctime>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace duckdb {

MCPHubLogger &MCPHubLogger::GetInstance() {
	static MCPHubLogger instance;
	return instance;
}

MCPHubLogger::MCPHubLogger() : current_level(MCPHubLogLevel::WARN) {
	console_logging = false;
}

MCPHubLogger::~MCPHubLogger() {
	std::lock_guard<std::mutex> lock(log_mutex);
	if (log_file.is_open()) {
		log_file.close();
	}
}

void MCPHubLogger::SetLogLevel(MCPHubLogLevel level) {
	current_level = level;
}

MCPHubLogLevel MCPHubLogger::GetLogLevel() const {
	return current_level.load();
}

void MCPHubLogger::SetLogFile(const string &file_path) {
	std::lock_guard<std::mutex> lock(log_mutex);

	// Close existing file if open
	if (log_file.is_open()) {
		log_file.close();
	}

	if (!file_path.empty()) {
		log_file_path = file_path;
		log_file.open(file_path, std::ios::app);
		if (!log_file.is_open()) {
			std::cerr << "[MCP-HUB-ERROR] Failed to open log file: " << file_path << std::endl;
		}
	} else {
		log_file_path.clear();
	}
}

string MCPHubLogger::GetLogFile() const {
	std::lock_guard<std::mutex> lock(log_mutex);
	return log_file_path;
}

void MCPHubLogger::EnableConsoleLogging(bool enable) {
	std::lock_guard<std::mutex> lock(log_mutex);
	console_logging = enable;
}

bool MCPHubLogger::IsConsoleLoggingEnabled() const {
	std::lock_guard<std::mutex> lock(log_mutex);
	return console_logging;
}

MCPHubLogLevel MCPHubLogger::ParseLogLevel(const string &name) {
	auto lower = StringUtil::Lower(name);
	if (lower == "trace") {
		return MCPHubLogLevel::TRACE;
	} else if (lower == "debug") {
		return MCPHubLogLevel::DEBUG;
	} else if (lower == "info") {
		return MCPHubLogLevel::INFO;
	} else if (lower == "warn" || lower == "warning") {
		return MCPHubLogLevel::WARN;
	} else if (lower == "error") {
		return MCPHubLogLevel::ERROR;
	} else if (lower == "off" || lower == "none") {
		return MCPHubLogLevel::OFF;
	}
	throw InvalidInputException("Invalid log level '%s'. Valid levels: trace, debug, info, warn, error, off", name);
}

string MCPHubLogger::LogLevelToString(MCPHubLogLevel level) {
	switch (level) {
	case MCPHubLogLevel::TRACE:
		return "trace";
	case MCPHubLogLevel::DEBUG:
		return "debug";
	case MCPHubLogLevel::INFO:
		return "info";
	case MCPHubLogLevel::WARN:
		return "warn";
	case MCPHubLogLevel::ERROR:
		return "error";
	case MCPHubLogLevel::OFF:
		return "off";
	default:
		return "unknown";
	}
}

void MCPHubLogger::LogMessage(MCPHubLogLevel level, const string &component, const string &message) {
	std::lock_guard<std::mutex> lock(log_mutex);

	string formatted_message = FormatLogEntry(level, component, message);

	if (console_logging) {
		if (level >= MCPHubLogLevel::ERROR) {
			std::cerr << formatted_message << std::endl;
		} else {
			std::cout << formatted_message << std::endl;
		}
	}

	if (log_file.is_open()) {
		log_file << formatted_message << std::endl;
		log_file.flush();
	}
}

string MCPHubLogger::FormatLogEntry(MCPHubLogLevel level, const string &component, const string &message) {
	std::ostringstream oss;
	oss << GetTimestamp() << " [" << GetLevelString(level) << "] "
	    << "[" << component << "] " << message;
	return oss.str();
}

string MCPHubLogger::GetLevelString(MCPHubLogLevel level) {
	switch (level) {
	case MCPHubLogLevel::TRACE:
		return "TRACE";
	case MCPHubLogLevel::DEBUG:
		return "DEBUG";
	case MCPHubLogLevel::INFO:
		return "INFO ";
	case MCPHubLogLevel::WARN:
		return "WARN ";
	case MCPHubLogLevel::ERROR:
		return "ERROR";
	case MCPHubLogLevel::OFF:
		return "OFF  ";
	default:
		return "UNKNOWN";
	}
}

string MCPHubLogger::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time_t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	struct tm local_tm;
	localtime_r(&time_t, &local_tm);

	char buffer[32];
	strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

	std::ostringstream oss;
	oss << buffer << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void MCPHubLogger::LogProtocolMessage(bool outgoing, const string &server, const string &json) {
	if (current_level.load() > MCPHubLogLevel::DEBUG) {
		return;
	}

	string direction = outgoing ? "SEND" : "RECV";
	string component = StringUtil::Format("MCP-PROTOCOL[%s]", server);

	// Truncate very long JSON messages for readability
	string display_json = json;
	if (display_json.length() > 500) {
		display_json = display_json.substr(0, 497) + "...";
	}

	string message = StringUtil::Format("%s: %s", direction, display_json);
	LogMessage(MCPHubLogLevel::DEBUG, component, message);
}

void MCPHubLogger::LogPerformanceMetric(const string &operation, double duration_ms, const string &details) {
	if (current_level.load() > MCPHubLogLevel::INFO) {
		return;
	}

	string message;
	if (!details.empty()) {
		message = StringUtil::Format("PERF: %s completed in %.2fms (%s)", operation, duration_ms, details);
	} else {
		message = StringUtil::Format("PERF: %s completed in %.2fms", operation, duration_ms);
	}

	LogMessage(MCPHubLogLevel::INFO, "MCP-PERFORMANCE", message);
}

} // namespace duckdb
