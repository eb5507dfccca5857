#pragma once

#include "duckdb.hpp"

#include <chrono>

namespace duckdb {

//! Point in time after which a read gives up. MCPDeadline::max() never expires.
typedef std::chrono::steady_clock::time_point MCPDeadline;

//! Deadline timeout_seconds from now; 0 or negative never expires
MCPDeadline MCPDeadlineAfter(int timeout_seconds);

// Abstract transport interface for MCP communication.
// A transport moves single lines of text; framing is newline-delimited.
class MCPTransport {
public:
	virtual ~MCPTransport() = default;

	// Connection lifecycle. Connect throws MCPTransportException on failure.
	virtual void Connect() = 0;
	virtual void Disconnect() = 0;
	virtual bool IsConnected() const = 0;

	//! Write one line; a trailing newline is appended
	virtual void WriteLine(const string &line) = 0;
	//! Read one line without its terminator. Throws MCPTransportException on EOF
	//! or I/O failure and MCPTimeoutException once the deadline has passed.
	virtual string ReadLine(MCPDeadline deadline) = 0;
	//! Read one line bounded by the transport's own read timeout
	string ReadLine() {
		return ReadLine(GetReadDeadline());
	}

	virtual string GetConnectionInfo() const = 0;

protected:
	virtual MCPDeadline GetReadDeadline() const {
		return MCPDeadline::max();
	}
};

// Process-based stdio transport implementation
class StdioTransport : public MCPTransport {
public:
	struct StdioConfig {
		string command_path;
		vector<string> arguments;
		string working_directory;
		unordered_map<string, string> environment;
		//! Bound on ReadLine() without a deadline; 0 or negative waits forever
		int timeout_seconds = 30;
	};

	explicit StdioTransport(const StdioConfig &config);
	~StdioTransport() override;

	// MCPTransport interface
	void Connect() override;
	void Disconnect() override;
	bool IsConnected() const override;
	void WriteLine(const string &line) override;
	using MCPTransport::ReadLine;
	string ReadLine(MCPDeadline deadline) override;
	string GetConnectionInfo() const override;

	//! Child pid, -1 before Connect
	int GetProcessId() const {
		return process_pid;
	}
	//! True once the child has been waited for
	bool IsReaped() const {
		return reaped;
	}

protected:
	MCPDeadline GetReadDeadline() const override;

private:
	StdioConfig config;
	bool connected;
	bool torn_down;
	int process_pid;
	int stdin_fd;
	int stdout_fd;
	//! Liveness checks may reap the child from a const context
	mutable bool reaped;
	string read_buffer;

	// Process management
	void StartProcess();
	void StopProcess();
	bool IsProcessRunning() const;

	//! Returns false if no data became readable within timeout_ms
	bool WaitForData(int timeout_ms);
	void CloseDescriptors();
};

} // namespace duckdb
