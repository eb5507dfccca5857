#pragma once

#include "duckdb.hpp"
#include "client/mcp_server_spec.hpp"
#include "client/mcp_server_manager.hpp"
#include <mutex>

namespace duckdb {

//! Reads server specs from JSON configuration documents. Two shapes are accepted:
//!   {"mcp_servers": [{"name": ..., "command": ..., "args": [...], "env": {...}, "cwd": ...}]}
//!   {"mcpServers": {"<name>": {"command": ..., "args": [...], "env": {...}, "cwd": ...}}}
//! Order is preserved in both.
class MCPHubConfig {
public:
	//! Throws InvalidInputException naming the offending field
	static vector<MCPServerSpec> ParseServerSpecs(const string &json);
	//! Throws IOException when the file cannot be read
	static vector<MCPServerSpec> LoadServerSpecs(const string &file_path);
};

//! Process-wide settings backing the mcp_hub_* extension options
class MCPHubConfigManager {
public:
	static MCPHubConfigManager &GetInstance();

	void SetServerFile(const string &file_path);
	string GetServerFile() const;

	//! Seconds; 0 disables the bound. Negative values are rejected.
	void SetRequestTimeout(int64_t seconds);
	int64_t GetRequestTimeout() const;

	void SetParallelStartup(bool parallel);
	bool IsParallelStartup() const;

	//! Options for a new manager built from the current settings
	MCPServerManagerOptions GetManagerOptions() const;

	//! Back to defaults
	void Reset();

private:
	MCPHubConfigManager();

	mutable std::mutex config_mutex;
	string server_file;
	int64_t request_timeout_seconds;
	bool parallel_startup;
};

} // namespace duckdb
