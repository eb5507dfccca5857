#pragma once

#include "duckdb.hpp"
#include "client/mcp_server_spec.hpp"
#include "protocol/mcp_connection.hpp"
#include <map>

namespace duckdb {

struct MCPServerStartFailure {
	string server_name;
	string error;
};

//! Outcome of one StartServers call
struct MCPStartupReport {
	idx_t requested = 0;
	//! Names of the servers that reached Ready, in spec order
	vector<string> started;
	vector<MCPServerStartFailure> failures;

	bool AllStarted() const {
		return failures.empty();
	}
	string Summary() const;
};

struct MCPServerManagerOptions {
	MCPConnectionOptions connection;
	//! Spawn and initialize specs concurrently, one thread per spec
	bool parallel_startup = true;
	//! Cap on startup threads; 0 means no cap. Specs beyond it start on the calling thread.
	idx_t max_startup_threads = 0;
};

// Owns a set of ready MCP server connections keyed by server name and routes
// namespaced tool calls ("server::tool") to them.
class MCPServerManager {
public:
	explicit MCPServerManager(const MCPServerManagerOptions &options = MCPServerManagerOptions());
	~MCPServerManager();

	//! Start and initialize every spec. Specs that fail are logged and reported,
	//! never fatal; only Ready connections are kept.
	MCPStartupReport StartServers(const vector<MCPServerSpec> &specs);

	//! Namespaced tools of every managed server, grouped by server name
	vector<MCPTool> GetAllTools() const;

	//! Route "server::tool" to its server. Throws MCPRoutingException for a bad
	//! name or unknown server; otherwise the connection's errors propagate.
	string CallTool(const string &namespaced_name, const string &arguments_json);

	idx_t ServerCount() const;
	//! Sorted
	vector<string> ServerNames() const;
	shared_ptr<MCPConnection> GetConnection(const string &server_name) const;

	//! Shut down every connection and forget it; returns how many were stopped
	idx_t StopServers();

	//! Split "server::tool" into exactly two non-empty parts
	static std::pair<string, string> ParseToolName(const string &namespaced_name);

	const MCPServerManagerOptions &GetOptions() const {
		return options;
	}

private:
	MCPServerManagerOptions options;
	mutable mutex manager_mutex;
	std::map<string, shared_ptr<MCPConnection>> connections;
};

} // namespace duckdb
