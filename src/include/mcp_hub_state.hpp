#pragma once

#include "duckdb.hpp"
#include "client/mcp_server_manager.hpp"

namespace duckdb {

//! Owns the process-wide server manager used by the SQL functions
class MCPHubState {
public:
	static MCPHubState &GetInstance();

	//! The current manager, created from MCPHubConfigManager settings on first use
	shared_ptr<MCPServerManager> GetManager();

	//! Tear down every managed server and drop the manager so the next start
	//! picks up changed settings. Returns how many servers were stopped.
	idx_t StopServers();

	~MCPHubState();

private:
	MCPHubState();

	mutex state_mutex;
	shared_ptr<MCPServerManager> manager;
};

} // namespace duckdb
