#include "mcp_hub_state.hpp"
#include "mcp_hub_config.hpp"
#include "mcp_hub_logging.hpp"
#include "duckdb/common/error_data.hpp"

namespace duckdb {

MCPHubState &MCPHubState::GetInstance() {
	static MCPHubState instance;
	return instance;
}

MCPHubState::MCPHubState() {
	// Constructed first so it is destroyed after the manager logs its shutdown
	MCPHubLogger::GetInstance();
}

MCPHubState::~MCPHubState() {
	try {
		StopServers();
	} catch (const std::exception &ex) {
		MCP_HUB_LOG_ERROR("STATE", "Error stopping MCP servers at exit: %s", ErrorData(ex).RawMessage());
	}
}

shared_ptr<MCPServerManager> MCPHubState::GetManager() {
	lock_guard<mutex> lock(state_mutex);
	if (!manager) {
		manager = make_shared_ptr<MCPServerManager>(MCPHubConfigManager::GetInstance().GetManagerOptions());
	}
	return manager;
}

idx_t MCPHubState::StopServers() {
	shared_ptr<MCPServerManager> to_stop;
	{
		lock_guard<mutex> lock(state_mutex);
		to_stop = std::move(manager);
		manager = nullptr;
	}
	if (!to_stop) {
		return 0;
	}
	return to_stop->StopServers();
}

} // namespace duckdb
