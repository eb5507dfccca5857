#include "client/mcp_server_manager.hpp"
#include "protocol/mcp_exception.hpp"
#include "mcp_hub_logging.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/string_util.hpp"

#include <set>
#include <system_error>
#include <thread>

namespace duckdb {

string MCPStartupReport::Summary() const {
	return StringUtil::Format("%d of %d MCP servers available", idx_t(started.size()), requested);
}

// Empty string when the name is acceptable
static string CheckServerName(const string &name) {
	if (name.empty()) {
		return "server name is empty";
	}
	if (name.find(MCP_TOOL_NAME_SEPARATOR) != string::npos) {
		return StringUtil::Format("server name '%s' contains '%s'", name, MCP_TOOL_NAME_SEPARATOR);
	}
	return string();
}

MCPServerManager::MCPServerManager(const MCPServerManagerOptions &options) : options(options) {
}

MCPServerManager::~MCPServerManager() {
	try {
		StopServers();
	} catch (const std::exception &ex) {
		MCP_HUB_LOG_ERROR("MANAGER", "Error stopping MCP servers: %s", ErrorData(ex).RawMessage());
	}
}

MCPStartupReport MCPServerManager::StartServers(const vector<MCPServerSpec> &specs) {
	MCP_HUB_PERF_TIMER("start_servers", StringUtil::Format("%d specs", idx_t(specs.size())));

	MCPStartupReport report;
	report.requested = specs.size();

	// Reject bad and duplicate names before anything is spawned
	vector<string> errors(specs.size());
	{
		lock_guard<mutex> lock(manager_mutex);
		std::set<string> batch_names;
		for (idx_t i = 0; i < specs.size(); i++) {
			auto &name = specs[i].name;
			errors[i] = CheckServerName(name);
			if (!errors[i].empty()) {
				continue;
			}
			if (connections.find(name) != connections.end() || batch_names.count(name) > 0) {
				errors[i] = StringUtil::Format("duplicate server name '%s'", name);
				continue;
			}
			batch_names.insert(name);
		}
	}

	vector<unique_ptr<MCPConnection>> started(specs.size());
	auto start_one = [&](idx_t i) {
		try {
			auto connection = MCPConnection::Start(specs[i], options.connection);
			connection->Initialize();
			started[i] = std::move(connection);
		} catch (const MCPException &ex) {
			errors[i] = ex.GetRawMessage();
		} catch (const std::exception &ex) {
			errors[i] = ErrorData(ex).RawMessage();
		}
	};

	vector<idx_t> to_start;
	for (idx_t i = 0; i < specs.size(); i++) {
		if (errors[i].empty()) {
			to_start.push_back(i);
		}
	}

	if (options.parallel_startup && to_start.size() > 1) {
		vector<std::thread> workers;
		workers.reserve(to_start.size());
		idx_t launched = 0;
		for (; launched < to_start.size(); launched++) {
			if (options.max_startup_threads > 0 && workers.size() >= options.max_startup_threads) {
				break;
			}
			try {
				workers.emplace_back(start_one, to_start[launched]);
			} catch (const std::system_error &ex) {
				MCP_HUB_LOG_WARN("MANAGER", "Cannot create startup thread (%s); starting %d MCP servers sequentially",
				                 string(ex.what()), idx_t(to_start.size() - launched));
				break;
			}
		}
		// Specs without a worker of their own start on this thread
		for (idx_t k = launched; k < to_start.size(); k++) {
			start_one(to_start[k]);
		}
		for (auto &worker : workers) {
			worker.join();
		}
	} else {
		for (auto i : to_start) {
			start_one(i);
		}
	}

	vector<unique_ptr<MCPConnection>> rejected;
	{
		lock_guard<mutex> lock(manager_mutex);
		for (idx_t i = 0; i < specs.size(); i++) {
			auto &name = specs[i].name;
			if (started[i] && connections.find(name) != connections.end()) {
				// Another StartServers call claimed the name while this one was starting
				errors[i] = StringUtil::Format("duplicate server name '%s'", name);
				rejected.push_back(std::move(started[i]));
			}
			if (started[i]) {
				connections[name] = shared_ptr<MCPConnection>(std::move(started[i]));
				report.started.push_back(name);
			} else {
				MCPServerStartFailure failure;
				failure.server_name = name;
				failure.error = errors[i];
				report.failures.push_back(std::move(failure));
			}
		}
	}

	for (auto &failure : report.failures) {
		MCP_HUB_LOG_ERROR("MANAGER", "Failed to start MCP server '%s': %s", failure.server_name, failure.error);
	}
	MCP_HUB_LOG_INFO("MANAGER", "%s", report.Summary());
	return report;
}

vector<MCPTool> MCPServerManager::GetAllTools() const {
	vector<shared_ptr<MCPConnection>> snapshot;
	{
		lock_guard<mutex> lock(manager_mutex);
		for (auto &entry : connections) {
			snapshot.push_back(entry.second);
		}
	}

	vector<MCPTool> all_tools;
	for (auto &connection : snapshot) {
		auto tools = connection->GetTools();
		all_tools.insert(all_tools.end(), tools.begin(), tools.end());
	}
	return all_tools;
}

std::pair<string, string> MCPServerManager::ParseToolName(const string &namespaced_name) {
	vector<string> parts;
	idx_t start = 0;
	while (true) {
		auto pos = namespaced_name.find(MCP_TOOL_NAME_SEPARATOR, start);
		if (pos == string::npos) {
			parts.push_back(namespaced_name.substr(start));
			break;
		}
		parts.push_back(namespaced_name.substr(start, pos - start));
		start = pos + 2;
	}

	if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
		throw MCPRoutingException("Invalid tool name format: '%s' (expected 'server::tool')", namespaced_name);
	}
	return std::make_pair(parts[0], parts[1]);
}

string MCPServerManager::CallTool(const string &namespaced_name, const string &arguments_json) {
	auto parsed = ParseToolName(namespaced_name);
	auto connection = GetConnection(parsed.first);
	if (!connection) {
		throw MCPRoutingException("MCP server '%s' not found", parsed.first);
	}

	MCP_HUB_LOG_DEBUG("MANAGER", "Routing '%s' to MCP server '%s'", parsed.second, parsed.first);
	return connection->CallTool(parsed.second, arguments_json);
}

idx_t MCPServerManager::ServerCount() const {
	lock_guard<mutex> lock(manager_mutex);
	return connections.size();
}

vector<string> MCPServerManager::ServerNames() const {
	lock_guard<mutex> lock(manager_mutex);
	vector<string> names;
	for (auto &entry : connections) {
		names.push_back(entry.first);
	}
	return names;
}

shared_ptr<MCPConnection> MCPServerManager::GetConnection(const string &server_name) const {
	lock_guard<mutex> lock(manager_mutex);
	auto it = connections.find(server_name);
	if (it != connections.end()) {
		return it->second;
	}
	return nullptr;
}

idx_t MCPServerManager::StopServers() {
	std::map<string, shared_ptr<MCPConnection>> to_stop;
	{
		lock_guard<mutex> lock(manager_mutex);
		to_stop.swap(connections);
	}

	for (auto &entry : to_stop) {
		try {
			entry.second->Shutdown();
		} catch (const std::exception &ex) {
			MCP_HUB_LOG_ERROR("MANAGER", "Error stopping MCP server '%s': %s", entry.first,
			                  ErrorData(ex).RawMessage());
		}
	}
	if (!to_stop.empty()) {
		MCP_HUB_LOG_INFO("MANAGER", "Stopped %d MCP servers", idx_t(to_stop.size()));
	}
	return to_stop.size();
}

} // namespace duckdb
