#include "mcp_hub_config.hpp"
#include "json_utils.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace duckdb {

static constexpr const char *DEFAULT_SERVER_FILE = "./.mcp.json";
static constexpr int64_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 30;

static string ValueToString(yyjson_val *val) {
	return string(yyjson_get_str(val), yyjson_get_len(val));
}

static MCPServerSpec ParseServerEntry(const string &name, yyjson_val *entry) {
	MCPServerSpec spec;
	spec.name = name;

	auto command_val = yyjson_obj_get(entry, "command");
	if (!yyjson_is_str(command_val)) {
		throw InvalidInputException("MCP server '%s' is missing required string field 'command'", name);
	}
	spec.command = ValueToString(command_val);

	auto args_val = yyjson_obj_get(entry, "args");
	if (args_val && !yyjson_is_null(args_val)) {
		if (!yyjson_is_arr(args_val)) {
			throw InvalidInputException("Field 'args' of MCP server '%s' must be an array of strings", name);
		}
		size_t idx, max;
		yyjson_val *arg;
		yyjson_arr_foreach(args_val, idx, max, arg) {
			if (!yyjson_is_str(arg)) {
				throw InvalidInputException("Field 'args' of MCP server '%s' must be an array of strings", name);
			}
			spec.args.push_back(ValueToString(arg));
		}
	}

	auto env_val = yyjson_obj_get(entry, "env");
	if (env_val && !yyjson_is_null(env_val)) {
		if (!yyjson_is_obj(env_val)) {
			throw InvalidInputException("Field 'env' of MCP server '%s' must be an object of strings", name);
		}
		size_t idx, max;
		yyjson_val *key, *val;
		yyjson_obj_foreach(env_val, idx, max, key, val) {
			if (!yyjson_is_str(val)) {
				throw InvalidInputException("Variable '%s' in field 'env' of MCP server '%s' must be a string",
				                            ValueToString(key), name);
			}
			spec.env[ValueToString(key)] = ValueToString(val);
		}
	}

	auto cwd_val = yyjson_obj_get(entry, "cwd");
	if (cwd_val && !yyjson_is_null(cwd_val)) {
		if (!yyjson_is_str(cwd_val)) {
			throw InvalidInputException("Field 'cwd' of MCP server '%s' must be a string", name);
		}
		spec.cwd = ValueToString(cwd_val);
	}

	return spec;
}

vector<MCPServerSpec> MCPHubConfig::ParseServerSpecs(const string &json) {
	JSONDocument doc(JSONUtils::TryParse(json));
	if (!doc.IsValid()) {
		throw InvalidInputException("Invalid JSON in MCP server configuration");
	}
	auto root = doc.Root();
	if (!yyjson_is_obj(root)) {
		throw InvalidInputException("MCP server configuration must be a JSON object");
	}

	auto list_val = yyjson_obj_get(root, "mcp_servers");
	auto map_val = yyjson_obj_get(root, "mcpServers");
	if (!list_val && !map_val) {
		throw InvalidInputException("MCP server configuration must contain 'mcp_servers' array or 'mcpServers' object");
	}

	vector<MCPServerSpec> specs;
	if (list_val) {
		if (!yyjson_is_arr(list_val)) {
			throw InvalidInputException("Field 'mcp_servers' must be an array");
		}
		size_t idx, max;
		yyjson_val *entry;
		yyjson_arr_foreach(list_val, idx, max, entry) {
			if (!yyjson_is_obj(entry)) {
				throw InvalidInputException("Entry %d of 'mcp_servers' must be an object", idx_t(idx));
			}
			auto name_val = yyjson_obj_get(entry, "name");
			if (!yyjson_is_str(name_val)) {
				throw InvalidInputException("Entry %d of 'mcp_servers' is missing required string field 'name'",
				                            idx_t(idx));
			}
			specs.push_back(ParseServerEntry(ValueToString(name_val), entry));
		}
	}
	if (map_val) {
		if (!yyjson_is_obj(map_val)) {
			throw InvalidInputException("Field 'mcpServers' must be an object");
		}
		size_t idx, max;
		yyjson_val *key, *entry;
		yyjson_obj_foreach(map_val, idx, max, key, entry) {
			auto name = ValueToString(key);
			if (!yyjson_is_obj(entry)) {
				throw InvalidInputException("Entry '%s' of 'mcpServers' must be an object", name);
			}
			specs.push_back(ParseServerEntry(name, entry));
		}
	}
	return specs;
}

vector<MCPServerSpec> MCPHubConfig::LoadServerSpecs(const string &file_path) {
	std::ifstream file(file_path);
	if (!file.is_open()) {
		throw IOException("Config file not found: %s", file_path);
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	if (file.bad()) {
		throw IOException("Failed to read config file: %s", file_path);
	}
	return ParseServerSpecs(buffer.str());
}

MCPHubConfigManager &MCPHubConfigManager::GetInstance() {
	static MCPHubConfigManager instance;
	return instance;
}

MCPHubConfigManager::MCPHubConfigManager()
    : server_file(DEFAULT_SERVER_FILE), request_timeout_seconds(DEFAULT_REQUEST_TIMEOUT_SECONDS),
      parallel_startup(true) {
}

void MCPHubConfigManager::SetServerFile(const string &file_path) {
	std::lock_guard<std::mutex> lock(config_mutex);
	server_file = file_path;
}

string MCPHubConfigManager::GetServerFile() const {
	std::lock_guard<std::mutex> lock(config_mutex);
	return server_file;
}

void MCPHubConfigManager::SetRequestTimeout(int64_t seconds) {
	if (seconds < 0 || seconds > std::numeric_limits<int32_t>::max()) {
		throw InvalidInputException("mcp_hub_request_timeout must be between 0 and %d seconds (0 disables the timeout), got %d",
		                            int64_t(std::numeric_limits<int32_t>::max()), seconds);
	}
	std::lock_guard<std::mutex> lock(config_mutex);
	request_timeout_seconds = seconds;
}

int64_t MCPHubConfigManager::GetRequestTimeout() const {
	std::lock_guard<std::mutex> lock(config_mutex);
	return request_timeout_seconds;
}

void MCPHubConfigManager::SetParallelStartup(bool parallel) {
	std::lock_guard<std::mutex> lock(config_mutex);
	parallel_startup = parallel;
}

bool MCPHubConfigManager::IsParallelStartup() const {
	std::lock_guard<std::mutex> lock(config_mutex);
	return parallel_startup;
}

MCPServerManagerOptions MCPHubConfigManager::GetManagerOptions() const {
	std::lock_guard<std::mutex> lock(config_mutex);
	MCPServerManagerOptions options;
	options.connection.request_timeout_seconds = static_cast<int>(request_timeout_seconds);
	options.parallel_startup = parallel_startup;
	return options;
}

void MCPHubConfigManager::Reset() {
	std::lock_guard<std::mutex> lock(config_mutex);
	server_file = DEFAULT_SERVER_FILE;
	request_timeout_seconds = DEFAULT_REQUEST_TIMEOUT_SECONDS;
	parallel_startup = true;
}

} // namespace duckdb
