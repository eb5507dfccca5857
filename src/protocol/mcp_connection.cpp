#include "protocol/mcp_connection.hpp"
#include "protocol/mcp_exception.hpp"
#include "mcp_hub_extension.hpp"
#include "mcp_hub_logging.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/error_data.hpp"

namespace duckdb {

const char *MCPConnectionStateToString(MCPConnectionState state) {
	switch (state) {
	case MCPConnectionState::UNINITIALIZED:
		return "uninitialized";
	case MCPConnectionState::INITIALIZING:
		return "initializing";
	case MCPConnectionState::READY:
		return "ready";
	case MCPConnectionState::FAILED:
		return "failed";
	case MCPConnectionState::SHUT_DOWN:
		return "shut_down";
	default:
		return "unknown";
	}
}

MCPConnection::MCPConnection(const string &server_name, unique_ptr<MCPTransport> transport,
                             const MCPConnectionOptions &options)
    : server_name(server_name), transport(std::move(transport)), options(options),
      state(MCPConnectionState::UNINITIALIZED), next_request_id(1) {
	if (!this->transport) {
		throw InvalidInputException("MCP connection '%s' requires a transport", server_name);
	}
}

MCPConnection::~MCPConnection() {
	try {
		Shutdown();
	} catch (const std::exception &ex) {
		MCP_HUB_LOG_ERROR("CONNECTION", "Error shutting down MCP server '%s': %s", server_name,
		                  ErrorData(ex).RawMessage());
	}
}

unique_ptr<MCPConnection> MCPConnection::Start(const MCPServerSpec &spec, const MCPConnectionOptions &options) {
	MCP_HUB_LOG_INFO("CONNECTION", "Starting MCP server '%s': %s", spec.name, spec.command);

	StdioTransport::StdioConfig config;
	config.command_path = spec.command;
	config.arguments = spec.args;
	config.environment = spec.env;
	config.working_directory = spec.cwd;
	config.timeout_seconds = options.request_timeout_seconds;

	auto transport = make_uniq<StdioTransport>(config);
	try {
		transport->Connect();
	} catch (const MCPTransportException &ex) {
		throw MCPTransportException("Failed to start MCP server '%s': %s", spec.name, ex.GetRawMessage());
	}

	return make_uniq<MCPConnection>(spec.name, std::move(transport), options);
}

void MCPConnection::Initialize() {
	auto current = state.load();
	if (current != MCPConnectionState::UNINITIALIZED) {
		throw InvalidInputException("Cannot initialize MCP server '%s' in state %s", server_name,
		                            MCPConnectionStateToString(current));
	}
	state = MCPConnectionState::INITIALIZING;
	MCP_HUB_LOG_INFO("CONNECTION", "Initializing MCP server '%s'", server_name);

	try {
		transport->Connect();

		MCPImplementationInfo client_info;
		client_info.name = options.client_name;
		client_info.version = options.client_version.empty() ? string(MCP_HUB_VERSION) : options.client_version;

		auto response = SendRequest(MCPMethods::INITIALIZE, MCPPayloads::BuildInitializeParams(client_info));
		auto init_result = MCPPayloads::ParseInitializeResult(response.result);
		{
			lock_guard<mutex> lock(info_mutex);
			server_info = init_result.server_info;
			protocol_version = init_result.protocol_version;
			capabilities = init_result.capabilities;
		}
		MCP_HUB_LOG_INFO("CONNECTION", "MCP server '%s' initialized: %s v%s", server_name,
		                 init_result.server_info.name, init_result.server_info.version);

		if (options.send_initialized) {
			SendNotification(MCPMethods::INITIALIZED);
		}

		RefreshTools();
	} catch (const MCPException &ex) {
		MarkFailed(ex.GetRawMessage());
		throw;
	} catch (const std::exception &ex) {
		MarkFailed(ErrorData(ex).RawMessage());
		throw;
	}

	// A concurrent Shutdown wins over the handshake
	auto expected = MCPConnectionState::INITIALIZING;
	state.compare_exchange_strong(expected, MCPConnectionState::READY);
}

vector<MCPTool> MCPConnection::ListTools() {
	RequireReady("list tools");
	return RefreshTools();
}

vector<MCPTool> MCPConnection::RefreshTools() {
	auto response = SendRequest(MCPMethods::TOOLS_LIST, "{}");
	auto listed = MCPPayloads::ParseToolsListResult(response.result);

	for (auto &tool : listed) {
		if (tool.name.find(MCP_TOOL_NAME_SEPARATOR) != string::npos) {
			MCP_HUB_LOG_WARN("CONNECTION", "MCP server '%s' advertises tool '%s' containing '%s'; it cannot be routed",
			                 server_name, tool.name, MCP_TOOL_NAME_SEPARATOR);
		}
	}
	MCP_HUB_LOG_INFO("CONNECTION", "MCP server '%s' provides %d tools", server_name, idx_t(listed.size()));

	lock_guard<mutex> lock(info_mutex);
	tools = listed;
	return listed;
}

vector<MCPTool> MCPConnection::GetTools() const {
	lock_guard<mutex> lock(info_mutex);
	vector<MCPTool> result;
	result.reserve(tools.size());
	for (auto &tool : tools) {
		MCPTool namespaced = tool;
		namespaced.name = server_name + MCP_TOOL_NAME_SEPARATOR + tool.name;
		result.push_back(std::move(namespaced));
	}
	return result;
}

vector<string> MCPConnection::GetToolNames() const {
	lock_guard<mutex> lock(info_mutex);
	vector<string> names;
	for (auto &tool : tools) {
		names.push_back(tool.name);
	}
	return names;
}

MCPToolCallResult MCPConnection::CallToolRaw(const string &name, const string &arguments_json) {
	RequireReady("call tools");
	MCP_HUB_PERF_TIMER("tools/call", server_name + MCP_TOOL_NAME_SEPARATOR + name);

	auto params = MCPPayloads::BuildCallToolParams(name, arguments_json);
	auto response = SendRequest(MCPMethods::TOOLS_CALL, params);
	return MCPPayloads::ParseCallToolResult(response.result);
}

string MCPConnection::CallTool(const string &name, const string &arguments_json) {
	auto result = CallToolRaw(name, arguments_json);
	auto text = result.JoinText();
	if (result.is_error) {
		throw MCPToolExecutionException(name, text);
	}
	return text;
}

void MCPConnection::Shutdown() {
	lock_guard<mutex> lock(request_mutex);
	if (state.load() == MCPConnectionState::SHUT_DOWN) {
		return;
	}
	state = MCPConnectionState::SHUT_DOWN;
	transport->Disconnect();
	MCP_HUB_LOG_DEBUG("CONNECTION", "MCP server '%s' shut down", server_name);
}

string MCPConnection::GetConnectionInfo() const {
	return server_name + " (" + transport->GetConnectionInfo() + ")";
}

MCPImplementationInfo MCPConnection::GetServerInfo() const {
	lock_guard<mutex> lock(info_mutex);
	return server_info;
}

string MCPConnection::GetProtocolVersion() const {
	lock_guard<mutex> lock(info_mutex);
	return protocol_version;
}

string MCPConnection::GetCapabilities() const {
	lock_guard<mutex> lock(info_mutex);
	return capabilities;
}

MCPMessage MCPConnection::SendRequest(const string &method, const string &params) {
	lock_guard<mutex> lock(request_mutex);

	auto current = state.load();
	if (current != MCPConnectionState::INITIALIZING && current != MCPConnectionState::READY) {
		throw InvalidInputException("MCP server '%s' is not ready (state: %s)", server_name,
		                            MCPConnectionStateToString(current));
	}

	auto request_id = next_request_id.fetch_add(1);
	auto request = MCPMessage::CreateRequest(method, params, Value::BIGINT(request_id));
	// One bound for the whole round trip, notifications included
	auto deadline = MCPDeadlineAfter(options.request_timeout_seconds);

	MCPMessage response;
	try {
		WriteMessage(request);
		response = ReadResponse(request_id, deadline);
	} catch (const MCPException &ex) {
		// The stream can no longer be trusted to pair requests with responses
		MarkFailed(ex.GetRawMessage());
		throw;
	}

	if (response.has_error) {
		throw MCPRPCException(response.error.code, response.error.message);
	}
	return response;
}

void MCPConnection::SendNotification(const string &method, const string &params) {
	lock_guard<mutex> lock(request_mutex);

	auto current = state.load();
	if (current != MCPConnectionState::INITIALIZING && current != MCPConnectionState::READY) {
		throw InvalidInputException("MCP server '%s' is not ready (state: %s)", server_name,
		                            MCPConnectionStateToString(current));
	}

	auto notification = MCPMessage::CreateNotification(method, params);
	try {
		WriteMessage(notification);
	} catch (const MCPException &ex) {
		MarkFailed(ex.GetRawMessage());
		throw;
	}
}

void MCPConnection::RequireReady(const char *operation) const {
	auto current = state.load();
	if (current != MCPConnectionState::READY) {
		throw InvalidInputException("Cannot %s: MCP server '%s' is not ready (state: %s)", operation, server_name,
		                            MCPConnectionStateToString(current));
	}
}

void MCPConnection::WriteMessage(const MCPMessage &message) {
	auto line = message.ToJSON();
	MCP_HUB_LOG_PROTOCOL(true, server_name, line);
	transport->WriteLine(line);
}

MCPMessage MCPConnection::ReadResponse(int64_t request_id, MCPDeadline deadline) {
	while (true) {
		string line;
		try {
			line = transport->ReadLine(deadline);
		} catch (const MCPTimeoutException &) {
			throw MCPTimeoutException("Timed out after %d seconds waiting for response %d from MCP server '%s'",
			                          options.request_timeout_seconds, request_id, server_name);
		}
		MCP_HUB_LOG_PROTOCOL(false, server_name, line);

		auto message = MCPMessage::FromJSON(line);
		if (message.IsNotification()) {
			MCP_HUB_LOG_DEBUG("CONNECTION", "Skipping notification '%s' from MCP server '%s'", message.method,
			                  server_name);
			continue;
		}
		if (message.IsRequest()) {
			throw MCPProtocolException("Unexpected request '%s' from MCP server '%s': %s", message.method, server_name,
			                           line);
		}
		if (!message.HasId(request_id)) {
			throw MCPProtocolException("Response id does not match request %d from MCP server '%s': %s", request_id,
			                           server_name, line);
		}
		if (!message.has_error && !message.has_result) {
			throw MCPProtocolException("JSON-RPC response missing result field from MCP server '%s': %s", server_name,
			                           line);
		}
		return message;
	}
}

void MCPConnection::MarkFailed(const string &reason) {
	auto current = state.load();
	while (current != MCPConnectionState::SHUT_DOWN && current != MCPConnectionState::FAILED) {
		if (state.compare_exchange_weak(current, MCPConnectionState::FAILED)) {
			MCP_HUB_LOG_ERROR("CONNECTION", "MCP server '%s' failed: %s", server_name, reason);
			return;
		}
	}
}

} // namespace duckdb
