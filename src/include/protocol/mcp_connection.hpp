#pragma once

#include "duckdb.hpp"
#include "protocol/mcp_transport.hpp"
#include "protocol/mcp_message.hpp"
#include "protocol/mcp_payloads.hpp"
#include "client/mcp_server_spec.hpp"
#include <atomic>

namespace duckdb {

// MCP connection state
enum class MCPConnectionState : uint8_t { UNINITIALIZED, INITIALIZING, READY, FAILED, SHUT_DOWN };

const char *MCPConnectionStateToString(MCPConnectionState state);

struct MCPConnectionOptions {
	//! Bound on each request/response round trip; 0 waits forever
	int request_timeout_seconds = 30;
	//! Send notifications/initialized after a successful initialize
	bool send_initialized = true;
	string client_name = "mcp_hub";
	//! Empty means the extension version
	string client_version;
};

// One MCP server session over a line transport
class MCPConnection {
public:
	MCPConnection(const string &server_name, unique_ptr<MCPTransport> transport,
	              const MCPConnectionOptions &options = MCPConnectionOptions());
	~MCPConnection();

	//! Spawn the server described by spec. The connection is returned Uninitialized.
	static unique_ptr<MCPConnection> Start(const MCPServerSpec &spec,
	                                       const MCPConnectionOptions &options = MCPConnectionOptions());

	//! Handshake followed by the tool listing. On any failure the state is Failed
	//! and the error is rethrown.
	void Initialize();

	//! Fetch tools/list and replace the cached tools; requires Ready
	vector<MCPTool> ListTools();

	//! Cached tools with names rewritten to "<server>::<tool>"
	vector<MCPTool> GetTools() const;

	//! Raw (un-namespaced) tool names as advertised
	vector<string> GetToolNames() const;

	//! Invoke a tool by its raw name; returns the joined text content
	string CallTool(const string &name, const string &arguments_json);

	//! Same as CallTool but returns the structured result, isError included
	MCPToolCallResult CallToolRaw(const string &name, const string &arguments_json);

	//! Close the session and tear down the transport. Safe to call repeatedly.
	void Shutdown();

	MCPConnectionState GetState() const {
		return state.load();
	}
	bool IsReady() const {
		return state.load() == MCPConnectionState::READY;
	}
	string GetServerName() const {
		return server_name;
	}
	string GetConnectionInfo() const;

	MCPImplementationInfo GetServerInfo() const;
	string GetProtocolVersion() const;
	string GetCapabilities() const;

	// Raw MCP protocol access
	MCPMessage SendRequest(const string &method, const string &params);
	void SendNotification(const string &method, const string &params = string());

	MCPTransport &GetTransport() {
		return *transport;
	}

private:
	string server_name;
	unique_ptr<MCPTransport> transport;
	MCPConnectionOptions options;
	atomic<MCPConnectionState> state;
	atomic<int64_t> next_request_id;

	//! Serializes request/response pairs and transport teardown
	mutex request_mutex;
	//! Guards the data recorded during initialization
	mutable mutex info_mutex;
	MCPImplementationInfo server_info;
	string protocol_version;
	string capabilities;
	vector<MCPTool> tools;

	vector<MCPTool> RefreshTools();
	void RequireReady(const char *operation) const;
	void WriteMessage(const MCPMessage &message);
	MCPMessage ReadResponse(int64_t request_id, MCPDeadline deadline);
	void MarkFailed(const string &reason);
};

} // namespace duckdb
