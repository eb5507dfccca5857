#pragma once

#include "duckdb.hpp"
#include "client/mcp_server_spec.hpp"
#include "protocol/mcp_exception.hpp"
#include "duckdb/common/error_data.hpp"

#include <cerrno>
#include <chrono>
#include <signal.h>
#include <thread>

namespace duckdb {

//! What an MCPException carried, or thrown == false
struct CaughtMCPError {
	bool thrown = false;
	MCPErrorKind kind = MCPErrorKind::TRANSPORT;
	string message;
};

template <class FUNC>
CaughtMCPError CaptureMCPError(FUNC func) {
	CaughtMCPError caught;
	try {
		func();
	} catch (const MCPException &ex) {
		caught.thrown = true;
		caught.kind = ex.GetKind();
		caught.message = ex.GetRawMessage();
	}
	return caught;
}

inline MCPServerSpec MockServerSpec(const string &name, const string &mode = "normal") {
	MCPServerSpec spec;
	spec.name = name;
	spec.command = MCP_HUB_MOCK_SERVER_PATH;
	spec.args = {"--name", name, "--mode", mode};
	return spec;
}

//! True once kill(pid, 0) reports the process is gone
inline bool ProcessGone(int pid) {
	for (int attempt = 0; attempt < 50; attempt++) {
		if (kill(pid, 0) != 0 && errno == ESRCH) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
	return false;
}

// Canned server lines for scripted connections
constexpr const char *SCRIPTED_INIT_RESPONSE =
    R"({"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},)"
    R"("serverInfo":{"name":"scripted","version":"2.0"}}})";

constexpr const char *SCRIPTED_TOOLS_RESPONSE =
    R"({"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"repeat","description":"echoes input",)"
    R"("inputSchema":{"type":"object","properties":{"text":{"type":"string"}}}},{"name":"bare"}]}})";

} // namespace duckdb
