#pragma once

#include "duckdb.hpp"

namespace duckdb {

//! MCP protocol revision sent in the initialize request
constexpr const char *MCP_PROTOCOL_VERSION = "2024-11-05";

//! Separator between server name and tool name in namespaced tool names
constexpr const char *MCP_TOOL_NAME_SEPARATOR = "::";

// clientInfo / serverInfo
struct MCPImplementationInfo {
	string name;
	string version;
};

// Tool descriptor as advertised by tools/list
struct MCPTool {
	string name;
	string description;
	string input_schema; // compact JSON text
};

// One item of a tools/call result
struct MCPToolContent {
	string type;
	string text; // only meaningful for type "text"

	bool IsText() const {
		return type == "text";
	}
};

struct MCPToolCallResult {
	vector<MCPToolContent> content;
	bool is_error = false;

	//! Text items joined with "\n"; non-text items are skipped
	string JoinText() const;
};

struct MCPInitializeResult {
	string protocol_version;
	MCPImplementationInfo server_info;
	string capabilities; // compact JSON text, "{}" when absent
};

//! Builders and parsers for the MCP payloads carried inside JSON-RPC params/result.
//! Parse functions take the compact JSON text of a result member and throw
//! MCPProtocolException when the shape does not match.
class MCPPayloads {
public:
	static string BuildInitializeParams(const MCPImplementationInfo &client_info);
	static MCPInitializeResult ParseInitializeResult(const string &result_json);

	static vector<MCPTool> ParseToolsListResult(const string &result_json);

	//! arguments_json must be a JSON object, or empty/"null" for {}
	static string BuildCallToolParams(const string &tool_name, const string &arguments_json);
	static MCPToolCallResult ParseCallToolResult(const string &result_json);
};

} // namespace duckdb
