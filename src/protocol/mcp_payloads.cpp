#include "protocol/mcp_payloads.hpp"
#include "protocol/mcp_exception.hpp"
#include "json_utils.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

string MCPToolCallResult::JoinText() const {
	vector<string> texts;
	for (auto &item : content) {
		if (item.IsText()) {
			texts.push_back(item.text);
		}
	}
	return StringUtil::Join(texts, "\n");
}

static yyjson_val *ParseResultObject(JSONDocument &doc, const string &result_json, const char *what) {
	auto root = doc.Root();
	if (!root || !yyjson_is_obj(root)) {
		throw MCPProtocolException("Invalid %s result: %s", what, result_json);
	}
	return root;
}

string MCPPayloads::BuildInitializeParams(const MCPImplementationInfo &client_info) {
	MutableJSONDocument doc;
	auto root = JSONUtils::CreateObject(doc.Get());
	doc.SetRoot(root);

	JSONUtils::AddString(doc.Get(), root, "protocolVersion", MCP_PROTOCOL_VERSION);
	JSONUtils::AddObject(doc.Get(), root, "capabilities", JSONUtils::CreateObject(doc.Get()));

	auto info = JSONUtils::CreateObject(doc.Get());
	JSONUtils::AddString(doc.Get(), info, "name", client_info.name);
	JSONUtils::AddString(doc.Get(), info, "version", client_info.version);
	JSONUtils::AddObject(doc.Get(), root, "clientInfo", info);

	return doc.Serialize();
}

MCPInitializeResult MCPPayloads::ParseInitializeResult(const string &result_json) {
	JSONDocument doc(JSONUtils::TryParse(result_json));
	auto root = ParseResultObject(doc, result_json, "initialize");

	auto server_info = JSONUtils::GetObject(root, "serverInfo");
	if (!server_info) {
		throw MCPProtocolException("Failed to parse initialize response: missing serverInfo in %s", result_json);
	}
	auto name_val = yyjson_obj_get(server_info, "name");
	auto version_val = yyjson_obj_get(server_info, "version");
	if (!yyjson_is_str(name_val) || !yyjson_is_str(version_val)) {
		throw MCPProtocolException("Failed to parse initialize response: serverInfo needs string name and version in %s",
		                           result_json);
	}

	MCPInitializeResult result;
	result.server_info.name = string(yyjson_get_str(name_val), yyjson_get_len(name_val));
	result.server_info.version = string(yyjson_get_str(version_val), yyjson_get_len(version_val));
	result.protocol_version = JSONUtils::GetString(root, "protocolVersion");

	auto capabilities = JSONUtils::GetObject(root, "capabilities");
	result.capabilities = capabilities ? JSONUtils::Serialize(capabilities) : "{}";
	return result;
}

vector<MCPTool> MCPPayloads::ParseToolsListResult(const string &result_json) {
	JSONDocument doc(JSONUtils::TryParse(result_json));
	auto root = ParseResultObject(doc, result_json, "tools/list");

	auto tools_arr = JSONUtils::GetArray(root, "tools");
	if (!tools_arr) {
		throw MCPProtocolException("Failed to parse tools list: missing tools array in %s", result_json);
	}

	vector<MCPTool> tools;
	size_t idx, max;
	yyjson_val *tool_val;
	yyjson_arr_foreach(tools_arr, idx, max, tool_val) {
		if (!yyjson_is_obj(tool_val)) {
			throw MCPProtocolException("Failed to parse tools list: entry %d is not an object",
			                           idx_t(idx));
		}
		auto name_val = yyjson_obj_get(tool_val, "name");
		if (!yyjson_is_str(name_val)) {
			throw MCPProtocolException("Failed to parse tools list: entry %d has no string name",
			                           idx_t(idx));
		}

		MCPTool tool;
		tool.name = string(yyjson_get_str(name_val), yyjson_get_len(name_val));
		tool.description = JSONUtils::GetString(tool_val, "description");

		auto schema_val = yyjson_obj_get(tool_val, "inputSchema");
		if (schema_val && !yyjson_is_null(schema_val)) {
			tool.input_schema = JSONUtils::Serialize(schema_val);
		} else {
			tool.input_schema = "{\"type\":\"object\"}";
		}
		tools.push_back(std::move(tool));
	}
	return tools;
}

string MCPPayloads::BuildCallToolParams(const string &tool_name, const string &arguments_json) {
	MutableJSONDocument doc;
	auto root = JSONUtils::CreateObject(doc.Get());
	doc.SetRoot(root);

	JSONUtils::AddString(doc.Get(), root, "name", tool_name);

	yyjson_mut_val *arguments;
	auto trimmed = arguments_json;
	StringUtil::Trim(trimmed);
	if (trimmed.empty() || trimmed == "null") {
		arguments = JSONUtils::CreateObject(doc.Get());
	} else {
		JSONDocument parsed(JSONUtils::TryParse(trimmed));
		if (!parsed.IsValid() || !yyjson_is_obj(parsed.Root())) {
			throw InvalidInputException("Tool arguments must be a JSON object, got: %s", arguments_json);
		}
		arguments = yyjson_val_mut_copy(doc.Get(), parsed.Root());
	}
	JSONUtils::AddObject(doc.Get(), root, "arguments", arguments);

	return doc.Serialize();
}

MCPToolCallResult MCPPayloads::ParseCallToolResult(const string &result_json) {
	JSONDocument doc(JSONUtils::TryParse(result_json));
	auto root = ParseResultObject(doc, result_json, "tools/call");

	auto content_arr = JSONUtils::GetArray(root, "content");
	if (!content_arr) {
		throw MCPProtocolException("Failed to parse tool result: missing content array in %s", result_json);
	}

	MCPToolCallResult result;
	size_t idx, max;
	yyjson_val *item_val;
	yyjson_arr_foreach(content_arr, idx, max, item_val) {
		auto type_val = yyjson_obj_get(item_val, "type");
		if (!yyjson_is_obj(item_val) || !yyjson_is_str(type_val)) {
			throw MCPProtocolException("Failed to parse tool result: content item %d has no type in %s",
			                           idx_t(idx), result_json);
		}

		MCPToolContent item;
		item.type = string(yyjson_get_str(type_val), yyjson_get_len(type_val));
		if (item.IsText()) {
			auto text_val = yyjson_obj_get(item_val, "text");
			if (!yyjson_is_str(text_val)) {
				throw MCPProtocolException("Failed to parse tool result: text item %d has no text in %s",
				                           idx_t(idx), result_json);
			}
			item.text = string(yyjson_get_str(text_val), yyjson_get_len(text_val));
		}
		result.content.push_back(std::move(item));
	}

	result.is_error = JSONUtils::GetBool(root, "isError", false);
	return result;
}

} // namespace duckdb
