// Scripted MCP server speaking line-delimited JSON-RPC over stdio.
//
//   mock_mcp_server [--name NAME] [--mode MODE]
//
// Modes:
//   normal          well-behaved server
//   init-error      answers initialize with a JSON-RPC error
//   init-garbage    answers initialize with a line that is not JSON
//   init-no-result  answers initialize with neither result nor error
//   wrong-id        answers initialize with a different id
//   exit-on-init    exits without answering initialize
//   hang-on-call    never answers tools/call
//   notify-forever  answers tools/call with progress notifications only
//   tools-garbage   answers tools/list with a malformed result
//   notify-first    sends a notification ahead of every response
//   stdout-noise    prints a log line on stdout before the protocol starts

#include <yyjson.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

struct MockState {
	std::string name = "mock";
	std::string mode = "normal";
	int notifications_received = 0;
};

void WriteLine(const std::string &line) {
	std::cout << line << "\n";
	std::cout.flush();
}

void WriteDocument(yyjson_mut_doc *doc) {
	char *json = yyjson_mut_write(doc, 0, nullptr);
	if (json) {
		WriteLine(json);
		free(json);
	}
	yyjson_mut_doc_free(doc);
}

yyjson_mut_doc *NewEnvelope(yyjson_val *id, yyjson_mut_val **root_out) {
	auto doc = yyjson_mut_doc_new(nullptr);
	auto root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);
	yyjson_mut_obj_add_str(doc, root, "jsonrpc", "2.0");
	if (id) {
		yyjson_mut_obj_add_val(doc, root, "id", yyjson_val_mut_copy(doc, id));
	} else {
		yyjson_mut_obj_add_null(doc, root, "id");
	}
	*root_out = root;
	return doc;
}

void SendError(yyjson_val *id, int code, const std::string &message) {
	yyjson_mut_val *root;
	auto doc = NewEnvelope(id, &root);
	auto error = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_int(doc, error, "code", code);
	yyjson_mut_obj_add_strcpy(doc, error, "message", message.c_str());
	yyjson_mut_obj_add_val(doc, root, "error", error);
	WriteDocument(doc);
}

void SendNotification(const char *method) {
	auto doc = yyjson_mut_doc_new(nullptr);
	auto root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);
	yyjson_mut_obj_add_str(doc, root, "jsonrpc", "2.0");
	yyjson_mut_obj_add_str(doc, root, "method", method);
	auto params = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, params, "level", "info");
	yyjson_mut_obj_add_str(doc, params, "data", "working");
	yyjson_mut_obj_add_val(doc, root, "params", params);
	WriteDocument(doc);
}

// Text content result: {"content":[{"type":"text","text":...}],"isError":...}
void SendTextResult(yyjson_val *id, const std::string &text, bool is_error) {
	yyjson_mut_val *root;
	auto doc = NewEnvelope(id, &root);
	auto result = yyjson_mut_obj(doc);
	auto content = yyjson_mut_arr(doc);
	auto item = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, item, "type", "text");
	yyjson_mut_obj_add_strcpy(doc, item, "text", text.c_str());
	yyjson_mut_arr_append(content, item);
	yyjson_mut_obj_add_val(doc, result, "content", content);
	if (is_error) {
		yyjson_mut_obj_add_bool(doc, result, "isError", true);
	}
	yyjson_mut_obj_add_val(doc, root, "result", result);
	WriteDocument(doc);
}

std::string GetArgument(yyjson_val *arguments, const char *key) {
	auto value = arguments ? yyjson_obj_get(arguments, key) : nullptr;
	if (value && yyjson_is_str(value)) {
		return yyjson_get_str(value);
	}
	return std::string();
}

void HandleInitialize(MockState &state, yyjson_val *id) {
	if (state.mode == "exit-on-init") {
		std::exit(0);
	}
	if (state.mode == "init-error") {
		SendError(id, -32603, "initialize refused");
		return;
	}
	if (state.mode == "init-garbage") {
		WriteLine("this is not json");
		return;
	}
	yyjson_mut_val *root;
	auto doc = NewEnvelope(id, &root);
	if (state.mode == "init-no-result") {
		WriteDocument(doc);
		return;
	}
	if (state.mode == "wrong-id") {
		yyjson_mut_obj_remove_key(root, "id");
		yyjson_mut_obj_add_int(doc, root, "id", yyjson_get_sint(id) + 100);
	}

	auto result = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, result, "protocolVersion", "2024-11-05");
	auto capabilities = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_val(doc, capabilities, "tools", yyjson_mut_obj(doc));
	yyjson_mut_obj_add_val(doc, result, "capabilities", capabilities);
	auto server_info = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_strcpy(doc, server_info, "name", state.name.c_str());
	yyjson_mut_obj_add_str(doc, server_info, "version", "1.0.0");
	yyjson_mut_obj_add_val(doc, result, "serverInfo", server_info);
	yyjson_mut_obj_add_val(doc, root, "result", result);
	WriteDocument(doc);
}

void AddTool(yyjson_mut_doc *doc, yyjson_mut_val *tools, const char *name, const char *description,
             const char *argument) {
	auto tool = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, tool, "name", name);
	yyjson_mut_obj_add_str(doc, tool, "description", description);
	auto schema = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, schema, "type", "object");
	if (argument) {
		auto properties = yyjson_mut_obj(doc);
		auto property = yyjson_mut_obj(doc);
		yyjson_mut_obj_add_str(doc, property, "type", "string");
		yyjson_mut_obj_add_val(doc, properties, argument, property);
		yyjson_mut_obj_add_val(doc, schema, "properties", properties);
	}
	yyjson_mut_obj_add_val(doc, tool, "inputSchema", schema);
	yyjson_mut_arr_append(tools, tool);
}

void HandleToolsList(MockState &state, yyjson_val *id) {
	yyjson_mut_val *root;
	auto doc = NewEnvelope(id, &root);
	auto result = yyjson_mut_obj(doc);
	if (state.mode == "tools-garbage") {
		yyjson_mut_obj_add_str(doc, result, "tools", "not a list");
		yyjson_mut_obj_add_val(doc, root, "result", result);
		WriteDocument(doc);
		return;
	}

	auto tools = yyjson_mut_arr(doc);
	AddTool(doc, tools, "echo", "Echo the text argument", "text");
	AddTool(doc, tools, "fail", "Always reports a tool error", nullptr);
	AddTool(doc, tools, "env", "Read an environment variable", "name");
	AddTool(doc, tools, "mixed", "Returns text and image content", nullptr);
	AddTool(doc, tools, "pid", "Process id of the server", nullptr);
	AddTool(doc, tools, "cwd", "Working directory of the server", nullptr);
	AddTool(doc, tools, "notifications", "Number of notifications received", nullptr);
	yyjson_mut_obj_add_val(doc, result, "tools", tools);
	yyjson_mut_obj_add_val(doc, root, "result", result);
	WriteDocument(doc);
}

void HandleToolsCall(MockState &state, yyjson_val *id, yyjson_val *params) {
	if (state.mode == "hang-on-call") {
		while (true) {
			sleep(60);
		}
	}
	if (state.mode == "notify-forever") {
		while (true) {
			SendNotification("notifications/progress");
			usleep(200000);
		}
	}

	auto name_val = params ? yyjson_obj_get(params, "name") : nullptr;
	std::string name = name_val && yyjson_is_str(name_val) ? yyjson_get_str(name_val) : "";
	auto arguments = params ? yyjson_obj_get(params, "arguments") : nullptr;

	if (name == "echo") {
		SendTextResult(id, GetArgument(arguments, "text"), false);
	} else if (name == "fail") {
		SendTextResult(id, "boom", true);
	} else if (name == "env") {
		auto value = getenv(GetArgument(arguments, "name").c_str());
		SendTextResult(id, value ? value : "", false);
	} else if (name == "pid") {
		SendTextResult(id, std::to_string(getpid()), false);
	} else if (name == "cwd") {
		char buffer[4096];
		SendTextResult(id, getcwd(buffer, sizeof(buffer)) ? buffer : "", false);
	} else if (name == "notifications") {
		SendTextResult(id, std::to_string(state.notifications_received), false);
	} else if (name == "mixed") {
		yyjson_mut_val *root;
		auto doc = NewEnvelope(id, &root);
		auto result = yyjson_mut_obj(doc);
		auto content = yyjson_mut_arr(doc);
		auto first = yyjson_mut_obj(doc);
		yyjson_mut_obj_add_str(doc, first, "type", "text");
		yyjson_mut_obj_add_str(doc, first, "text", "a");
		yyjson_mut_arr_append(content, first);
		auto image = yyjson_mut_obj(doc);
		yyjson_mut_obj_add_str(doc, image, "type", "image");
		yyjson_mut_obj_add_str(doc, image, "data", "iVBORw0KGgo=");
		yyjson_mut_obj_add_str(doc, image, "mimeType", "image/png");
		yyjson_mut_arr_append(content, image);
		auto second = yyjson_mut_obj(doc);
		yyjson_mut_obj_add_str(doc, second, "type", "text");
		yyjson_mut_obj_add_str(doc, second, "text", "b");
		yyjson_mut_arr_append(content, second);
		yyjson_mut_obj_add_val(doc, result, "content", content);
		yyjson_mut_obj_add_val(doc, root, "result", result);
		WriteDocument(doc);
	} else {
		SendError(id, -32602, "Unknown tool: " + name);
	}
}

void HandleLine(MockState &state, const std::string &line) {
	auto doc = yyjson_read(line.c_str(), line.size(), 0);
	if (!doc) {
		SendError(nullptr, -32700, "Parse error");
		return;
	}
	auto root = yyjson_doc_get_root(doc);
	auto method_val = yyjson_obj_get(root, "method");
	auto id = yyjson_obj_get(root, "id");
	std::string method = method_val && yyjson_is_str(method_val) ? yyjson_get_str(method_val) : "";

	if (!id) {
		state.notifications_received++;
		yyjson_doc_free(doc);
		return;
	}

	if (state.mode == "notify-first") {
		SendNotification("notifications/message");
	}

	if (method == "initialize") {
		HandleInitialize(state, id);
	} else if (method == "tools/list") {
		HandleToolsList(state, id);
	} else if (method == "tools/call") {
		HandleToolsCall(state, id, yyjson_obj_get(root, "params"));
	} else if (method == "ping") {
		yyjson_mut_val *response;
		auto out = NewEnvelope(id, &response);
		yyjson_mut_obj_add_val(out, response, "result", yyjson_mut_obj(out));
		WriteDocument(out);
	} else {
		SendError(id, -32601, "Method not found: " + method);
	}
	yyjson_doc_free(doc);
}

} // namespace

int main(int argc, char **argv) {
	MockState state;
	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--name" && i + 1 < argc) {
			state.name = argv[++i];
		} else if (arg == "--mode" && i + 1 < argc) {
			state.mode = argv[++i];
		} else {
			std::cerr << "unknown argument: " << arg << std::endl;
			return 2;
		}
	}

	// Diagnostics go to stderr; the client must not depend on them
	std::cerr << "mock_mcp_server '" << state.name << "' starting in mode " << state.mode << std::endl;
	if (state.mode == "stdout-noise") {
		WriteLine("mock server booting...");
	}

	std::string line;
	while (std::getline(std::cin, line)) {
		if (line.empty()) {
			continue;
		}
		HandleLine(state, line);
	}
	return 0;
}
