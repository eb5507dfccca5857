// src/mcp_hub_extension.cpp
#include "mcp_hub_extension.hpp"
#include "mcp_hub_config.hpp"
#include "mcp_hub_logging.hpp"
#include "mcp_hub_state.hpp"
#include "json_utils.hpp"
#include "client/mcp_server_manager.hpp"
#include "protocol/mcp_exception.hpp"
#include "protocol/mcp_payloads.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/enums/set_scope.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/database.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

// Status struct returned by mcp_hub_start_servers
static LogicalType GetStartStatusType() {
    child_list_t<LogicalType> members;
    members.push_back({"success", LogicalType::BOOLEAN});
    members.push_back({"requested", LogicalType::UBIGINT});
    members.push_back({"started", LogicalType::UBIGINT});
    members.push_back({"servers", LogicalType::LIST(LogicalType::VARCHAR)});
    members.push_back({"failures", LogicalType::LIST(LogicalType::VARCHAR)});
    members.push_back({"message", LogicalType::VARCHAR});
    return LogicalType::STRUCT(members);
}

static Value StringListValue(const vector<string> &items) {
    vector<Value> values;
    for (auto &item : items) {
        values.push_back(Value(item));
    }
    return Value::LIST(LogicalType::VARCHAR, values);
}

static Value CreateStartStatus(bool success, idx_t requested, const vector<string> &servers,
                               const vector<string> &failures, const string &message) {
    child_list_t<Value> values;
    values.push_back({"success", Value::BOOLEAN(success)});
    values.push_back({"requested", Value::UBIGINT(requested)});
    values.push_back({"started", Value::UBIGINT(servers.size())});
    values.push_back({"servers", StringListValue(servers)});
    values.push_back({"failures", StringListValue(failures)});
    values.push_back({"message", Value(message)});
    return Value::STRUCT(values);
}

static Value StartServersImpl(const string *config_json) {
    vector<MCPServerSpec> specs;
    try {
        if (config_json) {
            specs = MCPHubConfig::ParseServerSpecs(*config_json);
        } else {
            specs = MCPHubConfig::LoadServerSpecs(MCPHubConfigManager::GetInstance().GetServerFile());
        }
    } catch (const std::exception &ex) {
        // Configuration problems are reported in the status instead of failing the query
        auto message = ErrorData(ex).RawMessage();
        MCP_HUB_LOG_ERROR("EXTENSION", "Failed to load MCP server configuration: %s", message);
        return CreateStartStatus(false, 0, vector<string>(), vector<string>(), message);
    }

    auto report = MCPHubState::GetInstance().GetManager()->StartServers(specs);

    vector<string> failures;
    for (auto &failure : report.failures) {
        failures.push_back(failure.server_name + ": " + failure.error);
    }
    return CreateStartStatus(report.AllStarted(), report.requested, report.started, failures, report.Summary());
}

// mcp_hub_start_servers() - specs from the mcp_hub_server_file setting
static void MCPHubStartServersFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, StartServersImpl(nullptr));
    }
}

// mcp_hub_start_servers(config_json) - specs from an inline document
static void MCPHubStartServersConfigFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &config_vector = args.data[0];

    for (idx_t i = 0; i < args.size(); i++) {
        auto config_value = config_vector.GetValue(i);
        if (config_value.IsNull()) {
            result.SetValue(i, CreateStartStatus(false, 0, vector<string>(), vector<string>(),
                                                 "MCP server configuration is NULL"));
            continue;
        }
        auto config_json = config_value.ToString();
        result.SetValue(i, StartServersImpl(&config_json));
    }
}

static void MCPHubStopServersFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, Value::UBIGINT(MCPHubState::GetInstance().StopServers()));
    }
}

static void MCPHubServerCountFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto count = MCPHubState::GetInstance().GetManager()->ServerCount();
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, Value::UBIGINT(count));
    }
}

static void MCPHubServerNamesFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto names = StringListValue(MCPHubState::GetInstance().GetManager()->ServerNames());
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, names);
    }
}

// JSON array of {"name", "description", "inputSchema"} over every managed server
static string ToolsToJSON(const vector<MCPTool> &tools) {
    MutableJSONDocument doc;
    auto root = JSONUtils::CreateArray(doc.Get());
    doc.SetRoot(root);

    for (auto &tool : tools) {
        auto entry = JSONUtils::CreateObject(doc.Get());
        JSONUtils::AddString(doc.Get(), entry, "name", tool.name);
        JSONUtils::AddString(doc.Get(), entry, "description", tool.description);
        JSONUtils::AddObject(doc.Get(), entry, "inputSchema", JSONUtils::ParseInto(doc.Get(), tool.input_schema));
        yyjson_mut_arr_append(root, entry);
    }
    return doc.Serialize();
}

static void MCPHubListToolsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto tools_json = ToolsToJSON(MCPHubState::GetInstance().GetManager()->GetAllTools());
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, Value(tools_json));
    }
}

// mcp_hub_call_tool(name[, arguments_json]) - failures raise the typed error
static void MCPHubCallToolFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &name_vector = args.data[0];
    auto manager = MCPHubState::GetInstance().GetManager();

    for (idx_t i = 0; i < args.size(); i++) {
        auto name_value = name_vector.GetValue(i);
        if (name_value.IsNull()) {
            result.SetValue(i, Value(LogicalType::VARCHAR));
            continue;
        }
        string arguments_json = "{}";
        if (args.ColumnCount() > 1 && !args.data[1].GetValue(i).IsNull()) {
            arguments_json = args.data[1].GetValue(i).ToString();
        }

        result.SetValue(i, Value(manager->CallTool(name_value.ToString(), arguments_json)));
    }
}

static LogicalType GetTryCallResultType() {
    child_list_t<LogicalType> members;
    members.push_back({"success", LogicalType::BOOLEAN});
    members.push_back({"error_kind", LogicalType::VARCHAR});
    members.push_back({"result", LogicalType::VARCHAR});
    return LogicalType::STRUCT(members);
}

static Value CreateTryCallResult(bool success, const Value &error_kind, const string &text) {
    child_list_t<Value> values;
    values.push_back({"success", Value::BOOLEAN(success)});
    values.push_back({"error_kind", error_kind});
    values.push_back({"result", Value(text)});
    return Value::STRUCT(values);
}

// mcp_hub_try_call_tool(name[, arguments_json]) - failures are returned as data
static void MCPHubTryCallToolFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &name_vector = args.data[0];
    auto manager = MCPHubState::GetInstance().GetManager();

    for (idx_t i = 0; i < args.size(); i++) {
        auto name_value = name_vector.GetValue(i);
        if (name_value.IsNull()) {
            result.SetValue(i, Value(GetTryCallResultType()));
            continue;
        }
        string arguments_json = "{}";
        if (args.ColumnCount() > 1 && !args.data[1].GetValue(i).IsNull()) {
            arguments_json = args.data[1].GetValue(i).ToString();
        }

        try {
            auto text = manager->CallTool(name_value.ToString(), arguments_json);
            result.SetValue(i, CreateTryCallResult(true, Value(LogicalType::VARCHAR), text));
        } catch (const MCPException &ex) {
            result.SetValue(i, CreateTryCallResult(false, Value(MCPException::KindToString(ex.GetKind())),
                                                   ex.GetRawMessage()));
        } catch (const InvalidInputException &ex) {
            result.SetValue(i, CreateTryCallResult(false, Value("invalid_input"), ErrorData(ex).RawMessage()));
        }
    }
}

// MCP diagnostics function
static void MCPHubDiagnosticsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &logger = MCPHubLogger::GetInstance();
    auto &config = MCPHubConfigManager::GetInstance();
    auto manager = MCPHubState::GetInstance().GetManager();

    MutableJSONDocument doc;
    auto root = JSONUtils::CreateObject(doc.Get());
    doc.SetRoot(root);

    JSONUtils::AddString(doc.Get(), root, "log_level", MCPHubLogger::LogLevelToString(logger.GetLogLevel()));
    JSONUtils::AddString(doc.Get(), root, "extension_version", MCP_HUB_VERSION);
    JSONUtils::AddString(doc.Get(), root, "protocol_version", MCP_PROTOCOL_VERSION);
    JSONUtils::AddString(doc.Get(), root, "server_file", config.GetServerFile());
    JSONUtils::AddInt(doc.Get(), root, "request_timeout", config.GetRequestTimeout());
    JSONUtils::AddBool(doc.Get(), root, "parallel_startup", config.IsParallelStartup());
    JSONUtils::AddInt(doc.Get(), root, "server_count", static_cast<int64_t>(manager->ServerCount()));

    auto servers = JSONUtils::CreateArray(doc.Get());
    for (auto &name : manager->ServerNames()) {
        auto connection = manager->GetConnection(name);
        if (!connection) {
            continue;
        }
        auto info = connection->GetServerInfo();
        auto entry = JSONUtils::CreateObject(doc.Get());
        JSONUtils::AddString(doc.Get(), entry, "name", name);
        JSONUtils::AddString(doc.Get(), entry, "state", MCPConnectionStateToString(connection->GetState()));
        JSONUtils::AddString(doc.Get(), entry, "server_name", info.name);
        JSONUtils::AddString(doc.Get(), entry, "server_version", info.version);
        JSONUtils::AddString(doc.Get(), entry, "protocol_version", connection->GetProtocolVersion());
        JSONUtils::AddInt(doc.Get(), entry, "tool_count", static_cast<int64_t>(connection->GetToolNames().size()));
        yyjson_mut_arr_append(servers, entry);
    }
    JSONUtils::AddObject(doc.Get(), root, "servers", servers);

    auto diagnostics = doc.Serialize();
    for (idx_t i = 0; i < args.size(); i++) {
        result.SetValue(i, Value(diagnostics));
    }
}

// Callback functions for MCP hub configuration settings
static void SetMCPHubServerFile(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubConfigManager::GetInstance().SetServerFile(parameter.ToString());
}

static void SetMCPHubRequestTimeout(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubConfigManager::GetInstance().SetRequestTimeout(parameter.GetValue<int64_t>());
}

static void SetMCPHubParallelStartup(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubConfigManager::GetInstance().SetParallelStartup(parameter.GetValue<bool>());
}

static void SetMCPHubLogLevel(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubLogger::GetInstance().SetLogLevel(MCPHubLogger::ParseLogLevel(parameter.ToString()));
}

static void SetMCPHubLogFile(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubLogger::GetInstance().SetLogFile(parameter.ToString());
}

static void SetMCPHubConsoleLogging(ClientContext &context, SetScope scope, Value &parameter) {
    MCPHubLogger::GetInstance().EnableConsoleLogging(parameter.GetValue<bool>());
}

static void RegisterVolatile(ExtensionLoader &loader, ScalarFunction function) {
    function.SetVolatile();
    loader.RegisterFunction(function);
}

static void LoadInternal(ExtensionLoader &loader) {
    auto &db = loader.GetDatabaseInstance();
    auto &config = DBConfig::GetConfig(db);

    // Register MCP hub configuration options
    config.AddExtensionOption("mcp_hub_server_file",
        "Path to the MCP server configuration file read by mcp_hub_start_servers()",
        LogicalType::VARCHAR, Value("./.mcp.json"), SetMCPHubServerFile);

    config.AddExtensionOption("mcp_hub_request_timeout",
        "Seconds to wait for each MCP server response (0 waits forever)",
        LogicalType::BIGINT, Value::BIGINT(30), SetMCPHubRequestTimeout);

    config.AddExtensionOption("mcp_hub_parallel_startup",
        "Start configured MCP servers concurrently",
        LogicalType::BOOLEAN, Value(true), SetMCPHubParallelStartup);

    // Register MCP hub logging configuration options
    config.AddExtensionOption("mcp_hub_log_level",
        "MCP hub logging level (trace, debug, info, warn, error, off)",
        LogicalType::VARCHAR, Value("warn"), SetMCPHubLogLevel);

    config.AddExtensionOption("mcp_hub_log_file",
        "Path to MCP hub log file (empty for no file logging)",
        LogicalType::VARCHAR, Value(""), SetMCPHubLogFile);

    config.AddExtensionOption("mcp_hub_console_logging",
        "Enable MCP hub logging to console/stderr",
        LogicalType::BOOLEAN, Value(false), SetMCPHubConsoleLogging);

    // Server lifecycle functions
    LogicalType start_status_type = GetStartStatusType();

    RegisterVolatile(loader, ScalarFunction("mcp_hub_start_servers",
        {}, start_status_type, MCPHubStartServersFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_start_servers",
        {LogicalType::VARCHAR}, start_status_type, MCPHubStartServersConfigFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_stop_servers",
        {}, LogicalType::UBIGINT, MCPHubStopServersFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_server_count",
        {}, LogicalType::UBIGINT, MCPHubServerCountFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_server_names",
        {}, LogicalType::LIST(LogicalType::VARCHAR), MCPHubServerNamesFunction));

    // Tool functions
    RegisterVolatile(loader, ScalarFunction("mcp_hub_list_tools",
        {}, LogicalType::JSON(), MCPHubListToolsFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_call_tool",
        {LogicalType::VARCHAR}, LogicalType::VARCHAR, MCPHubCallToolFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_call_tool",
        {LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR, MCPHubCallToolFunction));

    LogicalType try_call_type = GetTryCallResultType();

    RegisterVolatile(loader, ScalarFunction("mcp_hub_try_call_tool",
        {LogicalType::VARCHAR}, try_call_type, MCPHubTryCallToolFunction));

    RegisterVolatile(loader, ScalarFunction("mcp_hub_try_call_tool",
        {LogicalType::VARCHAR, LogicalType::VARCHAR}, try_call_type, MCPHubTryCallToolFunction));

    // Register MCP hub diagnostics function
    RegisterVolatile(loader, ScalarFunction("mcp_hub_diagnostics",
        {}, LogicalType::JSON(), MCPHubDiagnosticsFunction));
}

void McpHubExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(mcp_hub, loader) {
    duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *mcp_hub_version() {
    return duckdb::MCP_HUB_VERSION;
}

}

} // namespace duckdb
