#include <gtest/gtest.h>

#include "mcp_hub_extension.hpp"
#include "protocol/mcp_connection.hpp"
#include "protocol/memory_transport.hpp"
#include "test_helpers.hpp"

using namespace duckdb;

namespace {

// Connection over a MemoryTransport the test keeps a handle to
struct ScriptedConnection {
	explicit ScriptedConnection(const MCPConnectionOptions &options = MCPConnectionOptions()) {
		auto owned = make_uniq<MemoryTransport>();
		transport = owned.get();
		connection = make_uniq<MCPConnection>("scripted", std::move(owned), options);
	}

	void InitializeWithDefaults() {
		transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
		transport->QueueIncomingLine(SCRIPTED_TOOLS_RESPONSE);
		connection->Initialize();
		transport->GetAllOutgoingLines();
	}

	MemoryTransport *transport;
	unique_ptr<MCPConnection> connection;
};

string ResultLine(int64_t id, const string &result) {
	return MCPMessage::CreateResponse(result, Value::BIGINT(id)).ToJSON();
}

string TextResult(const string &text, bool is_error = false) {
	string result = R"({"content":[{"type":"text","text":")" + text + R"("}])";
	if (is_error) {
		result += R"(,"isError":true)";
	}
	return result + "}";
}

void ExpectFailedAfterCall(MCPConnection &connection) {
	EXPECT_EQ(connection.GetState(), MCPConnectionState::FAILED);
	EXPECT_THROW(connection.CallTool("repeat", "{}"), InvalidInputException);
}

void ExpectFailedAfterHandshake(MCPConnection &connection) {
	EXPECT_EQ(connection.GetState(), MCPConnectionState::FAILED);
	EXPECT_THROW(connection.Initialize(), InvalidInputException);
}

} // namespace

TEST(MCPConnectionTest, InitializePerformsHandshakeAndToolDiscovery) {
	ScriptedConnection scripted;
	auto &connection = *scripted.connection;
	EXPECT_EQ(connection.GetState(), MCPConnectionState::UNINITIALIZED);
	EXPECT_TRUE(connection.GetTools().empty());

	scripted.transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
	scripted.transport->QueueIncomingLine(SCRIPTED_TOOLS_RESPONSE);
	connection.Initialize();

	EXPECT_EQ(connection.GetState(), MCPConnectionState::READY);
	EXPECT_TRUE(connection.IsReady());
	EXPECT_EQ(connection.GetServerInfo().name, "scripted");
	EXPECT_EQ(connection.GetServerInfo().version, "2.0");
	EXPECT_EQ(connection.GetProtocolVersion(), "2024-11-05");
	EXPECT_EQ(connection.GetCapabilities(), R"({"tools":{}})");

	auto lines = scripted.transport->GetAllOutgoingLines();
	ASSERT_EQ(lines.size(), 3u);

	auto initialize = MCPMessage::FromJSON(lines[0]);
	EXPECT_TRUE(initialize.IsRequest());
	EXPECT_EQ(initialize.method, MCPMethods::INITIALIZE);
	EXPECT_TRUE(initialize.HasId(1));
	EXPECT_NE(initialize.params.find(R"("protocolVersion":"2024-11-05")"), string::npos);
	EXPECT_NE(initialize.params.find(string(R"("version":")") + MCP_HUB_VERSION + "\""), string::npos);

	auto initialized = MCPMessage::FromJSON(lines[1]);
	EXPECT_TRUE(initialized.IsNotification());
	EXPECT_EQ(initialized.method, MCPMethods::INITIALIZED);
	EXPECT_EQ(lines[1].find("\"id\""), string::npos);

	auto list = MCPMessage::FromJSON(lines[2]);
	EXPECT_EQ(list.method, MCPMethods::TOOLS_LIST);
	EXPECT_TRUE(list.HasId(2));

	auto tools = connection.GetTools();
	ASSERT_EQ(tools.size(), 2u);
	EXPECT_EQ(tools[0].name, "scripted::repeat");
	EXPECT_EQ(tools[0].description, "echoes input");
	EXPECT_EQ(tools[1].name, "scripted::bare");
	EXPECT_EQ(tools[1].input_schema, R"({"type":"object"})");

	auto raw_names = connection.GetToolNames();
	ASSERT_EQ(raw_names.size(), 2u);
	EXPECT_EQ(raw_names[0], "repeat");
}

TEST(MCPConnectionTest, InitializedNotificationCanBeDisabled) {
	MCPConnectionOptions options;
	options.send_initialized = false;
	ScriptedConnection scripted(options);
	scripted.transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
	scripted.transport->QueueIncomingLine(SCRIPTED_TOOLS_RESPONSE);
	scripted.connection->Initialize();

	auto lines = scripted.transport->GetAllOutgoingLines();
	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(MCPMessage::FromJSON(lines[1]).method, MCPMethods::TOOLS_LIST);
}

TEST(MCPConnectionTest, ToolCallsReturnJoinedTextAndUseIncreasingIds) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();
	auto &connection = *scripted.connection;

	scripted.transport->QueueIncomingLine(ResultLine(3, TextResult("hi")));
	EXPECT_EQ(connection.CallTool("repeat", R"({"text":"hi"})"), "hi");

	auto call = MCPMessage::FromJSON(scripted.transport->PopOutgoingLine());
	EXPECT_EQ(call.method, MCPMethods::TOOLS_CALL);
	EXPECT_TRUE(call.HasId(3));
	EXPECT_EQ(call.params, R"({"name":"repeat","arguments":{"text":"hi"}})");

	scripted.transport->QueueIncomingLine(
	    ResultLine(4, R"({"content":[{"type":"text","text":"a"},{"type":"image","data":"AA=="},{"type":"text","text":"b"}]})"));
	EXPECT_EQ(connection.CallTool("bare", ""), "a\nb");
	EXPECT_TRUE(MCPMessage::FromJSON(scripted.transport->PopOutgoingLine()).HasId(4));

	scripted.transport->QueueIncomingLine(ResultLine(5, R"({"tools":[{"name":"only"}]})"));
	auto listed = connection.ListTools();
	EXPECT_EQ(listed.size(), 1u);
	EXPECT_EQ(connection.GetTools()[0].name, "scripted::only");
}

TEST(MCPConnectionTest, IsErrorResultsRaiseToolExecutionErrors) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(ResultLine(3, TextResult("boom", true)));
	try {
		scripted.connection->CallTool("repeat", "{}");
		ADD_FAILURE() << "expected a tool execution error";
	} catch (const MCPToolExecutionException &ex) {
		EXPECT_EQ(ex.GetKind(), MCPErrorKind::TOOL_EXECUTION);
		EXPECT_EQ(ex.GetToolOutput(), "boom");
		EXPECT_EQ(ex.GetRawMessage(), "Tool call error: boom");
	}
	// The server answered; the session is still usable
	EXPECT_TRUE(scripted.connection->IsReady());

	scripted.transport->QueueIncomingLine(ResultLine(4, TextResult("boom", true)));
	auto raw = scripted.connection->CallToolRaw("repeat", "{}");
	EXPECT_TRUE(raw.is_error);
	EXPECT_EQ(raw.JoinText(), "boom");
}

TEST(MCPConnectionTest, RpcErrorObjectsSurfaceVerbatim) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(
	    MCPMessage::CreateError(MCPErrorCodes::INVALID_PARAMS, "Unknown tool: nope", Value::BIGINT(3)).ToJSON());
	try {
		scripted.connection->CallTool("nope", "{}");
		ADD_FAILURE() << "expected an rpc error";
	} catch (const MCPRPCException &ex) {
		EXPECT_EQ(ex.GetCode(), -32602);
		EXPECT_EQ(ex.GetRPCMessage(), "Unknown tool: nope");
		EXPECT_EQ(ex.GetRawMessage(), "JSON-RPC error -32602: Unknown tool: nope");
	}
	EXPECT_TRUE(scripted.connection->IsReady());
}

TEST(MCPConnectionTest, RpcErrorCodesWiderThan32BitsKeepTheirValue) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":3,"error":{"code":5000000000,"message":"wide"}})");
	try {
		scripted.connection->CallTool("echo", "{}");
		ADD_FAILURE() << "expected an rpc error";
	} catch (const MCPRPCException &ex) {
		EXPECT_EQ(ex.GetCode(), 5000000000LL);
		EXPECT_EQ(ex.GetRawMessage(), "JSON-RPC error 5000000000: wide");
	}
	EXPECT_TRUE(scripted.connection->IsReady());
}

TEST(MCPConnectionTest, MissingResultFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":3})");
	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	EXPECT_NE(caught.message.find("missing result field"), string::npos);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, MismatchedIdFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(ResultLine(99, TextResult("late")));
	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	EXPECT_NE(caught.message.find("does not match request 3"), string::npos);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, NonJsonOutputFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine("server log line");
	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	EXPECT_NE(caught.message.find("server log line"), string::npos);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, RequestFromTheServerFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":1,"method":"roots/list"})");
	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, ClosedOutputFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::TRANSPORT);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, WriteFailureFailsTheConnection) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->FailWrites(true);
	auto caught = CaptureMCPError([&]() { scripted.connection->CallTool("repeat", "{}"); });
	ASSERT_TRUE(caught.thrown);
	EXPECT_EQ(caught.kind, MCPErrorKind::TRANSPORT);
	ExpectFailedAfterCall(*scripted.connection);
}

TEST(MCPConnectionTest, NotificationsAreSkippedWhileWaitingForAResponse) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();

	scripted.transport->QueueIncomingLine(MCPMessage::CreateNotification(MCPMethods::NOTIFICATIONS_MESSAGE,
	                                                                     R"({"level":"info","data":"working"})")
	                                          .ToJSON());
	scripted.transport->QueueIncomingLine(MCPMessage::CreateNotification(MCPMethods::NOTIFICATIONS_PROGRESS).ToJSON());
	scripted.transport->QueueIncomingLine(ResultLine(3, TextResult("done")));

	EXPECT_EQ(scripted.connection->CallTool("repeat", "{}"), "done");
	EXPECT_TRUE(scripted.connection->IsReady());
}

TEST(MCPConnectionTest, RpcErrorToInitializeFailsTheHandshake) {
	ScriptedConnection scripted;
	scripted.transport->QueueIncomingLine(
	    MCPMessage::CreateError(MCPErrorCodes::INTERNAL_ERROR, "initialize refused", Value::BIGINT(1)).ToJSON());
	EXPECT_THROW(scripted.connection->Initialize(), MCPRPCException);
	ExpectFailedAfterHandshake(*scripted.connection);
}

TEST(MCPConnectionTest, UnusableInitializeResultFailsTheHandshake) {
	ScriptedConnection scripted;
	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"x"}})");
	auto caught = CaptureMCPError([&]() { scripted.connection->Initialize(); });
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	ExpectFailedAfterHandshake(*scripted.connection);
}

TEST(MCPConnectionTest, ToolsListFailureFailsTheHandshake) {
	ScriptedConnection scripted;
	scripted.transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":2,"result":{"tools":"not a list"}})");
	auto caught = CaptureMCPError([&]() { scripted.connection->Initialize(); });
	EXPECT_EQ(caught.kind, MCPErrorKind::PROTOCOL);
	EXPECT_TRUE(scripted.connection->GetTools().empty());
	ExpectFailedAfterHandshake(*scripted.connection);
}

TEST(MCPConnectionTest, ServerExitDuringHandshakeFailsTheConnection) {
	ScriptedConnection scripted;
	auto caught = CaptureMCPError([&]() { scripted.connection->Initialize(); });
	EXPECT_EQ(caught.kind, MCPErrorKind::TRANSPORT);
	ExpectFailedAfterHandshake(*scripted.connection);
}

TEST(MCPConnectionTest, OperationsOutsideReadyAreRejected) {
	ScriptedConnection scripted;
	auto &connection = *scripted.connection;

	EXPECT_THROW(connection.CallTool("repeat", "{}"), InvalidInputException);
	EXPECT_THROW(connection.ListTools(), InvalidInputException);
	// Nothing reached the wire
	EXPECT_FALSE(scripted.transport->HasOutgoingLine());

	scripted.transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
	scripted.transport->QueueIncomingLine(SCRIPTED_TOOLS_RESPONSE);
	connection.Initialize();
	EXPECT_THROW(connection.Initialize(), InvalidInputException);
}

TEST(MCPConnectionTest, ShutdownIsTerminalAndTearsTheTransportDownOnce) {
	ScriptedConnection scripted;
	scripted.InitializeWithDefaults();
	auto &connection = *scripted.connection;

	connection.Shutdown();
	connection.Shutdown();
	EXPECT_EQ(connection.GetState(), MCPConnectionState::SHUT_DOWN);
	EXPECT_EQ(scripted.transport->GetDisconnectCount(), 1u);
	EXPECT_FALSE(scripted.transport->IsConnected());

	EXPECT_THROW(connection.CallTool("repeat", "{}"), InvalidInputException);
	EXPECT_THROW(connection.SendRequest(MCPMethods::PING, ""), InvalidInputException);
	// Cached tools stay readable
	EXPECT_EQ(connection.GetTools().size(), 2u);
}

TEST(MCPConnectionTest, ToolNamesContainingTheSeparatorAreKept) {
	ScriptedConnection scripted;
	scripted.transport->QueueIncomingLine(SCRIPTED_INIT_RESPONSE);
	scripted.transport->QueueIncomingLine(R"({"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"a::b"}]}})");
	scripted.connection->Initialize();

	auto tools = scripted.connection->GetTools();
	ASSERT_EQ(tools.size(), 1u);
	EXPECT_EQ(tools[0].name, "scripted::a::b");
}
