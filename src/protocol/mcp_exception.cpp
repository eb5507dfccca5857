#include "protocol/mcp_exception.hpp"

namespace duckdb {

MCPException::MCPException(MCPErrorKind kind, ExceptionType type, const string &message)
    : Exception(type, message), kind(kind), raw_message(message) {
}

const char *MCPException::KindToString(MCPErrorKind kind) {
	switch (kind) {
	case MCPErrorKind::TRANSPORT:
		return "transport";
	case MCPErrorKind::TIMEOUT:
		return "timeout";
	case MCPErrorKind::PROTOCOL:
		return "protocol";
	case MCPErrorKind::RPC:
		return "rpc";
	case MCPErrorKind::TOOL_EXECUTION:
		return "tool_execution";
	case MCPErrorKind::ROUTING:
		return "routing";
	default:
		return "unknown";
	}
}

MCPTransportException::MCPTransportException(const string &msg)
    : MCPException(MCPErrorKind::TRANSPORT, ExceptionType::IO, msg) {
}

MCPTimeoutException::MCPTimeoutException(const string &msg)
    : MCPException(MCPErrorKind::TIMEOUT, ExceptionType::IO, msg) {
}

MCPProtocolException::MCPProtocolException(const string &msg)
    : MCPException(MCPErrorKind::PROTOCOL, ExceptionType::SERIALIZATION, msg) {
}

MCPRPCException::MCPRPCException(int64_t code, const string &rpc_message)
    : MCPException(MCPErrorKind::RPC, ExceptionType::IO,
                   "JSON-RPC error " + std::to_string(code) + ": " + rpc_message),
      code(code), rpc_message(rpc_message) {
}

MCPToolExecutionException::MCPToolExecutionException(const string &tool_name, const string &tool_output)
    : MCPException(MCPErrorKind::TOOL_EXECUTION, ExceptionType::EXECUTOR, "Tool call error: " + tool_output),
      tool_name(tool_name), tool_output(tool_output) {
}

MCPRoutingException::MCPRoutingException(const string &msg)
    : MCPException(MCPErrorKind::ROUTING, ExceptionType::INVALID_INPUT, msg) {
}

} // namespace duckdb
