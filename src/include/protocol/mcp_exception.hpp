#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

//! Classifies every failure the MCP client core can report
enum class MCPErrorKind : uint8_t {
	TRANSPORT,      // spawn failure, pipe I/O error, premature EOF
	TIMEOUT,        // a round trip exceeded the configured bound
	PROTOCOL,       // malformed JSON or an unexpected message shape
	RPC,            // a well-formed JSON-RPC error object from the server
	TOOL_EXECUTION, // tools/call result with isError set
	ROUTING         // bad namespaced tool name or unknown server
};

//! Base class for MCP client errors; keeps the undecorated message text
class MCPException : public Exception {
public:
	MCPException(MCPErrorKind kind, ExceptionType type, const string &message);

	MCPErrorKind GetKind() const {
		return kind;
	}
	const string &GetRawMessage() const {
		return raw_message;
	}

	static const char *KindToString(MCPErrorKind kind);

private:
	MCPErrorKind kind;
	string raw_message;
};

class MCPTransportException : public MCPException {
public:
	explicit MCPTransportException(const string &msg);

	template <typename... ARGS>
	explicit MCPTransportException(const string &msg, ARGS... params)
	    : MCPTransportException(ConstructMessage(msg, params...)) {
	}
};

class MCPTimeoutException : public MCPException {
public:
	explicit MCPTimeoutException(const string &msg);

	template <typename... ARGS>
	explicit MCPTimeoutException(const string &msg, ARGS... params)
	    : MCPTimeoutException(ConstructMessage(msg, params...)) {
	}
};

class MCPProtocolException : public MCPException {
public:
	explicit MCPProtocolException(const string &msg);

	template <typename... ARGS>
	explicit MCPProtocolException(const string &msg, ARGS... params)
	    : MCPProtocolException(ConstructMessage(msg, params...)) {
	}
};

//! Error object returned by the server; code and message are passed through verbatim
class MCPRPCException : public MCPException {
public:
	MCPRPCException(int64_t code, const string &rpc_message);

	int64_t GetCode() const {
		return code;
	}
	const string &GetRPCMessage() const {
		return rpc_message;
	}

private:
	int64_t code;
	string rpc_message;
};

//! The tool ran and reported failure (isError: true)
class MCPToolExecutionException : public MCPException {
public:
	MCPToolExecutionException(const string &tool_name, const string &tool_output);

	const string &GetToolName() const {
		return tool_name;
	}
	const string &GetToolOutput() const {
		return tool_output;
	}

private:
	string tool_name;
	string tool_output;
};

class MCPRoutingException : public MCPException {
public:
	explicit MCPRoutingException(const string &msg);

	template <typename... ARGS>
	explicit MCPRoutingException(const string &msg, ARGS... params)
	    : MCPRoutingException(ConstructMessage(msg, params...)) {
	}
};

} // namespace duckdb
