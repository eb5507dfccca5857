#pragma once

#include "duckdb.hpp"

namespace duckdb {

// MCP JSON-RPC 2.0 message types
enum class MCPMessageType {
    REQUEST,
    RESPONSE,
    NOTIFICATION,
    ERROR
};

// MCP message structure
struct MCPMessage {
    MCPMessageType type = MCPMessageType::REQUEST;  // Default to REQUEST
    string jsonrpc = "2.0";  // Always "2.0" for JSON-RPC 2.0

    // Request/Notification fields
    string method;
    string params;  // Compact JSON text, empty when the message has no params
    Value id;       // BIGINT, VARCHAR or NULL

    // Response fields
    string result;  // Compact JSON text of the result member
    bool has_result = false;

    // Error fields
    struct MCPError {
        int64_t code = 0;
        string message;
        string data;  // Compact JSON text, empty when absent
    } error;

    bool has_error = false;

    // Constructors
    MCPMessage() = default;

    // Create request
    static MCPMessage CreateRequest(const string &method, const string &params, const Value &id);

    // Create notification
    static MCPMessage CreateNotification(const string &method, const string &params = string());

    // Create response
    static MCPMessage CreateResponse(const string &result, const Value &id);

    // Create error response
    static MCPMessage CreateError(int64_t code, const string &message, const Value &id, const string &data = string());

    // Serialization: one line of compact JSON, no trailing newline
    string ToJSON() const;
    // Throws MCPProtocolException when the text is not a JSON-RPC object
    static MCPMessage FromJSON(const string &json);

    // Validation
    bool IsValid() const;
    bool IsRequest() const { return type == MCPMessageType::REQUEST; }
    bool IsResponse() const { return type == MCPMessageType::RESPONSE || type == MCPMessageType::ERROR; }
    bool IsNotification() const { return type == MCPMessageType::NOTIFICATION; }
    bool IsError() const { return type == MCPMessageType::ERROR || has_error; }

    //! True when the id is the integer `expected`
    bool HasId(int64_t expected) const;
};

// MCP protocol method names
namespace MCPMethods {
    // Initialization
    constexpr const char* INITIALIZE = "initialize";
    constexpr const char* INITIALIZED = "notifications/initialized";

    // Tools
    constexpr const char* TOOLS_LIST = "tools/list";
    constexpr const char* TOOLS_CALL = "tools/call";

    // Notifications
    constexpr const char* NOTIFICATIONS_CANCELLED = "notifications/cancelled";
    constexpr const char* NOTIFICATIONS_PROGRESS = "notifications/progress";
    constexpr const char* NOTIFICATIONS_MESSAGE = "notifications/message";

    // Ping
    constexpr const char* PING = "ping";
}

// Common JSON-RPC error codes
namespace MCPErrorCodes {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

} // namespace duckdb
