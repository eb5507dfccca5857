#include "protocol/mcp_message.hpp"
#include "protocol/mcp_exception.hpp"
#include "json_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/limits.hpp"

namespace duckdb {

MCPMessage MCPMessage::CreateRequest(const string &method, const string &params, const Value &id) {
    MCPMessage msg;
    msg.type = MCPMessageType::REQUEST;
    msg.method = method;
    msg.params = params;
    msg.id = id;
    return msg;
}

MCPMessage MCPMessage::CreateNotification(const string &method, const string &params) {
    MCPMessage msg;
    msg.type = MCPMessageType::NOTIFICATION;
    msg.method = method;
    msg.params = params;
    return msg;
}

MCPMessage MCPMessage::CreateResponse(const string &result, const Value &id) {
    MCPMessage msg;
    msg.type = MCPMessageType::RESPONSE;
    msg.result = result;
    msg.has_result = true;
    msg.id = id;
    return msg;
}

MCPMessage MCPMessage::CreateError(int64_t code, const string &message, const Value &id, const string &data) {
    MCPMessage msg;
    msg.type = MCPMessageType::ERROR;
    msg.has_error = true;
    msg.error.code = code;
    msg.error.message = message;
    msg.error.data = data;
    msg.id = id;
    return msg;
}

static yyjson_mut_val *IdToJSON(yyjson_mut_doc *doc, const Value &id) {
    if (id.IsNull()) {
        return yyjson_mut_null(doc);
    }
    if (id.type().id() == LogicalTypeId::VARCHAR) {
        auto &str = StringValue::Get(id);
        return yyjson_mut_strncpy(doc, str.c_str(), str.size());
    }
    return yyjson_mut_sint(doc, id.GetValue<int64_t>());
}

string MCPMessage::ToJSON() const {
    MutableJSONDocument doc;
    auto root = JSONUtils::CreateObject(doc.Get());
    doc.SetRoot(root);

    JSONUtils::AddString(doc.Get(), root, "jsonrpc", jsonrpc);

    if (type == MCPMessageType::REQUEST || type == MCPMessageType::NOTIFICATION) {
        if (type == MCPMessageType::REQUEST) {
            JSONUtils::AddObject(doc.Get(), root, "id", IdToJSON(doc.Get(), id));
        }
        JSONUtils::AddString(doc.Get(), root, "method", method);
        if (!params.empty()) {
            JSONUtils::AddObject(doc.Get(), root, "params", JSONUtils::ParseInto(doc.Get(), params));
        }
    } else {
        JSONUtils::AddObject(doc.Get(), root, "id", IdToJSON(doc.Get(), id));
        if (has_error) {
            auto error_obj = JSONUtils::CreateObject(doc.Get());
            JSONUtils::AddInt(doc.Get(), error_obj, "code", error.code);
            JSONUtils::AddString(doc.Get(), error_obj, "message", error.message);
            if (!error.data.empty()) {
                JSONUtils::AddObject(doc.Get(), error_obj, "data", JSONUtils::ParseInto(doc.Get(), error.data));
            }
            JSONUtils::AddObject(doc.Get(), root, "error", error_obj);
        } else {
            auto result_val = result.empty() ? yyjson_mut_null(doc.Get()) : JSONUtils::ParseInto(doc.Get(), result);
            JSONUtils::AddObject(doc.Get(), root, "result", result_val);
        }
    }

    return doc.Serialize();
}

MCPMessage MCPMessage::FromJSON(const string &json) {
    JSONDocument doc(JSONUtils::TryParse(json));
    if (!doc.IsValid()) {
        throw MCPProtocolException("Failed to parse JSON-RPC message: %s", json);
    }

    auto root = doc.Root();
    if (!yyjson_is_obj(root)) {
        throw MCPProtocolException("JSON-RPC message is not an object: %s", json);
    }

    MCPMessage msg;
    msg.jsonrpc = JSONUtils::GetString(root, "jsonrpc");

    // id: integer, string or null
    auto id_val = yyjson_obj_get(root, "id");
    bool has_id = id_val != nullptr;
    if (id_val) {
        if (yyjson_is_int(id_val)) {
            msg.id = Value::BIGINT(yyjson_get_sint(id_val));
        } else if (yyjson_is_str(id_val)) {
            msg.id = Value(string(yyjson_get_str(id_val), yyjson_get_len(id_val)));
        } else if (!yyjson_is_null(id_val)) {
            throw MCPProtocolException("JSON-RPC id must be a number, string or null: %s", json);
        }
    }

    auto method_val = yyjson_obj_get(root, "method");
    if (method_val) {
        if (!yyjson_is_str(method_val)) {
            throw MCPProtocolException("JSON-RPC method must be a string: %s", json);
        }
        msg.method = string(yyjson_get_str(method_val), yyjson_get_len(method_val));
        msg.type = has_id ? MCPMessageType::REQUEST : MCPMessageType::NOTIFICATION;

        auto params_val = yyjson_obj_get(root, "params");
        if (params_val && !yyjson_is_null(params_val)) {
            msg.params = JSONUtils::Serialize(params_val);
        }
        return msg;
    }

    msg.type = MCPMessageType::RESPONSE;

    auto error_val = yyjson_obj_get(root, "error");
    if (error_val && !yyjson_is_null(error_val)) {
        auto code_val = yyjson_obj_get(error_val, "code");
        auto message_val = yyjson_obj_get(error_val, "message");
        if (!yyjson_is_obj(error_val) || !yyjson_is_int(code_val) || !yyjson_is_str(message_val)) {
            throw MCPProtocolException("Malformed JSON-RPC error object: %s", json);
        }
        if (yyjson_is_uint(code_val) &&
            yyjson_get_uint(code_val) > static_cast<uint64_t>(NumericLimits<int64_t>::Maximum())) {
            throw MCPProtocolException("JSON-RPC error code out of range: %s", json);
        }
        msg.type = MCPMessageType::ERROR;
        msg.has_error = true;
        msg.error.code = yyjson_get_sint(code_val);
        msg.error.message = string(yyjson_get_str(message_val), yyjson_get_len(message_val));
        auto data_val = yyjson_obj_get(error_val, "data");
        if (data_val) {
            msg.error.data = JSONUtils::Serialize(data_val);
        }
    }

    auto result_val = yyjson_obj_get(root, "result");
    if (result_val && !yyjson_is_null(result_val) && !msg.has_error) {
        msg.result = JSONUtils::Serialize(result_val);
        msg.has_result = true;
    }

    return msg;
}

bool MCPMessage::IsValid() const {
    if (jsonrpc != "2.0") {
        return false;
    }

    switch (type) {
        case MCPMessageType::REQUEST:
            return !method.empty() && !id.IsNull();
        case MCPMessageType::NOTIFICATION:
            return !method.empty();
        case MCPMessageType::RESPONSE:
            return !id.IsNull() && (has_error || has_result);
        case MCPMessageType::ERROR:
            return has_error;
        default:
            return false;
    }
}

bool MCPMessage::HasId(int64_t expected) const {
    if (id.IsNull() || id.type().id() != LogicalTypeId::BIGINT) {
        return false;
    }
    return id.GetValue<int64_t>() == expected;
}

} // namespace duckdb
