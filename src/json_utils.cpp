//===----------------------------------------------------------------------===//
//                         DuckDB
//
// json_utils.cpp
//
//
//===----------------------------------------------------------------------===//

#include "json_utils.hpp"
#include "duckdb/common/exception.hpp"

#include <cstdlib>

namespace duckdb {

yyjson_mut_doc *JSONUtils::CreateDocument() {
	auto doc = yyjson_mut_doc_new(nullptr);
	if (!doc) {
		throw InternalException("Failed to allocate JSON document");
	}
	return doc;
}

yyjson_mut_val *JSONUtils::CreateObject(yyjson_mut_doc *doc) {
	if (!doc) {
		throw InternalException("JSON document is null");
	}
	return yyjson_mut_obj(doc);
}

yyjson_mut_val *JSONUtils::CreateArray(yyjson_mut_doc *doc) {
	if (!doc) {
		throw InternalException("JSON document is null");
	}
	return yyjson_mut_arr(doc);
}

void JSONUtils::AddString(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, const string &value) {
	if (!doc || !obj || !key) {
		throw InternalException("Invalid parameters for AddString");
	}
	yyjson_mut_val *val = yyjson_mut_strncpy(doc, value.c_str(), value.size());
	yyjson_mut_obj_add(obj, yyjson_mut_strcpy(doc, key), val);
}

void JSONUtils::AddInt(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, int64_t value) {
	if (!doc || !obj || !key) {
		throw InternalException("Invalid parameters for AddInt");
	}
	yyjson_mut_val *val = yyjson_mut_sint(doc, value);
	yyjson_mut_obj_add(obj, yyjson_mut_strcpy(doc, key), val);
}

void JSONUtils::AddBool(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, bool value) {
	if (!doc || !obj || !key) {
		throw InternalException("Invalid parameters for AddBool");
	}
	yyjson_mut_val *val = yyjson_mut_bool(doc, value);
	yyjson_mut_obj_add(obj, yyjson_mut_strcpy(doc, key), val);
}

void JSONUtils::AddObject(yyjson_mut_doc *doc, yyjson_mut_val *parent, const char *key, yyjson_mut_val *child) {
	if (!doc || !parent || !key || !child) {
		throw InternalException("Invalid parameters for AddObject");
	}
	yyjson_mut_obj_add(parent, yyjson_mut_strcpy(doc, key), child);
}

yyjson_mut_val *JSONUtils::ParseInto(yyjson_mut_doc *doc, const string &json) {
	if (!doc) {
		throw InternalException("JSON document is null");
	}
	JSONDocument parsed(Parse(json));
	yyjson_mut_val *copied = yyjson_val_mut_copy(doc, parsed.Root());
	if (!copied) {
		throw InternalException("Failed to copy JSON value");
	}
	return copied;
}

string JSONUtils::Serialize(yyjson_mut_doc *doc) {
	if (!doc) {
		throw InternalException("JSON document is null");
	}

	size_t len;
	char *json = yyjson_mut_write(doc, 0, &len);
	if (!json) {
		throw InternalException("Failed to serialize JSON document");
	}

	string result(json, len);
	free(json);
	return result;
}

string JSONUtils::Serialize(yyjson_val *val) {
	if (!val) {
		throw InternalException("JSON value is null");
	}

	size_t len;
	char *json = yyjson_val_write(val, 0, &len);
	if (!json) {
		throw InternalException("Failed to serialize JSON value");
	}

	string result(json, len);
	free(json);
	return result;
}

yyjson_doc *JSONUtils::TryParse(const string &json) {
	return yyjson_read(json.c_str(), json.length(), 0);
}

yyjson_doc *JSONUtils::Parse(const string &json) {
	yyjson_doc *doc = TryParse(json);
	if (!doc) {
		throw InvalidInputException("Failed to parse JSON: %s", json);
	}
	return doc;
}

void JSONUtils::FreeDocument(yyjson_mut_doc *doc) {
	if (doc) {
		yyjson_mut_doc_free(doc);
	}
}

void JSONUtils::FreeDocument(yyjson_doc *doc) {
	if (doc) {
		yyjson_doc_free(doc);
	}
}

string JSONUtils::GetString(yyjson_val *obj, const char *key, const string &default_value) {
	if (!obj || !key) {
		return default_value;
	}

	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || !yyjson_is_str(val)) {
		return default_value;
	}

	return string(yyjson_get_str(val), yyjson_get_len(val));
}

bool JSONUtils::GetBool(yyjson_val *obj, const char *key, bool default_value) {
	if (!obj || !key) {
		return default_value;
	}

	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || !yyjson_is_bool(val)) {
		return default_value;
	}

	return yyjson_get_bool(val);
}

yyjson_val *JSONUtils::GetObject(yyjson_val *obj, const char *key) {
	if (!obj || !key) {
		return nullptr;
	}

	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || !yyjson_is_obj(val)) {
		return nullptr;
	}

	return val;
}

yyjson_val *JSONUtils::GetArray(yyjson_val *obj, const char *key) {
	if (!obj || !key) {
		return nullptr;
	}

	yyjson_val *val = yyjson_obj_get(obj, key);
	if (!val || !yyjson_is_arr(val)) {
		return nullptr;
	}

	return val;
}

} // namespace duckdb
