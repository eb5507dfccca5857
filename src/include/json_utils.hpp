//===----------------------------------------------------------------------===//
//                         DuckDB
//
// json_utils.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include <yyjson.h>
#include <string>

namespace duckdb {

//! JSON utility class for MCP message serialization/deserialization
class JSONUtils {
public:
	//! Create a mutable JSON document
	static yyjson_mut_doc *CreateDocument();

	//! Create a JSON object within a document
	static yyjson_mut_val *CreateObject(yyjson_mut_doc *doc);

	//! Create a JSON array within a document
	static yyjson_mut_val *CreateArray(yyjson_mut_doc *doc);

	//! Add a string value to an object
	static void AddString(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, const string &value);

	//! Add an integer value to an object
	static void AddInt(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, int64_t value);

	//! Add a boolean value to an object
	static void AddBool(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, bool value);

	//! Add an object or array to an object
	static void AddObject(yyjson_mut_doc *doc, yyjson_mut_val *parent, const char *key, yyjson_mut_val *child);

	//! Copy a JSON text into a mutable document; throws InvalidInputException if it does not parse
	static yyjson_mut_val *ParseInto(yyjson_mut_doc *doc, const string &json);

	//! Serialize document to compact (single line) text
	static string Serialize(yyjson_mut_doc *doc);

	//! Serialize an immutable value to compact text
	static string Serialize(yyjson_val *val);

	//! Parse JSON string to document, nullptr if the text is not valid JSON
	static yyjson_doc *TryParse(const string &json);

	//! Parse JSON string to document; throws InvalidInputException on failure
	static yyjson_doc *Parse(const string &json);

	//! Free a mutable document
	static void FreeDocument(yyjson_mut_doc *doc);

	//! Free a read-only document
	static void FreeDocument(yyjson_doc *doc);

	//! Get string value from JSON object (only for string types)
	static string GetString(yyjson_val *obj, const char *key, const string &default_value = "");

	//! Get bool value from JSON object
	static bool GetBool(yyjson_val *obj, const char *key, bool default_value = false);

	//! Get object value from JSON object
	static yyjson_val *GetObject(yyjson_val *obj, const char *key);

	//! Get array value from JSON object
	static yyjson_val *GetArray(yyjson_val *obj, const char *key);
};

//! Owns a parsed yyjson document and frees it on scope exit
class JSONDocument {
public:
	explicit JSONDocument(yyjson_doc *doc = nullptr) : doc(doc) {
	}
	~JSONDocument() {
		JSONUtils::FreeDocument(doc);
	}
	JSONDocument(const JSONDocument &) = delete;
	JSONDocument &operator=(const JSONDocument &) = delete;
	JSONDocument(JSONDocument &&other) noexcept : doc(other.doc) {
		other.doc = nullptr;
	}

	bool IsValid() const {
		return doc != nullptr;
	}
	yyjson_val *Root() const {
		return doc ? yyjson_doc_get_root(doc) : nullptr;
	}

private:
	yyjson_doc *doc;
};

//! Owns a mutable yyjson document used to build outgoing payloads
class MutableJSONDocument {
public:
	MutableJSONDocument() : doc(JSONUtils::CreateDocument()) {
	}
	~MutableJSONDocument() {
		JSONUtils::FreeDocument(doc);
	}
	MutableJSONDocument(const MutableJSONDocument &) = delete;
	MutableJSONDocument &operator=(const MutableJSONDocument &) = delete;

	yyjson_mut_doc *Get() const {
		return doc;
	}
	void SetRoot(yyjson_mut_val *root) {
		yyjson_mut_doc_set_root(doc, root);
	}
	string Serialize() const {
		return JSONUtils::Serialize(doc);
	}

private:
	yyjson_mut_doc *doc;
};

} // namespace duckdb
