#include "protocol/memory_transport.hpp"
#include "protocol/mcp_exception.hpp"

namespace duckdb {

void MemoryTransport::Connect() {
	lock_guard<mutex> lock(queue_mutex);
	connected = true;
}

void MemoryTransport::Disconnect() {
	lock_guard<mutex> lock(queue_mutex);
	if (connected) {
		disconnect_count++;
	}
	connected = false;
}

bool MemoryTransport::IsConnected() const {
	lock_guard<mutex> lock(queue_mutex);
	return connected;
}

void MemoryTransport::WriteLine(const string &line) {
	lock_guard<mutex> lock(queue_mutex);
	if (!connected) {
		throw MCPTransportException("MemoryTransport not connected");
	}
	if (fail_writes) {
		throw MCPTransportException("Failed to write to memory transport: broken pipe");
	}
	outgoing_queue.push(line);
}

string MemoryTransport::ReadLine(MCPDeadline) {
	lock_guard<mutex> lock(queue_mutex);
	if (!connected) {
		throw MCPTransportException("MemoryTransport not connected");
	}
	if (incoming_queue.empty()) {
		throw MCPTransportException("MCP server closed its output: memory transport has no more lines");
	}
	string line = incoming_queue.front();
	incoming_queue.pop();
	return line;
}

string MemoryTransport::GetConnectionInfo() const {
	return "memory transport (testing)";
}

void MemoryTransport::QueueIncomingLine(const string &line) {
	lock_guard<mutex> lock(queue_mutex);
	incoming_queue.push(line);
}

bool MemoryTransport::HasOutgoingLine() const {
	lock_guard<mutex> lock(queue_mutex);
	return !outgoing_queue.empty();
}

string MemoryTransport::PopOutgoingLine() {
	lock_guard<mutex> lock(queue_mutex);
	if (outgoing_queue.empty()) {
		throw InvalidInputException("No outgoing lines in MemoryTransport");
	}
	string line = outgoing_queue.front();
	outgoing_queue.pop();
	return line;
}

vector<string> MemoryTransport::GetAllOutgoingLines() {
	lock_guard<mutex> lock(queue_mutex);
	vector<string> lines;
	while (!outgoing_queue.empty()) {
		lines.push_back(outgoing_queue.front());
		outgoing_queue.pop();
	}
	return lines;
}

void MemoryTransport::FailWrites(bool fail) {
	lock_guard<mutex> lock(queue_mutex);
	fail_writes = fail;
}

idx_t MemoryTransport::GetDisconnectCount() const {
	lock_guard<mutex> lock(queue_mutex);
	return disconnect_count;
}

void MemoryTransport::Clear() {
	lock_guard<mutex> lock(queue_mutex);
	while (!incoming_queue.empty()) {
		incoming_queue.pop();
	}
	while (!outgoing_queue.empty()) {
		outgoing_queue.pop();
	}
}

} // namespace duckdb
