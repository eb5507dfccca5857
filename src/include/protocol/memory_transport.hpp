#pragma once

#include "protocol/mcp_transport.hpp"
#include <queue>
#include <mutex>

namespace duckdb {

//! In-memory transport for testing the MCP client without processes.
//! Lines the client will read are queued up front; lines it writes are captured.
class MemoryTransport : public MCPTransport {
public:
    MemoryTransport() : connected(false), disconnect_count(0) {}
    ~MemoryTransport() override = default;

    // MCPTransport interface
    void Connect() override;
    void Disconnect() override;
    bool IsConnected() const override;
    void WriteLine(const string &line) override;
    using MCPTransport::ReadLine;
    //! Never blocks; the deadline is ignored
    string ReadLine(MCPDeadline deadline) override;
    string GetConnectionInfo() const override;

    // Testing interface - inject lines for the client to read
    void QueueIncomingLine(const string &line);

    // Testing interface - lines written by the client
    bool HasOutgoingLine() const;
    string PopOutgoingLine();
    vector<string> GetAllOutgoingLines();

    //! Make every subsequent WriteLine fail as if the peer had exited
    void FailWrites(bool fail);

    idx_t GetDisconnectCount() const;

    // Testing interface - clear all queues
    void Clear();

private:
    bool connected;
    bool fail_writes = false;
    idx_t disconnect_count;
    mutable mutex queue_mutex;
    std::queue<string> incoming_queue;  // Lines for the client to read
    std::queue<string> outgoing_queue;  // Lines written by the client
};

} // namespace duckdb
