#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Extension version constant - update this when releasing new versions
constexpr const char *MCP_HUB_VERSION = "0.1.0";

class McpHubExtension : public Extension {
public:
    void Load(ExtensionLoader &loader) override;
    std::string Name() override { return "mcp_hub"; }
    std::string Version() const override { return MCP_HUB_VERSION; }
};

} // namespace duckdb
