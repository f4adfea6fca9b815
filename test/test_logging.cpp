// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    agentmesh::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    // This ensures LOG_NET_TRACE, LOG_MESH_TRACE, etc. all work
    if (level == "trace") {
        agentmesh::util::LogManager::SetComponentLevel("network", "trace");
        agentmesh::util::LogManager::SetComponentLevel("mesh", "trace");
        agentmesh::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    agentmesh::util::LogManager::Shutdown();
}
