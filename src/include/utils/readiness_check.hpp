#pragma once

#include "duckflow_common.hpp"

#include <chrono>

namespace duckflow {

// Check if a flow node is ready by connecting and sending it a heartbeat.
// Returns true if the node answered and reports itself healthy.
bool CheckFlowNodeReady(const string &location);

// Wait until a flow node is ready, with polling and timeout.
// Returns true if the node becomes ready within the timeout, false otherwise.
bool WaitForFlowNodeReady(const string &location,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

} // namespace duckflow
