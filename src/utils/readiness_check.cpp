#include "utils/readiness_check.hpp"

#include "client/flow_node_client.hpp"

#include <thread>

namespace duckflow {

namespace {
// Poll interval for waiting for a node.
constexpr int NODE_POLL_INTERVAL_MS = 100;
} // namespace

bool CheckFlowNodeReady(const string &location) {
	FlowNodeClient client(location);
	if (!client.Connect().ok()) {
		return false;
	}
	flowpb::HeartbeatResponse response;
	if (!client.Heartbeat(response).ok()) {
		return false;
	}
	return response.healthy();
}

bool WaitForFlowNodeReady(const string &location, std::chrono::milliseconds timeout) {
	auto start_time = std::chrono::steady_clock::now();
	auto poll_interval = std::chrono::milliseconds(NODE_POLL_INTERVAL_MS);

	while (true) {
		if (CheckFlowNodeReady(location)) {
			return true;
		}

		auto elapsed = std::chrono::steady_clock::now() - start_time;
		if (elapsed >= timeout) {
			return false;
		}

		std::this_thread::sleep_for(poll_interval);
	}
}

} // namespace duckflow
