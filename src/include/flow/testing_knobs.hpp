#pragma once

#include "flow.pb.h"

#include <chrono>
#include <functional>

namespace duckflow {

// Hooks for tests.
struct TestingKnobs {
	// Called with the request before the flow is wired; an exception fails the setup.
	std::function<void(const flowpb::SetupFlowRequest &)> before_flow_setup;
	// Overrides the wait for inbound stream connections when non-zero.
	std::chrono::milliseconds flow_stream_timeout {0};
};

} // namespace duckflow
