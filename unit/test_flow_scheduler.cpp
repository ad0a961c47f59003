#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "test_helpers.hpp"

using namespace duckflow; // NOLINT

namespace {

constexpr StreamID INBOUND_STREAM = 1;
constexpr StreamID OUTBOUND_STREAM = 2;

// A flow that forwards rows from an inbound stream; it runs until that stream is fed and closed.
flowpb::SetupFlowRequest BlockingFlow(const string &flow_id) {
	return MakeSetupRequest(
	    flow_id, {NoopSpec(1, Unordered({Endpoint(flowpb::StreamEndpointSpec::REMOTE, INBOUND_STREAM)}),
	                       PassThrough(Endpoint(flowpb::StreamEndpointSpec::REMOTE, OUTBOUND_STREAM, "sink")))});
}

// A flow that sends three rows and finishes.
flowpb::SetupFlowRequest ValuesFlow(const string &flow_id) {
	return MakeSetupRequest(
	    flow_id, {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", {1, 2, 3})}),
	                         PassThrough(Endpoint(flowpb::StreamEndpointSpec::REMOTE, OUTBOUND_STREAM, "sink")))});
}

// Feed one batch into the inbound stream of `flow_id` and close it.
void FeedInboundStream(ServerImpl &server, const string &flow_id, int64_t rows) {
	MessagePipe pipe;
	ProducerMessage first;
	first.header = flowpb::FlowStreamHeader();
	first.header->set_flow_id(flow_id);
	first.header->set_stream_id(INBOUND_STREAM);
	first.batch = MakeInt64Batch("v", vector<int64_t>(rows, 7));
	pipe.Write(std::move(first));
	pipe.CloseWrite();
	server.FlowStream(pipe);
}

} // namespace

TEST_CASE("Flows beyond the running limit are queued", "[flow_scheduler]") {
	RecordingDialer dialer;
	TestServer node(1, [&dialer](ServerConfig &config) {
		config.dialer = &dialer;
		config.max_running_flows = 1;
	});
	auto &server = node.Server();

	auto resp = server.SetupFlow(CallContext(), BlockingFlow("flow-1"));
	REQUIRE_FALSE(resp.has_error());
	REQUIRE(WaitFor([&]() { return server.Registry().LookupFlow("flow-1") != nullptr; }));
	REQUIRE(server.Scheduler().RunningFlows() == 1);

	resp = server.SetupFlow(CallContext(), ValuesFlow("flow-2"));
	REQUIRE_FALSE(resp.has_error());
	REQUIRE(server.Scheduler().QueuedFlows() == 1);
	REQUIRE(dialer.NumRows() == 0);

	FeedInboundStream(server, "flow-1", 5);

	REQUIRE(WaitFor([&]() { return server.Scheduler().RunningFlows() == 0 && server.Scheduler().QueuedFlows() == 0; }));
	REQUIRE(WaitFor([&]() { return dialer.NumClosedStreams() == 2; }));
	REQUIRE(dialer.NumRows() == 8);
	REQUIRE(server.Registry().NumRegisteredFlows() == 0);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
}

TEST_CASE("Raising the running limit through the setting", "[flow_scheduler]") {
	RecordingDialer dialer;
	TestServer node(1, [&dialer](ServerConfig &config) {
		config.dialer = &dialer;
		config.max_running_flows = 1;
	});
	auto &server = node.Server();
	REQUIRE(server.MaxRunningFlows() == 1);

	node.Execute("SET GLOBAL duckflow_max_running_flows = 4");
	REQUIRE(server.MaxRunningFlows() == 4);

	REQUIRE_FALSE(server.SetupFlow(CallContext(), BlockingFlow("flow-1")).has_error());
	REQUIRE_FALSE(server.SetupFlow(CallContext(), BlockingFlow("flow-2")).has_error());
	REQUIRE(server.Scheduler().QueuedFlows() == 0);
	REQUIRE(WaitFor([&]() { return server.Registry().NumRegisteredFlows() == 2; }));

	REQUIRE(server.CancelFlow("flow-1"));
	REQUIRE(server.CancelFlow("flow-2"));
	REQUIRE(WaitFor([&]() { return server.Scheduler().RunningFlows() == 0; }));
}

TEST_CASE("Cancelling running and queued flows", "[flow_scheduler]") {
	RecordingDialer dialer;
	TestServer node(1, [&dialer](ServerConfig &config) {
		config.dialer = &dialer;
		config.max_running_flows = 1;
	});
	auto &server = node.Server();

	REQUIRE_FALSE(server.SetupFlow(CallContext(), BlockingFlow("flow-1")).has_error());
	REQUIRE_FALSE(server.SetupFlow(CallContext(), ValuesFlow("flow-2")).has_error());
	REQUIRE(WaitFor([&]() { return server.Registry().LookupFlow("flow-1") != nullptr; }));

	REQUIRE(server.CancelFlow("flow-2"));
	REQUIRE(server.Scheduler().QueuedFlows() == 0);
	REQUIRE_FALSE(server.CancelFlow("flow-2"));

	REQUIRE(server.CancelFlow("flow-1"));
	REQUIRE(WaitFor([&]() { return server.Scheduler().RunningFlows() == 0; }));
	REQUIRE_FALSE(server.CancelFlow("no-such-flow"));

	// The cancelled flow reported the cancellation downstream; the queued one never ran.
	REQUIRE(WaitFor([&]() { return dialer.NumClosedStreams() == 1; }));
	auto metadata = dialer.Metadata();
	REQUIRE(metadata.size() == 1);
	REQUIRE(metadata[0].error().kind() == flowpb::CANCELLED);
	REQUIRE(dialer.NumRows() == 0);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
}

TEST_CASE("Quiescing drains the scheduler", "[flow_scheduler]") {
	RecordingDialer dialer;
	TestServer node(1, [&dialer](ServerConfig &config) {
		config.dialer = &dialer;
		config.max_running_flows = 1;
	});
	auto &server = node.Server();

	REQUIRE_FALSE(server.SetupFlow(CallContext(), BlockingFlow("flow-1")).has_error());
	REQUIRE_FALSE(server.SetupFlow(CallContext(), ValuesFlow("flow-2")).has_error());
	REQUIRE(WaitFor([&]() { return server.Registry().LookupFlow("flow-1") != nullptr; }));

	node.GetStopper().Stop();
	REQUIRE(server.Scheduler().RunningFlows() == 0);
	REQUIRE(server.Scheduler().QueuedFlows() == 0);
	REQUIRE(server.Registry().NumRegisteredFlows() == 0);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);

	auto resp = server.SetupFlow(CallContext(), ValuesFlow("flow-3"));
	REQUIRE(resp.has_error());
	REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
}
