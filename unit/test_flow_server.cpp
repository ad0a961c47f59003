#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <thread>

using namespace duckflow; // NOLINT

namespace {

constexpr StreamID DATA_STREAM = 5;
constexpr StreamID RESPONSE_STREAM = 6;

flowpb::ProcessorSpec ValuesToResponse(const vector<int64_t> &values) {
	return ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", values)}),
	                  PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)));
}

// A sync flow whose only input is an inbound stream from another node.
flowpb::SetupFlowRequest InboundToResponse(const string &flow_id) {
	return MakeSetupRequest(
	    flow_id, {NoopSpec(1, Unordered({Endpoint(flowpb::StreamEndpointSpec::REMOTE, DATA_STREAM)}),
	                       PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
}

flowpb::ConsumerSignal Signal(const flowpb::SetupFlowRequest &req) {
	flowpb::ConsumerSignal signal;
	*signal.mutable_setup_flow_request() = req;
	return signal;
}

} // namespace

TEST_CASE("Setup rejects requests outside the accepted version window", "[flow_server]") {
	TestServer node;
	auto &server = node.Server();

	for (int32_t version : {MIN_ACCEPTED_VERSION - 1, VERSION + 1}) {
		auto req = MakeSetupRequest("versioned", {ValuesToResponse({1})});
		req.set_version(version);

		auto resp = server.SetupFlow(CallContext(), req);
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::PROTOCOL);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("version mismatch in flow request"));

		RecordingReceiver receiver;
		REQUIRE_THROWS_AS(server.SetupSyncFlow(CallContext(), req, receiver), InvalidInputException);
	}
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
	REQUIRE(node.Tracer().NumOpenSpans() == 0);
}

TEST_CASE("Setup validates the node and the flow", "[flow_server]") {
	TestServer node;
	auto &server = node.Server();

	SECTION("node ID not resolved yet") {
		node.NodeID().Set(0);
		auto resp = server.SetupFlow(CallContext(), MakeSetupRequest("early", {ValuesToResponse({1})}));
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("NodeID"));
	}
	SECTION("missing flow ID") {
		auto resp = server.SetupFlow(CallContext(), MakeSetupRequest("", {ValuesToResponse({1})}));
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::PROTOCOL);
	}
	SECTION("unknown time zone") {
		auto req = MakeSetupRequest("bad-tz", {ValuesToResponse({1})});
		req.mutable_eval_context()->set_location("Nowhere/Atlantis");
		auto resp = server.SetupFlow(CallContext(), req);
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("Nowhere/Atlantis"));

		RecordingReceiver receiver;
		REQUIRE_THROWS_AS(server.SetupSyncFlow(CallContext(), req, receiver), IOException);
	}
	SECTION("sync response stream on an asynchronous flow") {
		auto resp = server.SetupFlow(CallContext(), MakeSetupRequest("not-sync", {ValuesToResponse({1})}));
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("not synchronous"));
	}
	SECTION("unconnected local stream") {
		auto req = MakeSetupRequest(
		    "dangling", {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", {1})}),
		                            PassThrough(Endpoint(flowpb::StreamEndpointSpec::LOCAL, DATA_STREAM)))});
		auto resp = server.SetupFlow(CallContext(), req);
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("unconnected local stream"));
	}
	SECTION("outbound stream without a dialer") {
		auto req = MakeSetupRequest(
		    "no-dialer", {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", {1})}),
		                             PassThrough(Endpoint(flowpb::StreamEndpointSpec::REMOTE, DATA_STREAM, "n2")))});
		auto resp = server.SetupFlow(CallContext(), req);
		REQUIRE(resp.has_error());
		REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
		REQUIRE_THAT(resp.error().message(), Catch::Contains("needs a dialer"));
	}
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
	REQUIRE(server.Registry().NumRegisteredFlows() == 0);
	REQUIRE(node.Tracer().NumOpenSpans() == 0);
}

TEST_CASE("Setup failures from hooks are reported as deployment errors", "[flow_server]") {
	TestServer node(1, [](ServerConfig &config) {
		config.testing_knobs.before_flow_setup = [](const flowpb::SetupFlowRequest &req) {
			if (req.flow().flow_id() == "doomed") {
				throw IOException("injected setup failure");
			}
		};
	});
	auto &server = node.Server();

	auto resp = server.SetupFlow(CallContext(), MakeSetupRequest("doomed", {ValuesToResponse({1})}));
	REQUIRE(resp.has_error());
	REQUIRE(resp.error().kind() == flowpb::DEPLOYMENT);
	REQUIRE_THAT(resp.error().message(), Catch::Contains("injected setup failure"));
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
	REQUIRE(node.Tracer().NumOpenSpans() == 0);
}

TEST_CASE("Sync flows run through SetupSyncFlow", "[flow_server]") {
	TestServer node;
	auto &server = node.Server();
	RecordingReceiver receiver;

	auto parent = node.Tracer().StartSpan("client");
	auto result =
	    server.SetupSyncFlow(CallContext().WithSpan(parent), MakeSetupRequest("sync", {ValuesToResponse({4, 5, 6})}),
	                         receiver);
	REQUIRE(result.flow->State() == FlowState::SET_UP);
	REQUIRE(server.Registry().LookupFlow("sync") == nullptr);

	result.flow->Start(result.ctx);
	REQUIRE(server.Registry().LookupFlow("sync") == result.flow);
	result.flow->Wait();
	result.flow->Cleanup(result.ctx);
	parent->Finish();

	REQUIRE(receiver.NumProducerDone() == 1);
	REQUIRE(CollectInt64(receiver.Batches()) == vector<int64_t> {4, 5, 6});
	REQUIRE_FALSE(result.flow->GetError().has_value());
	REQUIRE(server.Registry().LookupFlow("sync") == nullptr);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);

	auto spans = node.Tracer().GetFinishedSpans();
	REQUIRE(spans.size() == 2);
	const auto &flow_span = spans[0].operation == "flow" ? spans[0] : spans[1];
	REQUIRE(flow_span.operation == "flow");
	REQUIRE(flow_span.relation == SpanRelation::FOLLOWS_FROM);
	REQUIRE(flow_span.parent_span_id == parent->SpanID());
}

TEST_CASE("RunSyncFlow serves the consumer stream", "[flow_server]") {
	TestServer node;
	auto &server = node.Server();

	SECTION("rows and completion") {
		FakeSyncFlowServerStream stream(Signal(MakeSetupRequest("run-sync", {ValuesToResponse({7, 8})})));
		server.RunSyncFlow(stream);
		REQUIRE(CollectInt64(stream.Batches()) == vector<int64_t> {7, 8});
		REQUIRE_FALSE(stream.FirstError().has_value());

		auto spans = node.Tracer().GetFinishedSpans();
		REQUIRE(spans.size() == 1);
		REQUIRE(spans[0].relation == SpanRelation::ROOT);
	}
	SECTION("first message without a setup request") {
		FakeSyncFlowServerStream stream {flowpb::ConsumerSignal()};
		REQUIRE_THROWS_WITH(server.RunSyncFlow(stream), Catch::Contains("SetupFlowRequest"));
	}
	SECTION("empty stream") {
		FakeSyncFlowServerStream stream;
		REQUIRE_THROWS_AS(server.RunSyncFlow(stream), InvalidInputException);
	}
	SECTION("setup errors are returned to the caller") {
		auto req = MakeSetupRequest("run-sync-old", {ValuesToResponse({1})});
		req.set_version(VERSION + 1);
		FakeSyncFlowServerStream stream(Signal(req));
		REQUIRE_THROWS_AS(server.RunSyncFlow(stream), InvalidInputException);
	}
	SECTION("send failures end the call") {
		FakeSyncFlowServerStream stream(Signal(MakeSetupRequest("run-sync-broken", {ValuesToResponse({1, 2})})));
		stream.FailSendsAfter(0);
		REQUIRE_THROWS_WITH(server.RunSyncFlow(stream), Catch::Contains("connection reset by peer"));
	}
	SECTION("caller cancellation") {
		std::atomic<bool> cancelled {false};
		FakeSyncFlowServerStream stream(Signal(InboundToResponse("run-sync-cancel")));
		stream.SetContext(CallContext().WithCancelCheck([&cancelled]() { return cancelled.load(); }));
		std::thread canceller([&cancelled, &server]() {
			WaitFor([&server]() { return server.Registry().LookupFlow("run-sync-cancel") != nullptr; });
			cancelled.store(true);
		});
		server.RunSyncFlow(stream);
		canceller.join();

		auto error = stream.FirstError();
		REQUIRE(error.has_value());
		REQUIRE(error->kind() == flowpb::CANCELLED);
	}
	SECTION("node shutdown") {
		FakeSyncFlowServerStream stream(Signal(InboundToResponse("run-sync-quiesce")));
		std::thread stopper([&node, &server]() {
			WaitFor([&server]() { return server.Registry().LookupFlow("run-sync-quiesce") != nullptr; });
			node.GetStopper().Stop();
		});
		server.RunSyncFlow(stream);
		stopper.join();

		auto error = stream.FirstError();
		REQUIRE(error.has_value());
		REQUIRE(error->kind() == flowpb::CANCELLED);
	}
	REQUIRE(server.Registry().NumRegisteredFlows() == 0);
	REQUIRE(server.Monitor().NumOpenChildren() == 0);
	REQUIRE(node.Tracer().NumOpenSpans() == 0);
}

TEST_CASE("Inbound streams that never connect fail the flow", "[flow_server]") {
	TestServer node(1, [](ServerConfig &config) {
		config.testing_knobs.flow_stream_timeout = std::chrono::milliseconds(200);
	});
	FakeSyncFlowServerStream stream(Signal(InboundToResponse("lonely")));
	node.Server().RunSyncFlow(stream);

	auto error = stream.FirstError();
	REQUIRE(error.has_value());
	REQUIRE(error->kind() == flowpb::HANDSHAKE);
}

TEST_CASE("Flows spanning two nodes", "[flow_server]") {
	InProcessDialer dialer;
	TestServer gateway(1);
	TestServer producer(2, [&dialer](ServerConfig &config) { config.dialer = &dialer; });
	dialer.AddServer("n1", gateway.Server());

	SECTION("rows flow from the producer into the gateway's sync flow") {
		auto producer_req = MakeSetupRequest(
		    "dist", {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", {1, 2, 3}), MakeInt64Batch("v", {4})}),
		                        PassThrough(Endpoint(flowpb::StreamEndpointSpec::REMOTE, DATA_STREAM, "n1")))});
		auto resp = producer.Server().SetupFlow(CallContext(), producer_req);
		REQUIRE_FALSE(resp.has_error());

		FakeSyncFlowServerStream stream(Signal(InboundToResponse("dist")));
		gateway.Server().RunSyncFlow(stream);
		REQUIRE_FALSE(stream.FirstError().has_value());
		REQUIRE(CollectInt64(stream.Batches()) == vector<int64_t> {1, 2, 3, 4});
		REQUIRE(WaitFor([&]() { return producer.Server().Scheduler().RunningFlows() == 0; }));
	}
	SECTION("producer errors reach the consumer") {
		auto producer_req = MakeSetupRequest(
		    "dist-error", {SqlQuerySpec(1, "SELECT * FROM no_such_table",
		                                PassThrough(Endpoint(flowpb::StreamEndpointSpec::REMOTE, DATA_STREAM, "n1")))});
		REQUIRE_FALSE(producer.Server().SetupFlow(CallContext(), producer_req).has_error());

		FakeSyncFlowServerStream stream(Signal(InboundToResponse("dist-error")));
		gateway.Server().RunSyncFlow(stream);
		auto error = stream.FirstError();
		REQUIRE(error.has_value());
		REQUIRE(error->kind() == flowpb::EXECUTION);
		REQUIRE_THAT(error->message(), Catch::Contains("no_such_table"));
	}
	SECTION("undeclared inbound streams are refused") {
		MessagePipe pipe;
		ProducerMessage first;
		first.header = flowpb::FlowStreamHeader();
		first.header->set_flow_id("dist-unknown");
		first.header->set_stream_id(DATA_STREAM + 1);
		pipe.Write(std::move(first));
		pipe.CloseWrite();

		std::thread consumer([&gateway]() {
			FakeSyncFlowServerStream stream(Signal(InboundToResponse("dist-unknown")));
			gateway.Server().RunSyncFlow(stream);
		});
		REQUIRE(WaitFor([&]() { return gateway.Server().Registry().LookupFlow("dist-unknown") != nullptr; }));
		REQUIRE_THROWS_AS(gateway.Server().FlowStream(pipe), ConnectionException);
		REQUIRE(gateway.Server().CancelFlow("dist-unknown"));
		consumer.join();
	}
	REQUIRE(gateway.Server().Monitor().NumOpenChildren() == 0);
	REQUIRE(WaitFor([&]() { return producer.Server().Monitor().NumOpenChildren() == 0; }));
}

TEST_CASE("FlowStream requires a header", "[flow_server]") {
	TestServer node;
	SECTION("no messages") {
		MessagePipe pipe;
		pipe.CloseWrite();
		REQUIRE_THROWS_WITH(node.Server().FlowStream(pipe), Catch::Contains("missing header message"));
	}
	SECTION("first message without header") {
		MessagePipe pipe;
		ProducerMessage msg;
		msg.batch = MakeInt64Batch("v", {1});
		pipe.Write(std::move(msg));
		pipe.CloseWrite();
		REQUIRE_THROWS_WITH(node.Server().FlowStream(pipe), Catch::Contains("no header in first message"));
	}
	SECTION("header without a flow ID") {
		MessagePipe pipe;
		ProducerMessage msg;
		msg.header = flowpb::FlowStreamHeader();
		msg.batch = MakeInt64Batch("v", {1});
		pipe.Write(std::move(msg));
		pipe.CloseWrite();
		// Rejected up front rather than waiting out the stream timeout for flow "".
		const auto start = std::chrono::steady_clock::now();
		REQUIRE_THROWS_AS(node.Server().FlowStream(pipe), InvalidInputException);
		REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000));
		REQUIRE(node.Server().Registry().LookupFlow("") == nullptr);
	}
}

TEST_CASE("CancelFlow reports unknown flows", "[flow_server]") {
	TestServer node;
	REQUIRE_FALSE(node.Server().CancelFlow("missing"));
}
