#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"
#include "flow/flow_streams.hpp"

#include <arrow/flight/api.h>
#include <memory>
#include <mutex>

namespace duckflow {

// Everything a sync flow sent back to its caller.
struct SyncFlowResult {
	// Unset if the flow sent no rows.
	std::shared_ptr<arrow::Schema> schema;
	vector<std::shared_ptr<arrow::RecordBatch>> batches;
	vector<flowpb::ProducerMetadata> metadata;

	int64_t NumRows() const;
	// First error reported through metadata, if any.
	const flowpb::Error *FirstError() const;
};

// Client for the flow service of one node.
class FlowNodeClient {
public:
	explicit FlowNodeClient(const string &location);

	// Connect to the node and verify it is reachable with a heartbeat.
	arrow::Status Connect();

	// Deploy an asynchronous flow. A deployment failure is reported in `response`, not as a failed status.
	arrow::Status SetupFlow(const flowpb::SetupFlowRequest &request, flowpb::SimpleResponse &response);
	arrow::Status CancelFlow(const string &flow_id, bool &found);
	arrow::Status Heartbeat(flowpb::HeartbeatResponse &response);

	// Run a synchronous flow and collect its output.
	arrow::Status RunSyncFlow(const flowpb::SetupFlowRequest &request, SyncFlowResult &result);

	// Open an outbound data stream. The stream starts with the first message sent, which must carry a header.
	unique_ptr<OutboundFlowStream> OpenFlowStream();

	const string &Location() const {
		return location;
	}

private:
	arrow::Status DoFlowAction(const string &type, const flowpb::FlowRequest &request, flowpb::FlowResponse &response);

	string location;
	std::unique_ptr<arrow::flight::FlightClient> client;
};

// Dials other nodes through their flow service, keeping one client per address.
class FlightFlowStreamDialer : public FlowStreamDialer {
public:
	unique_ptr<OutboundFlowStream> Dial(const CallContext &ctx, const string &target_addr) override;

private:
	std::mutex mu;
	unordered_map<string, unique_ptr<FlowNodeClient>> clients;
};

} // namespace duckflow
