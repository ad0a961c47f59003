#pragma once

#include "client/flow_node_client.hpp"
#include "duckdb.hpp"
#include "duckflow_common.hpp"
#include "server/flow_server.hpp"
#include "storage/temp_storage.hpp"
#include "utils/stopper.hpp"
#include "utils/tracing.hpp"

#include <arrow/flight/api.h>
#include <memory>

namespace duckflow {

struct FlowNodeOptions {
	string host = "0.0.0.0";
	// 0 picks a free port.
	int port = 0;
	int32_t node_id = 1;
	string cluster_id;
	// Spilling processors write here when set.
	string temp_dir;
	int64_t memory_budget = UNLIMITED_BUDGET;
	TestingKnobs testing_knobs;
};

// A node serving the flow service over Arrow Flight.
//
// Actions "setup_flow", "cancel_flow" and "heartbeat" carry a FlowRequest and answer with a FlowResponse.
// DoExchange runs a sync flow: the descriptor command holds a ConsumerSignal and the flow's rows come back on
// the exchange. DoPut is an inbound FlowStream: the descriptor command holds the FlowStreamHeader. Producer
// metadata travels as ProducerMetadataList app_metadata on both.
class FlowNode : public arrow::flight::FlightServerBase {
public:
	explicit FlowNode(FlowNodeOptions options_p, duckdb::DuckDB *shared_db = nullptr);
	~FlowNode() override;

	arrow::Status Start();
	// Quiesce running flows, then stop serving. Safe to call more than once.
	void Shutdown();
	string GetLocation() const;
	int GetPort() const {
		return port;
	}

	ServerImpl &Server() {
		return *server;
	}
	duckdb::DuckDB &Database() {
		return *db;
	}
	LocalTracer &Tracer() {
		return tracer;
	}

	arrow::Status DoAction(const arrow::flight::ServerCallContext &context, const arrow::flight::Action &action,
	                       std::unique_ptr<arrow::flight::ResultStream> *result) override;

	arrow::Status DoExchange(const arrow::flight::ServerCallContext &context,
	                         std::unique_ptr<arrow::flight::FlightMessageReader> reader,
	                         std::unique_ptr<arrow::flight::FlightMessageWriter> writer) override;

	arrow::Status DoPut(const arrow::flight::ServerCallContext &context,
	                    std::unique_ptr<arrow::flight::FlightMessageReader> reader,
	                    std::unique_ptr<arrow::flight::FlightMetadataWriter> writer) override;

private:
	FlowNodeOptions options;
	int port;
	bool serving = false;
	duckdb::DuckDB *db;
	unique_ptr<duckdb::DuckDB> owned_db;

	Stopper stopper;
	NodeIDContainer node_id;
	LocalTracer tracer;
	unique_ptr<DiskTempStorage> temp_storage;
	FlightFlowStreamDialer dialer;
	unique_ptr<ServerImpl> server;
};

} // namespace duckflow
