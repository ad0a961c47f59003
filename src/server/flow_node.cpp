#include "server/flow_node.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/logging/logger.hpp"
#include "utils/error_utils.hpp"

#include <arrow/buffer.h>

namespace duckflow {

namespace {

std::shared_ptr<arrow::Buffer> SerializeMetadata(const vector<flowpb::ProducerMetadata> &metadata) {
	flowpb::ProducerMetadataList list;
	for (const auto &meta : metadata) {
		*list.add_metadata() = meta;
	}
	return arrow::Buffer::FromString(list.SerializeAsString());
}

void ParseMetadata(const std::shared_ptr<arrow::Buffer> &buffer, vector<flowpb::ProducerMetadata> &metadata) {
	flowpb::ProducerMetadataList list;
	if (!list.ParseFromArray(buffer->data(), buffer->size())) {
		throw InvalidInputException("failed to parse producer metadata");
	}
	for (auto &meta : *list.mutable_metadata()) {
		metadata.emplace_back(std::move(meta));
	}
}

CallContext ContextFromFlight(const arrow::flight::ServerCallContext &context) {
	return CallContext().WithCancelCheck([&context]() { return context.is_cancelled(); });
}

// RunSyncFlow over DoExchange.
class FlightSyncFlowServerStream : public SyncFlowServerStream {
public:
	FlightSyncFlowServerStream(const arrow::flight::ServerCallContext &context,
	                           arrow::flight::FlightMessageReader &reader_p,
	                           arrow::flight::FlightMessageWriter &writer_p)
	    : ctx(ContextFromFlight(context)), reader(reader_p), writer(writer_p) {
	}

	bool Recv(flowpb::ConsumerSignal &signal) override {
		if (received_setup) {
			return false;
		}
		received_setup = true;
		const auto &cmd = reader.descriptor().cmd;
		return signal.ParseFromArray(cmd.data(), static_cast<int>(cmd.size()));
	}

	void Send(const ProducerMessage &msg) override {
		if (msg.batch != nullptr) {
			if (!started) {
				ThrowIfNotOk(writer.Begin(msg.batch->schema()), "failed to start sync flow response");
				started = true;
			}
			if (msg.metadata.empty()) {
				ThrowIfNotOk(writer.WriteRecordBatch(*msg.batch), "failed to send sync flow response");
			} else {
				ThrowIfNotOk(writer.WriteWithMetadata(*msg.batch, SerializeMetadata(msg.metadata)),
				             "failed to send sync flow response");
			}
		} else if (!msg.metadata.empty()) {
			ThrowIfNotOk(writer.WriteMetadata(SerializeMetadata(msg.metadata)), "failed to send sync flow response");
		}
	}

	const CallContext &Context() const override {
		return ctx;
	}

private:
	CallContext ctx;
	arrow::flight::FlightMessageReader &reader;
	arrow::flight::FlightMessageWriter &writer;
	bool received_setup = false;
	bool started = false;
};

// Inbound FlowStream over DoPut. The header comes from the descriptor and is attached to the first message.
class FlightFlowStreamServerStream : public FlowStreamServerStream {
public:
	FlightFlowStreamServerStream(const arrow::flight::ServerCallContext &context,
	                             arrow::flight::FlightMessageReader &reader_p)
	    : ctx(ContextFromFlight(context)), reader(reader_p) {
	}

	bool Recv(ProducerMessage &msg) override {
		if (finished) {
			return false;
		}
		msg = ProducerMessage();
		if (!sent_header) {
			sent_header = true;
			const auto &cmd = reader.descriptor().cmd;
			flowpb::FlowStreamHeader header;
			if (!header.ParseFromArray(cmd.data(), static_cast<int>(cmd.size()))) {
				throw InvalidInputException("failed to parse flow stream header");
			}
			msg.header = std::move(header);
		}
		auto chunk_result = reader.Next();
		ThrowIfNotOk(chunk_result.status(), "failed to receive on flow stream");
		auto chunk = std::move(chunk_result).ValueOrDie();
		if (chunk.data == nullptr && chunk.app_metadata == nullptr) {
			finished = true;
			// A header-only stream still delivers its header.
			return msg.header.has_value();
		}
		msg.batch = std::move(chunk.data);
		if (chunk.app_metadata != nullptr) {
			ParseMetadata(chunk.app_metadata, msg.metadata);
		}
		return true;
	}

	const CallContext &Context() const override {
		return ctx;
	}

private:
	CallContext ctx;
	arrow::flight::FlightMessageReader &reader;
	bool sent_header = false;
	bool finished = false;
};

} // namespace

FlowNode::FlowNode(FlowNodeOptions options_p, duckdb::DuckDB *shared_db)
    : options(std::move(options_p)), port(options.port) {
	if (shared_db != nullptr) {
		db = shared_db;
	} else {
		owned_db = make_uniq<duckdb::DuckDB>(/*path=*/nullptr, /*config=*/nullptr);
		db = owned_db.get();
	}
	auto &db_instance = *db->instance;
	node_id.Set(options.node_id);
	if (!options.temp_dir.empty()) {
		temp_storage = make_uniq<DiskTempStorage>(options.temp_dir);
	}

	ServerConfig config;
	config.db = db;
	config.node_id = &node_id;
	config.cluster_id = options.cluster_id;
	config.memory_budget = options.memory_budget;
	config.temp_storage = temp_storage.get();
	config.tracer = &tracer;
	config.stopper = &stopper;
	config.dialer = &dialer;
	config.testing_knobs = options.testing_knobs;
	server = make_uniq<ServerImpl>(std::move(config));
	DUCKDB_LOG_DEBUG(db_instance, StringUtil::Format("Flow node %d created", options.node_id));
}

FlowNode::~FlowNode() {
	Shutdown();
}

arrow::Status FlowNode::Start() {
	arrow::flight::Location location;
	ARROW_ASSIGN_OR_RAISE(location, arrow::flight::Location::ForGrpcTcp(options.host, port));

	try {
		server->Start();
	} catch (std::exception &ex) {
		return StatusFromException(ex);
	}

	arrow::flight::FlightServerOptions flight_options(location);
	ARROW_RETURN_NOT_OK(Init(flight_options));
	port = FlightServerBase::port();
	serving = true;

	auto &db_instance = *db->instance;
	DUCKDB_LOG_INFO(db_instance,
	                StringUtil::Format("Flow node %d started on %s:%d", options.node_id, options.host, port));
	return arrow::Status::OK();
}

void FlowNode::Shutdown() {
	// Running flows finish before the transport goes away; RunSyncFlow calls block until then.
	stopper.Stop();
	if (serving) {
		serving = false;
		[[maybe_unused]] auto status = FlightServerBase::Shutdown();
	}
}

string FlowNode::GetLocation() const {
	const string host = options.host == "0.0.0.0" ? "localhost" : options.host;
	return StringUtil::Format("grpc://%s:%d", host, port);
}

arrow::Status FlowNode::DoAction(const arrow::flight::ServerCallContext &context, const arrow::flight::Action &action,
                                 std::unique_ptr<arrow::flight::ResultStream> *result) {
	flowpb::FlowRequest request;
	if (!request.ParseFromArray(action.body->data(), action.body->size())) {
		return arrow::Status::Invalid("Failed to parse FlowRequest");
	}

	flowpb::FlowResponse response;
	try {
		switch (request.request_case()) {
		case flowpb::FlowRequest::kSetupFlow:
			*response.mutable_setup_flow() = server->SetupFlow(ContextFromFlight(context), request.setup_flow());
			break;
		case flowpb::FlowRequest::kCancelFlow:
			response.mutable_cancel_flow()->set_found(server->CancelFlow(request.cancel_flow().flow_id()));
			break;
		case flowpb::FlowRequest::kHeartbeat: {
			auto *hb_resp = response.mutable_heartbeat();
			hb_resp->set_healthy(!stopper.IsQuiescing() && server->NodeID() != 0);
			hb_resp->set_node_id(server->NodeID());
			break;
		}
		default:
			return arrow::Status::Invalid(StringUtil::Format("Unknown request type for %s: %d", action.type,
			                                                 static_cast<int>(request.request_case())));
		}
	} catch (std::exception &ex) {
		return StatusFromException(ex);
	}

	std::vector<arrow::flight::Result> results;
	results.emplace_back(arrow::flight::Result {arrow::Buffer::FromString(response.SerializeAsString())});
	*result = std::make_unique<arrow::flight::SimpleResultStream>(std::move(results));
	return arrow::Status::OK();
}

arrow::Status FlowNode::DoExchange(const arrow::flight::ServerCallContext &context,
                                   std::unique_ptr<arrow::flight::FlightMessageReader> reader,
                                   std::unique_ptr<arrow::flight::FlightMessageWriter> writer) {
	FlightSyncFlowServerStream stream(context, *reader, *writer);
	try {
		server->RunSyncFlow(stream);
	} catch (std::exception &ex) {
		auto &db_instance = *db->instance;
		DUCKDB_LOG_DEBUG(db_instance, StringUtil::Format("RunSyncFlow failed: %s", duckdb::ErrorData(ex).Message()));
		return StatusFromException(ex);
	}
	return arrow::Status::OK();
}

arrow::Status FlowNode::DoPut(const arrow::flight::ServerCallContext &context,
                              std::unique_ptr<arrow::flight::FlightMessageReader> reader,
                              std::unique_ptr<arrow::flight::FlightMetadataWriter> writer) {
	FlightFlowStreamServerStream stream(context, *reader);
	try {
		server->FlowStream(stream);
	} catch (std::exception &ex) {
		return StatusFromException(ex);
	}
	return arrow::Status::OK();
}

} // namespace duckflow
