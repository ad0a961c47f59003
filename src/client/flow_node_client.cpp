#include "client/flow_node_client.hpp"

#include "utils/error_utils.hpp"

#include <arrow/buffer.h>

namespace duckflow {

namespace {

constexpr const char *SETUP_FLOW_ACTION = "setup_flow";
constexpr const char *CANCEL_FLOW_ACTION = "cancel_flow";
constexpr const char *HEARTBEAT_ACTION = "heartbeat";

std::shared_ptr<arrow::Buffer> SerializeMetadata(const vector<flowpb::ProducerMetadata> &metadata) {
	flowpb::ProducerMetadataList list;
	for (const auto &meta : metadata) {
		*list.add_metadata() = meta;
	}
	return arrow::Buffer::FromString(list.SerializeAsString());
}

// Outbound FlowStream over DoPut. The call starts lazily, with the schema of the first batch.
class FlightOutboundFlowStream : public OutboundFlowStream {
public:
	explicit FlightOutboundFlowStream(arrow::flight::FlightClient &client_p) : client(client_p) {
	}

	void Send(const ProducerMessage &msg) override {
		if (writer == nullptr) {
			if (!msg.header.has_value()) {
				throw InternalException("first message of a flow stream has no header");
			}
			auto descriptor = arrow::flight::FlightDescriptor::Command(msg.header->SerializeAsString());
			auto schema = msg.batch != nullptr ? msg.batch->schema() : arrow::schema({});
			auto put_result = client.DoPut(descriptor, schema);
			ThrowIfNotOk(put_result.status(), "failed to open flow stream");
			writer = std::move(put_result->writer);
			reader = std::move(put_result->reader);
		}
		if (msg.batch != nullptr && !msg.metadata.empty()) {
			ThrowIfNotOk(writer->WriteWithMetadata(*msg.batch, SerializeMetadata(msg.metadata)),
			             "failed to send on flow stream");
		} else if (msg.batch != nullptr) {
			ThrowIfNotOk(writer->WriteRecordBatch(*msg.batch), "failed to send on flow stream");
		} else if (!msg.metadata.empty()) {
			ThrowIfNotOk(writer->WriteMetadata(SerializeMetadata(msg.metadata)), "failed to send on flow stream");
		}
	}

	void CloseSend() override {
		if (writer == nullptr) {
			return;
		}
		ThrowIfNotOk(writer->DoneWriting(), "failed to finish flow stream");
		// Close returns the consumer's verdict on the stream.
		ThrowIfNotOk(writer->Close(), "flow stream failed");
		writer.reset();
	}

private:
	arrow::flight::FlightClient &client;
	std::unique_ptr<arrow::flight::FlightStreamWriter> writer;
	std::unique_ptr<arrow::flight::FlightMetadataReader> reader;
};

} // namespace

int64_t SyncFlowResult::NumRows() const {
	int64_t rows = 0;
	for (const auto &batch : batches) {
		rows += batch->num_rows();
	}
	return rows;
}

const flowpb::Error *SyncFlowResult::FirstError() const {
	for (const auto &meta : metadata) {
		if (meta.has_error()) {
			return &meta.error();
		}
	}
	return nullptr;
}

FlowNodeClient::FlowNodeClient(const string &location) : location(location) {
}

arrow::Status FlowNodeClient::Connect() {
	arrow::flight::Location flight_location;
	ARROW_ASSIGN_OR_RAISE(flight_location, arrow::flight::Location::Parse(location));
	ARROW_ASSIGN_OR_RAISE(client, arrow::flight::FlightClient::Connect(flight_location));

	// FlightClient::Connect() is lazy; a heartbeat forces a round trip.
	flowpb::HeartbeatResponse response;
	auto status = Heartbeat(response);
	if (!status.ok()) {
		return arrow::Status::IOError("Failed to connect to node at " + location + ": " + status.ToString());
	}
	return arrow::Status::OK();
}

arrow::Status FlowNodeClient::DoFlowAction(const string &type, const flowpb::FlowRequest &request,
                                           flowpb::FlowResponse &response) {
	if (client == nullptr) {
		return arrow::Status::Invalid("Client for " + location + " is not connected");
	}
	arrow::flight::Action action {type, arrow::Buffer::FromString(request.SerializeAsString())};
	ARROW_ASSIGN_OR_RAISE(auto result_stream, client->DoAction(action));
	ARROW_ASSIGN_OR_RAISE(auto result, result_stream->Next());
	if (!result) {
		return arrow::Status::Invalid("No response from node at " + location);
	}
	if (!response.ParseFromArray(result->body->data(), result->body->size())) {
		return arrow::Status::Invalid("Failed to parse response");
	}
	return arrow::Status::OK();
}

arrow::Status FlowNodeClient::SetupFlow(const flowpb::SetupFlowRequest &request, flowpb::SimpleResponse &response) {
	flowpb::FlowRequest req;
	*req.mutable_setup_flow() = request;
	flowpb::FlowResponse resp;
	ARROW_RETURN_NOT_OK(DoFlowAction(SETUP_FLOW_ACTION, req, resp));
	if (!resp.has_setup_flow()) {
		return arrow::Status::Invalid("Unexpected response to setup_flow");
	}
	response = resp.setup_flow();
	return arrow::Status::OK();
}

arrow::Status FlowNodeClient::CancelFlow(const string &flow_id, bool &found) {
	flowpb::FlowRequest req;
	req.mutable_cancel_flow()->set_flow_id(flow_id);
	flowpb::FlowResponse resp;
	ARROW_RETURN_NOT_OK(DoFlowAction(CANCEL_FLOW_ACTION, req, resp));
	if (!resp.has_cancel_flow()) {
		return arrow::Status::Invalid("Unexpected response to cancel_flow");
	}
	found = resp.cancel_flow().found();
	return arrow::Status::OK();
}

arrow::Status FlowNodeClient::Heartbeat(flowpb::HeartbeatResponse &response) {
	flowpb::FlowRequest req;
	req.mutable_heartbeat();
	flowpb::FlowResponse resp;
	ARROW_RETURN_NOT_OK(DoFlowAction(HEARTBEAT_ACTION, req, resp));
	if (!resp.has_heartbeat()) {
		return arrow::Status::Invalid("Unexpected response to heartbeat");
	}
	response = resp.heartbeat();
	return arrow::Status::OK();
}

arrow::Status FlowNodeClient::RunSyncFlow(const flowpb::SetupFlowRequest &request, SyncFlowResult &result) {
	if (client == nullptr) {
		return arrow::Status::Invalid("Client for " + location + " is not connected");
	}
	flowpb::ConsumerSignal signal;
	*signal.mutable_setup_flow_request() = request;
	auto descriptor = arrow::flight::FlightDescriptor::Command(signal.SerializeAsString());

	ARROW_ASSIGN_OR_RAISE(auto exchange, client->DoExchange(descriptor));
	// The setup request travels in the descriptor; nothing else is sent.
	ARROW_RETURN_NOT_OK(exchange.writer->DoneWriting());

	while (true) {
		ARROW_ASSIGN_OR_RAISE(auto chunk, exchange.reader->Next());
		if (chunk.data == nullptr && chunk.app_metadata == nullptr) {
			break;
		}
		if (chunk.app_metadata != nullptr) {
			flowpb::ProducerMetadataList list;
			if (!list.ParseFromArray(chunk.app_metadata->data(), chunk.app_metadata->size())) {
				return arrow::Status::Invalid("Failed to parse producer metadata");
			}
			for (auto &meta : *list.mutable_metadata()) {
				result.metadata.emplace_back(std::move(meta));
			}
		}
		if (chunk.data != nullptr) {
			if (result.schema == nullptr) {
				result.schema = chunk.data->schema();
			}
			result.batches.emplace_back(std::move(chunk.data));
		}
	}
	return exchange.writer->Close();
}

unique_ptr<OutboundFlowStream> FlowNodeClient::OpenFlowStream() {
	if (client == nullptr) {
		throw ConnectionException("client for %s is not connected", location);
	}
	return make_uniq<FlightOutboundFlowStream>(*client);
}

unique_ptr<OutboundFlowStream> FlightFlowStreamDialer::Dial(const CallContext &ctx, const string &target_addr) {
	if (ctx.IsCancelled()) {
		throw InterruptException();
	}
	std::lock_guard<std::mutex> lck(mu);
	auto iter = clients.find(target_addr);
	if (iter == clients.end()) {
		auto client = make_uniq<FlowNodeClient>(target_addr);
		auto status = client->Connect();
		if (!status.ok()) {
			throw ConnectionException("failed to dial %s: %s", target_addr, status.ToString());
		}
		iter = clients.emplace(target_addr, std::move(client)).first;
	}
	return iter->second->OpenFlowStream();
}

} // namespace duckflow
