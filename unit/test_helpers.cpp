#include "test_helpers.hpp"

#include "arrow_utils.hpp"
#include "utils/error_utils.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>

namespace duckflow {

std::shared_ptr<arrow::RecordBatch> MakeInt64Batch(const string &column, const vector<int64_t> &values) {
	arrow::Int64Builder builder;
	ThrowIfNotOk(builder.AppendValues(values), "build int64 column");
	std::shared_ptr<arrow::Array> array;
	ThrowIfNotOk(builder.Finish(&array), "finish int64 column");
	auto schema = arrow::schema({arrow::field(column, arrow::int64())});
	return arrow::RecordBatch::Make(schema, static_cast<int64_t>(values.size()), {array});
}

string MakeIPCStream(const vector<std::shared_ptr<arrow::RecordBatch>> &batches) {
	auto result = SerializeRecordBatches(batches.front()->schema(), batches);
	ThrowIfNotOk(result.status(), "serialize values");
	return *result;
}

vector<int64_t> CollectInt64(const vector<std::shared_ptr<arrow::RecordBatch>> &batches, int column) {
	vector<int64_t> values;
	for (const auto &batch : batches) {
		const auto &array = static_cast<const arrow::Int64Array &>(*batch->column(column));
		for (int64_t row = 0; row < array.length(); ++row) {
			values.emplace_back(array.Value(row));
		}
	}
	return values;
}

flowpb::StreamEndpointSpec Endpoint(flowpb::StreamEndpointSpec::Type type, StreamID stream_id,
                                    const string &target_addr) {
	flowpb::StreamEndpointSpec endpoint;
	endpoint.set_type(type);
	endpoint.set_stream_id(stream_id);
	endpoint.set_target_addr(target_addr);
	return endpoint;
}

flowpb::OutputRouterSpec PassThrough(const flowpb::StreamEndpointSpec &endpoint) {
	flowpb::OutputRouterSpec router;
	router.set_type(flowpb::OutputRouterSpec::PASS_THROUGH);
	*router.add_streams() = endpoint;
	return router;
}

flowpb::InputSyncSpec Unordered(const vector<flowpb::StreamEndpointSpec> &streams) {
	flowpb::InputSyncSpec sync;
	sync.set_type(flowpb::InputSyncSpec::UNORDERED);
	for (const auto &stream : streams) {
		*sync.add_streams() = stream;
	}
	return sync;
}

flowpb::ProcessorSpec ValuesSpec(int32_t processor_id, const string &ipc_stream,
                                 const flowpb::OutputRouterSpec &output) {
	flowpb::ProcessorSpec spec;
	spec.set_processor_id(processor_id);
	spec.mutable_core()->mutable_values()->set_arrow_ipc_stream(ipc_stream);
	*spec.add_output() = output;
	return spec;
}

flowpb::ProcessorSpec SqlQuerySpec(int32_t processor_id, const string &sql, const flowpb::OutputRouterSpec &output) {
	flowpb::ProcessorSpec spec;
	spec.set_processor_id(processor_id);
	spec.mutable_core()->mutable_sql_query()->set_sql(sql);
	*spec.add_output() = output;
	return spec;
}

flowpb::ProcessorSpec NoopSpec(int32_t processor_id, const flowpb::InputSyncSpec &input,
                               const flowpb::OutputRouterSpec &output) {
	flowpb::ProcessorSpec spec;
	spec.set_processor_id(processor_id);
	*spec.add_input() = input;
	spec.mutable_core()->mutable_noop();
	*spec.add_output() = output;
	return spec;
}

flowpb::ProcessorSpec SorterSpec(int32_t processor_id, const string &column, bool descending,
                                 const flowpb::InputSyncSpec &input, const flowpb::OutputRouterSpec &output) {
	flowpb::ProcessorSpec spec;
	spec.set_processor_id(processor_id);
	*spec.add_input() = input;
	auto *sorter = spec.mutable_core()->mutable_sorter();
	sorter->set_column(column);
	sorter->set_descending(descending);
	*spec.add_output() = output;
	return spec;
}

flowpb::SetupFlowRequest MakeSetupRequest(const string &flow_id, const vector<flowpb::ProcessorSpec> &processors) {
	flowpb::SetupFlowRequest req;
	req.set_version(VERSION);
	req.mutable_txn()->set_id("txn-" + flow_id);
	req.mutable_eval_context()->set_location("UTC");
	req.mutable_flow()->set_flow_id(flow_id);
	for (const auto &proc : processors) {
		*req.mutable_flow()->add_processors() = proc;
	}
	return req;
}

RecordingReceiver::RecordingReceiver(int64_t max_rows_p) : max_rows(max_rows_p) {
}

ConsumerStatus RecordingReceiver::Push(std::shared_ptr<arrow::RecordBatch> batch,
                                       const flowpb::ProducerMetadata *meta) {
	std::lock_guard<std::mutex> lck(mu);
	if (meta != nullptr) {
		metadata.emplace_back(*meta);
	}
	if (batch != nullptr) {
		rows += batch->num_rows();
		batches.emplace_back(std::move(batch));
	}
	if (max_rows >= 0 && rows >= max_rows) {
		return ConsumerStatus::CONSUMER_CLOSED;
	}
	return ConsumerStatus::NEED_MORE_ROWS;
}

void RecordingReceiver::ProducerDone() {
	std::lock_guard<std::mutex> lck(mu);
	++producer_done;
	done_cv.notify_all();
}

bool RecordingReceiver::WaitDone(std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lck(mu);
	return done_cv.wait_for(lck, timeout, [this]() { return producer_done > 0; });
}

vector<std::shared_ptr<arrow::RecordBatch>> RecordingReceiver::Batches() {
	std::lock_guard<std::mutex> lck(mu);
	return batches;
}

vector<flowpb::ProducerMetadata> RecordingReceiver::Metadata() {
	std::lock_guard<std::mutex> lck(mu);
	return metadata;
}

int64_t RecordingReceiver::NumRows() {
	std::lock_guard<std::mutex> lck(mu);
	return rows;
}

idx_t RecordingReceiver::NumProducerDone() {
	std::lock_guard<std::mutex> lck(mu);
	return producer_done;
}

std::optional<flowpb::Error> RecordingReceiver::FirstError() {
	std::lock_guard<std::mutex> lck(mu);
	for (const auto &meta : metadata) {
		if (meta.has_error()) {
			return meta.error();
		}
	}
	return std::nullopt;
}

FakeSyncFlowServerStream::FakeSyncFlowServerStream(flowpb::ConsumerSignal signal_p) : signal(std::move(signal_p)) {
}

bool FakeSyncFlowServerStream::Recv(flowpb::ConsumerSignal &signal_out) {
	if (!signal.has_value()) {
		return false;
	}
	signal_out = std::move(*signal);
	signal.reset();
	return true;
}

void FakeSyncFlowServerStream::Send(const ProducerMessage &msg) {
	std::lock_guard<std::mutex> lck(mu);
	if (sent.size() >= fail_after) {
		throw IOException("connection reset by peer");
	}
	sent.emplace_back(msg);
}

vector<std::shared_ptr<arrow::RecordBatch>> FakeSyncFlowServerStream::Batches() const {
	std::lock_guard<std::mutex> lck(mu);
	vector<std::shared_ptr<arrow::RecordBatch>> batches;
	for (const auto &msg : sent) {
		if (msg.batch != nullptr) {
			batches.emplace_back(msg.batch);
		}
	}
	return batches;
}

vector<flowpb::ProducerMetadata> FakeSyncFlowServerStream::Metadata() const {
	std::lock_guard<std::mutex> lck(mu);
	vector<flowpb::ProducerMetadata> metadata;
	for (const auto &msg : sent) {
		metadata.insert(metadata.end(), msg.metadata.begin(), msg.metadata.end());
	}
	return metadata;
}

std::optional<flowpb::Error> FakeSyncFlowServerStream::FirstError() const {
	for (const auto &meta : Metadata()) {
		if (meta.has_error()) {
			return meta.error();
		}
	}
	return std::nullopt;
}

void MessagePipe::Write(ProducerMessage msg) {
	std::lock_guard<std::mutex> lck(mu);
	queue.emplace_back(std::move(msg));
	cv.notify_all();
}

void MessagePipe::CloseWrite() {
	std::lock_guard<std::mutex> lck(mu);
	closed = true;
	cv.notify_all();
}

bool MessagePipe::Recv(ProducerMessage &msg) {
	std::unique_lock<std::mutex> lck(mu);
	cv.wait(lck, [this]() { return !queue.empty() || closed; });
	if (queue.empty()) {
		return false;
	}
	msg = std::move(queue.front());
	queue.pop_front();
	return true;
}

namespace {

class InProcessOutboundStream : public OutboundFlowStream {
public:
	explicit InProcessOutboundStream(ServerImpl &server) {
		serving = std::thread([this, &server]() {
			try {
				server.FlowStream(pipe);
			} catch (std::exception &ex) {
				std::lock_guard<std::mutex> lck(mu);
				error = FlowErrorFromException(ex);
			}
		});
	}

	~InProcessOutboundStream() override {
		pipe.CloseWrite();
		if (serving.joinable()) {
			serving.join();
		}
	}

	void Send(const ProducerMessage &msg) override {
		pipe.Write(msg);
	}

	void CloseSend() override {
		pipe.CloseWrite();
		if (serving.joinable()) {
			serving.join();
		}
		std::lock_guard<std::mutex> lck(mu);
		if (error.has_value()) {
			ThrowFlowError(*error);
		}
	}

private:
	MessagePipe pipe;
	std::mutex mu;
	std::optional<flowpb::Error> error;
	std::thread serving;
};

} // namespace

void InProcessDialer::AddServer(const string &addr, ServerImpl &server) {
	std::lock_guard<std::mutex> lck(mu);
	servers[addr] = &server;
}

unique_ptr<OutboundFlowStream> InProcessDialer::Dial(const CallContext &ctx, const string &target_addr) {
	std::lock_guard<std::mutex> lck(mu);
	auto iter = servers.find(target_addr);
	if (iter == servers.end()) {
		throw ConnectionException("no server at %s", target_addr);
	}
	return make_uniq<InProcessOutboundStream>(*iter->second);
}

class RecordingOutboundStream : public OutboundFlowStream {
public:
	explicit RecordingOutboundStream(RecordingDialer &dialer_p) : dialer(dialer_p) {
	}

	void Send(const ProducerMessage &msg) override {
		std::lock_guard<std::mutex> lck(dialer.mu);
		if (msg.batch != nullptr) {
			dialer.rows += msg.batch->num_rows();
		}
		dialer.metadata.insert(dialer.metadata.end(), msg.metadata.begin(), msg.metadata.end());
	}

	void CloseSend() override {
		std::lock_guard<std::mutex> lck(dialer.mu);
		++dialer.closed_streams;
	}

private:
	RecordingDialer &dialer;
};

unique_ptr<OutboundFlowStream> RecordingDialer::Dial(const CallContext &ctx, const string &target_addr) {
	return make_uniq<RecordingOutboundStream>(*this);
}

int64_t RecordingDialer::NumRows() {
	std::lock_guard<std::mutex> lck(mu);
	return rows;
}

idx_t RecordingDialer::NumClosedStreams() {
	std::lock_guard<std::mutex> lck(mu);
	return closed_streams;
}

vector<flowpb::ProducerMetadata> RecordingDialer::Metadata() {
	std::lock_guard<std::mutex> lck(mu);
	return metadata;
}

TestServer::TestServer(int32_t node_id_p, const std::function<void(ServerConfig &)> &configure,
                       bool with_temp_storage)
    : db(nullptr), stopper(db.instance.get()) {
	node_id.Set(node_id_p);
	if (with_temp_storage) {
		temp_storage = make_uniq<DiskTempStorage>("/tmp");
	}
	ServerConfig config;
	config.db = &db;
	config.node_id = &node_id;
	config.stopper = &stopper;
	config.tracer = &tracer;
	config.temp_storage = temp_storage.get();
	if (configure) {
		configure(config);
	}
	server = make_uniq<ServerImpl>(std::move(config));
	server->Start();
}

TestServer::~TestServer() {
	stopper.Stop();
	server.reset();
}

void TestServer::Execute(const string &sql) {
	duckdb::Connection conn(db);
	auto result = conn.Query(sql);
	if (result->HasError()) {
		result->ThrowError();
	}
}

bool WaitFor(const std::function<bool()> &cond, std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!cond()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

} // namespace duckflow
