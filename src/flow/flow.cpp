#include "flow/flow.hpp"

#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"
#include "flow/flow_registry.hpp"
#include "utils/tracing.hpp"

namespace duckflow {

namespace {

constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL {50};
constexpr idx_t SHORT_ID_LENGTH = 8;

string StreamTypeName(flowpb::StreamEndpointSpec::Type type) {
	return flowpb::StreamEndpointSpec::Type_Name(type);
}

} // namespace

Flow::Flow(unique_ptr<FlowContext> flow_ctx_p, FlowRegistry &registry_p, RowReceiver *sync_consumer_p,
           std::shared_ptr<TraceSpan> span_p, std::chrono::milliseconds inbound_stream_timeout_p)
    : flow_ctx(std::move(flow_ctx_p)), registry(registry_p), sync_consumer(sync_consumer_p), span(std::move(span_p)),
      inbound_stream_timeout(inbound_stream_timeout_p) {
}

Flow::~Flow() {
	Cleanup(CallContext());
}

string Flow::ShortID() const {
	return ID().substr(0, SHORT_ID_LENGTH);
}

CallContext Flow::AnnotateCtx(const CallContext &ctx) const {
	return ctx.WithLogTag("f", ShortID());
}

FlowState Flow::State() const {
	std::lock_guard<std::mutex> lck(mu);
	return state;
}

void Flow::Setup(const CallContext &ctx, const flowpb::FlowSpec &spec) {
	{
		std::lock_guard<std::mutex> lck(mu);
		if (state != FlowState::CONSTRUCTED) {
			throw InternalException("flow %s set up twice", ID());
		}
	}
	if (spec.processors_size() == 0) {
		throw InvalidInputException("flow %s has no processors", ID());
	}

	// Inputs first, so that outputs can find the local streams they feed.
	vector<RowChannel *> inputs(spec.processors_size(), nullptr);
	for (int idx = 0; idx < spec.processors_size(); ++idx) {
		const auto &proc = spec.processors(idx);
		if (proc.input_size() > 1) {
			throw InvalidInputException("processor %d: only one input synchronizer is supported",
			                            proc.processor_id());
		}
		if (proc.input_size() == 0) {
			continue;
		}
		const auto &sync = proc.input(0);
		if (sync.streams_size() == 0) {
			throw InvalidInputException("processor %d: input synchronizer has no streams", proc.processor_id());
		}
		auto channel = std::make_shared<RowChannel>(sync.streams_size());
		inputs[idx] = channel.get();
		for (const auto &stream : sync.streams()) {
			const StreamID id = stream.stream_id();
			if (local_streams.count(id) > 0 || inbound_streams.count(id) > 0) {
				throw InvalidInputException("duplicate stream %d in flow %s", id, ID());
			}
			switch (stream.type()) {
			case flowpb::StreamEndpointSpec::LOCAL:
				local_streams[id] = channel.get();
				break;
			case flowpb::StreamEndpointSpec::REMOTE:
				inbound_streams[id] = channel;
				break;
			default:
				throw InvalidInputException("processor %d: unsupported input stream type %s", proc.processor_id(),
				                            StreamTypeName(stream.type()));
			}
		}
		channels.emplace_back(std::move(channel));
	}

	unordered_map<StreamID, bool> local_stream_used;
	for (int idx = 0; idx < spec.processors_size(); ++idx) {
		const auto &proc = spec.processors(idx);
		if (proc.output_size() != 1) {
			throw InvalidInputException("processor %d must have exactly one output router", proc.processor_id());
		}
		const auto &router = proc.output(0);
		if (router.streams_size() == 0) {
			throw InvalidInputException("processor %d: output router has no streams", proc.processor_id());
		}
		RowReceiver *output = nullptr;
		switch (router.type()) {
		case flowpb::OutputRouterSpec::PASS_THROUGH:
			if (router.streams_size() != 1) {
				throw InvalidInputException("processor %d: pass-through router takes exactly one stream",
				                            proc.processor_id());
			}
			output = MakeOutputEndpoint(ctx, router.streams(0), local_stream_used);
			break;
		case flowpb::OutputRouterSpec::MIRROR: {
			vector<RowReceiver *> outputs;
			for (const auto &stream : router.streams()) {
				outputs.emplace_back(MakeOutputEndpoint(ctx, stream, local_stream_used));
			}
			routers.emplace_back(make_uniq<MirrorRouter>(std::move(outputs)));
			output = routers.back().get();
			break;
		}
		default:
			throw InvalidInputException("processor %d: unsupported output router", proc.processor_id());
		}
		processors.emplace_back(NewProcessor(*flow_ctx, proc, inputs[idx], output));
	}

	for (const auto &entry : local_streams) {
		if (!local_stream_used[entry.first]) {
			throw InvalidInputException("local stream %d in flow %s has no producer", entry.first, ID());
		}
	}

	std::lock_guard<std::mutex> lck(mu);
	state = FlowState::SET_UP;
}

RowReceiver *Flow::MakeOutputEndpoint(const CallContext &ctx, const flowpb::StreamEndpointSpec &endpoint,
                                      unordered_map<StreamID, bool> &local_stream_used) {
	const StreamID id = endpoint.stream_id();
	switch (endpoint.type()) {
	case flowpb::StreamEndpointSpec::LOCAL: {
		auto iter = local_streams.find(id);
		if (iter == local_streams.end()) {
			throw InvalidInputException("unconnected local stream %d in flow %s", id, ID());
		}
		if (local_stream_used[id]) {
			throw InvalidInputException("local stream %d in flow %s has more than one producer", id, ID());
		}
		local_stream_used[id] = true;
		return iter->second;
	}
	case flowpb::StreamEndpointSpec::REMOTE: {
		if (flow_ctx->dialer == nullptr) {
			throw InvalidInputException("flow %s: outbound stream %d needs a dialer, but the node has none", ID(), id);
		}
		if (endpoint.target_addr().empty()) {
			throw InvalidInputException("flow %s: outbound stream %d has no target address", ID(), id);
		}
		flowpb::FlowStreamHeader header;
		header.set_flow_id(ID());
		header.set_stream_id(id);
		outboxes.emplace_back(
		    make_uniq<Outbox>(*flow_ctx->dialer, endpoint.target_addr(), std::move(header), AnnotateCtx(ctx).Detached()));
		return outboxes.back().get();
	}
	case flowpb::StreamEndpointSpec::SYNC_RESPONSE:
		if (sync_consumer == nullptr) {
			throw InvalidInputException("flow %s: sync response stream %d on a flow that is not synchronous", ID(),
			                            id);
		}
		if (sync_consumer_used) {
			throw InvalidInputException("flow %s: more than one sync response stream", ID());
		}
		sync_consumer_used = true;
		return sync_consumer;
	default:
		throw InvalidInputException("flow %s: unsupported output stream type %s", ID(),
		                            StreamTypeName(endpoint.type()));
	}
}

void Flow::Start(const CallContext &ctx) {
	{
		std::lock_guard<std::mutex> lck(mu);
		if (state != FlowState::SET_UP) {
			throw InternalException("flow %s started before it was set up", ID());
		}
	}
	const auto flow_ctx_with_tag = AnnotateCtx(ctx);
	registry.RegisterFlow(ID(), shared_from_this(), inbound_streams, inbound_stream_timeout);
	registered = true;
	DUCKDB_LOG_DEBUG(flow_ctx->db_instance,
	                 flow_ctx_with_tag.Annotate(StringUtil::Format("starting %llu processors",
	                                                               static_cast<unsigned long long>(processors.size()))));

	// Processors outlive the RPC that started them; they only stop on flow cancellation.
	auto proc_ctx = flow_ctx_with_tag.Detached().WithCancelCheck([this]() { return cancelled.load(); });
	std::lock_guard<std::mutex> lck(mu);
	state = FlowState::STARTED;
	running_processors = processors.size();
	for (auto &processor : processors) {
		threads.emplace_back([this, proc = processor.get(), proc_ctx]() { RunProcessor(*proc, proc_ctx); });
	}
}

void Flow::RunProcessor(Processor &processor, const CallContext &ctx) {
	processor.Run(ctx);
	if (processor.Error().has_value()) {
		RecordError(*processor.Error());
	}
	std::lock_guard<std::mutex> lck(mu);
	--running_processors;
	if (running_processors == 0) {
		done_cv.notify_all();
	}
}

void Flow::Wait() {
	vector<std::thread> to_join;
	{
		std::unique_lock<std::mutex> lck(mu);
		if (state != FlowState::STARTED) {
			return;
		}
		done_cv.wait(lck, [this]() { return running_processors == 0; });
		to_join = std::move(threads);
		threads.clear();
	}
	for (auto &thread : to_join) {
		thread.join();
	}
	for (const auto &outbox : outboxes) {
		if (outbox->Error().has_value()) {
			RecordError(*outbox->Error());
		}
	}
	std::lock_guard<std::mutex> lck(mu);
	state = FlowState::WAITED;
}

void Flow::Wait(const CallContext &ctx) {
	{
		std::unique_lock<std::mutex> lck(mu);
		while (state == FlowState::STARTED && running_processors > 0) {
			if (done_cv.wait_for(lck, CANCEL_POLL_INTERVAL, [this]() { return running_processors == 0; })) {
				break;
			}
			if (ctx.IsCancelled() && !cancelled.load()) {
				lck.unlock();
				Cancel();
				lck.lock();
			}
		}
	}
	Wait();
}

void Flow::Cancel() {
	if (cancelled.exchange(true)) {
		return;
	}
	DUCKDB_LOG_DEBUG(flow_ctx->db_instance, StringUtil::Format("[f=%s] cancelling flow", ShortID()));
	std::lock_guard<std::mutex> lck(mu);
	for (auto &channel : channels) {
		channel->Cancel();
	}
}

void Flow::Cleanup(const CallContext &ctx) {
	FlowState current;
	{
		std::lock_guard<std::mutex> lck(mu);
		current = state;
	}
	if (current == FlowState::CLEANED_UP) {
		return;
	}
	if (current == FlowState::STARTED) {
		Cancel();
		Wait();
	}
	if (registered) {
		registry.UnregisterFlow(ID());
		registered = false;
	}

	// Inbound stream handlers may still hold channels; make their pushes fail fast.
	for (auto &channel : channels) {
		channel->Cancel();
	}
	processors.clear();
	routers.clear();
	outboxes.clear();
	local_streams.clear();

	auto &eval_ctx = flow_ctx->eval_ctx;
	eval_ctx.active_mem_acc.Close();
	if (eval_ctx.mon != nullptr) {
		eval_ctx.mon->Stop();
	}
	if (span != nullptr) {
		span->Finish();
	}
	DUCKDB_LOG_DEBUG(flow_ctx->db_instance, AnnotateCtx(ctx).Annotate("cleaned up"));

	std::lock_guard<std::mutex> lck(mu);
	state = FlowState::CLEANED_UP;
}

void Flow::RecordError(const flowpb::Error &err) {
	std::lock_guard<std::mutex> lck(mu);
	if (!error.has_value()) {
		error = err;
	}
}

std::optional<flowpb::Error> Flow::GetError() const {
	std::lock_guard<std::mutex> lck(mu);
	return error;
}

} // namespace duckflow
