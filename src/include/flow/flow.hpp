// Runtime object for one node's fragment of a distributed query.

#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"
#include "flow/flow_context.hpp"
#include "flow/outbox.hpp"
#include "flow/processor.hpp"
#include "flow/row_channel.hpp"
#include "utils/call_context.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace duckflow {

class FlowRegistry;
class TraceSpan;

enum class FlowState : uint8_t {
	CONSTRUCTED,
	SET_UP,
	STARTED,
	WAITED,
	CLEANED_UP,
};

// Default wait for inbound streams of a started flow to connect.
inline constexpr std::chrono::milliseconds DEFAULT_FLOW_STREAM_TIMEOUT {10000};

// A flow owns its context (including the memory monitor and account), the wired processors and the tracing
// span. Lifecycle: constructed, Setup, Start, Wait, Cleanup. Cleanup must run once setup began, whatever the
// outcome, and releases everything the flow owns.
class Flow : public std::enable_shared_from_this<Flow> {
public:
	// `sync_consumer` receives the SYNC_RESPONSE output stream; null for flows set up asynchronously.
	Flow(unique_ptr<FlowContext> flow_ctx_p, FlowRegistry &registry_p, RowReceiver *sync_consumer_p,
	     std::shared_ptr<TraceSpan> span_p, std::chrono::milliseconds inbound_stream_timeout_p);
	~Flow();

	Flow(const Flow &) = delete;
	Flow &operator=(const Flow &) = delete;

	// Build processors and streams from `spec`. Throws InvalidInputException on a malformed spec.
	void Setup(const CallContext &ctx, const flowpb::FlowSpec &spec);

	// Register the flow so inbound streams can connect, then run every processor on its own thread.
	void Start(const CallContext &ctx);

	// Block until all processors finished.
	void Wait();
	// Block until all processors finished, cancelling the flow if `ctx` is cancelled meanwhile.
	void Wait(const CallContext &ctx);

	// Stop all processors; they finish with a cancellation error.
	void Cancel();
	bool IsCancelled() const {
		return cancelled.load();
	}

	// Release everything the flow owns and finish its span. Safe to call more than once.
	void Cleanup(const CallContext &ctx);

	// Keep the first error the flow failed with.
	void RecordError(const flowpb::Error &err);
	std::optional<flowpb::Error> GetError() const;

	const string &ID() const {
		return flow_ctx->id;
	}
	// First 8 characters of the flow ID, used in logs.
	string ShortID() const;
	// `ctx` with the flow's log tag.
	CallContext AnnotateCtx(const CallContext &ctx) const;

	FlowContext &Context() {
		return *flow_ctx;
	}
	FlowState State() const;
	const std::shared_ptr<TraceSpan> &Span() const {
		return span;
	}
	// Receivers of the inbound REMOTE streams, by stream ID. Inbound stream handlers share ownership of their
	// receiver, so it stays valid after cleanup.
	const unordered_map<StreamID, std::shared_ptr<RowReceiver>> &InboundStreams() const {
		return inbound_streams;
	}
	idx_t NumProcessors() const {
		return processors.size();
	}

private:
	// Receiver for one output endpoint.
	RowReceiver *MakeOutputEndpoint(const CallContext &ctx, const flowpb::StreamEndpointSpec &endpoint,
	                                unordered_map<StreamID, bool> &local_stream_used);
	void RunProcessor(Processor &processor, const CallContext &ctx);

	unique_ptr<FlowContext> flow_ctx;
	FlowRegistry &registry;
	RowReceiver *sync_consumer;
	std::shared_ptr<TraceSpan> span;
	std::chrono::milliseconds inbound_stream_timeout;

	vector<std::shared_ptr<RowChannel>> channels;
	unordered_map<StreamID, RowChannel *> local_streams;
	unordered_map<StreamID, std::shared_ptr<RowReceiver>> inbound_streams;
	vector<unique_ptr<Outbox>> outboxes;
	vector<unique_ptr<MirrorRouter>> routers;
	vector<unique_ptr<Processor>> processors;
	bool sync_consumer_used = false;
	bool registered = false;

	std::atomic<bool> cancelled {false};
	mutable std::mutex mu;
	std::condition_variable done_cv;
	FlowState state = FlowState::CONSTRUCTED;
	idx_t running_processors = 0;
	vector<std::thread> threads;
	std::optional<flowpb::Error> error;
};

} // namespace duckflow
