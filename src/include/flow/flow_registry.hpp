// Process-wide table of running flows, and the rendezvous point where inbound streams from other nodes find
// the flow consuming them.

#pragma once

#include "duckflow_common.hpp"
#include "flow/row_receiver.hpp"
#include "utils/call_context.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace duckflow {

class Flow;

// Result of a successful ConnectInboundStream.
struct InboundStreamConnection {
	std::shared_ptr<Flow> flow;
	std::shared_ptr<RowReceiver> receiver;
	// Must be invoked exactly once, when the stream is done.
	std::function<void()> release;
};

class FlowRegistry {
public:
	explicit FlowRegistry(duckdb::DatabaseInstance &db_instance_p);
	~FlowRegistry();

	FlowRegistry(const FlowRegistry &) = delete;
	FlowRegistry &operator=(const FlowRegistry &) = delete;

	// Publish `flow` and wake streams waiting for it. Inbound streams not connected within `timeout` get a
	// handshake error pushed into their receiver, so the flow does not wait for them forever.
	void RegisterFlow(const string &flow_id, std::shared_ptr<Flow> flow,
	                  const unordered_map<StreamID, std::shared_ptr<RowReceiver>> &inbound_streams,
	                  std::chrono::milliseconds timeout);

	// Remove a flow. Streams connecting to it later wait and time out.
	void UnregisterFlow(const string &flow_id);

	// Find the receiver for stream `stream_id` of flow `flow_id`, waiting up to `timeout` for the flow to be
	// registered. Throws ConnectionException on timeout, for a stream the flow does not declare and for a stream
	// that is already connected or timed out. Throws InterruptException if `ctx` is cancelled while waiting.
	InboundStreamConnection ConnectInboundStream(const CallContext &ctx, const string &flow_id, StreamID stream_id,
	                                             std::chrono::milliseconds timeout);

	// The registered flow with this ID, or null.
	std::shared_ptr<Flow> LookupFlow(const string &flow_id) const;

	idx_t NumRegisteredFlows() const;

private:
	using Clock = std::chrono::steady_clock;

	struct InboundStreamInfo {
		std::shared_ptr<RowReceiver> receiver;
		bool connected = false;
		bool finished = false;
		bool timed_out = false;
	};

	struct FlowEntry {
		std::shared_ptr<Flow> flow;
		std::condition_variable registered_cv;
		idx_t waiters = 0;
		unordered_map<StreamID, InboundStreamInfo> inbound_streams;
		Clock::time_point connect_deadline;
	};

	// Reaper loop failing inbound streams whose connection deadline passed.
	void ReapUnconnectedStreams();
	// Remove `flow_id` if it is an unregistered entry nobody waits on. Caller holds `mu`.
	void MaybeRemoveLocked(const string &flow_id);

	duckdb::DatabaseInstance &db_instance;

	mutable std::mutex mu;
	unordered_map<string, std::shared_ptr<FlowEntry>> flows;
	std::condition_variable reaper_cv;
	bool stopping = false;
	std::thread reaper;
};

} // namespace duckflow
