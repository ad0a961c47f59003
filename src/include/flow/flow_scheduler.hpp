#pragma once

#include "duckflow_common.hpp"
#include "utils/call_context.hpp"

#include <deque>
#include <memory>
#include <mutex>

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace duckflow {

class Flow;
class Stopper;

// Default limit on concurrently running asynchronous flows.
inline constexpr idx_t DEFAULT_MAX_RUNNING_FLOWS = 500;

// Admits asynchronously set up flows. At most `max_running_flows` run at a time; the rest wait in FIFO order.
// The scheduler owns the flows it admits: it waits for each to finish and cleans it up.
class FlowScheduler {
public:
	FlowScheduler(duckdb::DatabaseInstance &db_instance_p, Stopper &stopper_p, idx_t max_running_flows_p);

	// Hook into node shutdown: running flows are cancelled and queued flows cleaned up without being started.
	void Start();

	// Start `flow` now or queue it. Throws IOException if the node is shutting down; the flow is then not owned
	// by the scheduler.
	void ScheduleFlow(const CallContext &ctx, std::shared_ptr<Flow> flow);

	// Remove a queued flow and clean it up. Returns false if no such flow is queued.
	bool CancelQueuedFlow(const string &flow_id);

	idx_t RunningFlows() const;
	idx_t QueuedFlows() const;
	void SetMaxRunningFlows(idx_t max_running_flows_p);

private:
	struct QueuedFlow {
		CallContext ctx;
		std::shared_ptr<Flow> flow;
	};

	// Run `flow`, then keep running queued flows on the same thread while there are any.
	void RunFlows(QueuedFlow first);
	void Quiesce();

	duckdb::DatabaseInstance &db_instance;
	Stopper &stopper;

	mutable std::mutex mu;
	idx_t max_running_flows;
	unordered_map<string, std::shared_ptr<Flow>> running;
	std::deque<QueuedFlow> queue;
	bool quiescing = false;
};

} // namespace duckflow
