#include "flow/flow_scheduler.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"
#include "flow/flow.hpp"
#include "utils/error_utils.hpp"
#include "utils/stopper.hpp"

namespace duckflow {

FlowScheduler::FlowScheduler(duckdb::DatabaseInstance &db_instance_p, Stopper &stopper_p, idx_t max_running_flows_p)
    : db_instance(db_instance_p), stopper(stopper_p), max_running_flows(max_running_flows_p) {
}

void FlowScheduler::Start() {
	stopper.OnQuiesce([this]() { Quiesce(); });
}

void FlowScheduler::ScheduleFlow(const CallContext &ctx, std::shared_ptr<Flow> flow) {
	std::unique_lock<std::mutex> lck(mu);
	if (quiescing) {
		throw IOException("node unavailable; try another peer: cannot schedule flow %s while quiescing", flow->ID());
	}
	if (running.size() >= max_running_flows) {
		DUCKDB_LOG_DEBUG(db_instance, flow->AnnotateCtx(ctx).Annotate(StringUtil::Format(
		                                  "flow scheduler enqueuing flow; %llu already running",
		                                  static_cast<unsigned long long>(running.size()))));
		queue.emplace_back(QueuedFlow {ctx, std::move(flow)});
		return;
	}

	const auto flow_id = flow->ID();
	running.emplace(flow_id, flow);
	try {
		stopper.RunAsyncTask(StringUtil::Format("flow %s", flow_id),
		                     [this, first = QueuedFlow {ctx, flow}]() { RunFlows(first); });
	} catch (std::exception &) {
		running.erase(flow_id);
		throw;
	}
}

void FlowScheduler::RunFlows(QueuedFlow first) {
	QueuedFlow current = std::move(first);
	while (true) {
		auto &flow = *current.flow;
		try {
			flow.Start(current.ctx);
			flow.Wait();
		} catch (std::exception &ex) {
			flow.RecordError(FlowErrorFromException(ex));
			DUCKDB_LOG_ERROR(db_instance, flow.AnnotateCtx(current.ctx).Annotate(StringUtil::Format(
			                                  "error running flow: %s", duckdb::ErrorData(ex).Message())));
		}
		flow.Cleanup(current.ctx);

		std::lock_guard<std::mutex> lck(mu);
		running.erase(flow.ID());
		if (quiescing || queue.empty() || running.size() >= max_running_flows) {
			return;
		}
		current = std::move(queue.front());
		queue.pop_front();
		running.emplace(current.flow->ID(), current.flow);
	}
}

bool FlowScheduler::CancelQueuedFlow(const string &flow_id) {
	std::shared_ptr<Flow> cancelled;
	CallContext ctx;
	{
		std::lock_guard<std::mutex> lck(mu);
		for (auto iter = queue.begin(); iter != queue.end(); ++iter) {
			if (iter->flow->ID() == flow_id) {
				cancelled = std::move(iter->flow);
				ctx = std::move(iter->ctx);
				queue.erase(iter);
				break;
			}
		}
	}
	if (cancelled == nullptr) {
		return false;
	}
	cancelled->Cancel();
	cancelled->Cleanup(ctx);
	return true;
}

void FlowScheduler::Quiesce() {
	std::deque<QueuedFlow> to_cleanup;
	vector<std::shared_ptr<Flow>> to_cancel;
	{
		std::lock_guard<std::mutex> lck(mu);
		quiescing = true;
		to_cleanup = std::move(queue);
		queue.clear();
		for (auto &entry : running) {
			to_cancel.emplace_back(entry.second);
		}
	}
	for (auto &flow : to_cancel) {
		flow->Cancel();
	}
	for (auto &queued : to_cleanup) {
		queued.flow->Cleanup(queued.ctx);
	}
}

idx_t FlowScheduler::RunningFlows() const {
	std::lock_guard<std::mutex> lck(mu);
	return running.size();
}

idx_t FlowScheduler::QueuedFlows() const {
	std::lock_guard<std::mutex> lck(mu);
	return queue.size();
}

void FlowScheduler::SetMaxRunningFlows(idx_t max_running_flows_p) {
	std::lock_guard<std::mutex> lck(mu);
	max_running_flows = max_running_flows_p;
}

} // namespace duckflow
