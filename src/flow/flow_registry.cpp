#include "flow/flow_registry.hpp"

#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"
#include "flow/flow.hpp"

#include <algorithm>

namespace duckflow {

namespace {

constexpr std::chrono::milliseconds CONNECT_POLL_INTERVAL {50};

} // namespace

FlowRegistry::FlowRegistry(duckdb::DatabaseInstance &db_instance_p) : db_instance(db_instance_p) {
	reaper = std::thread([this]() { ReapUnconnectedStreams(); });
}

FlowRegistry::~FlowRegistry() {
	{
		std::lock_guard<std::mutex> lck(mu);
		stopping = true;
	}
	reaper_cv.notify_all();
	reaper.join();
}

void FlowRegistry::RegisterFlow(const string &flow_id, std::shared_ptr<Flow> flow,
                                const unordered_map<StreamID, std::shared_ptr<RowReceiver>> &inbound_streams,
                                std::chrono::milliseconds timeout) {
	std::lock_guard<std::mutex> lck(mu);
	auto &slot = flows[flow_id];
	if (slot == nullptr) {
		slot = std::make_shared<FlowEntry>();
	}
	if (slot->flow != nullptr) {
		throw InternalException("flow %s already registered", flow_id);
	}
	slot->flow = std::move(flow);
	for (const auto &[stream_id, receiver] : inbound_streams) {
		InboundStreamInfo info;
		info.receiver = receiver;
		slot->inbound_streams.emplace(stream_id, std::move(info));
	}
	slot->connect_deadline = Clock::now() + timeout;
	slot->registered_cv.notify_all();
	if (!inbound_streams.empty()) {
		reaper_cv.notify_all();
	}
}

void FlowRegistry::UnregisterFlow(const string &flow_id) {
	std::lock_guard<std::mutex> lck(mu);
	flows.erase(flow_id);
}

void FlowRegistry::MaybeRemoveLocked(const string &flow_id) {
	auto iter = flows.find(flow_id);
	if (iter != flows.end() && iter->second->flow == nullptr && iter->second->waiters == 0) {
		flows.erase(iter);
	}
}

InboundStreamConnection FlowRegistry::ConnectInboundStream(const CallContext &ctx, const string &flow_id,
                                                           StreamID stream_id, std::chrono::milliseconds timeout) {
	const auto deadline = Clock::now() + timeout;
	std::unique_lock<std::mutex> lck(mu);
	auto &slot = flows[flow_id];
	if (slot == nullptr) {
		slot = std::make_shared<FlowEntry>();
	}
	auto entry = slot;

	if (entry->flow == nullptr) {
		DUCKDB_LOG_DEBUG(db_instance,
		                 ctx.Annotate(StringUtil::Format("stream %d waiting for flow %s", stream_id, flow_id)));
		++entry->waiters;
		while (entry->flow == nullptr) {
			if (ctx.IsCancelled()) {
				--entry->waiters;
				MaybeRemoveLocked(flow_id);
				throw InterruptException();
			}
			if (Clock::now() >= deadline) {
				--entry->waiters;
				MaybeRemoveLocked(flow_id);
				throw ConnectionException("flow %s not found: timed out after %lld ms waiting for registration of "
				                          "inbound stream %d",
				                          flow_id, static_cast<long long>(timeout.count()), stream_id);
			}
			entry->registered_cv.wait_until(lck, std::min(deadline, Clock::now() + CONNECT_POLL_INTERVAL));
		}
		--entry->waiters;
	}

	auto iter = entry->inbound_streams.find(stream_id);
	if (iter == entry->inbound_streams.end()) {
		throw ConnectionException("flow %s has no inbound stream %d", flow_id, stream_id);
	}
	auto &info = iter->second;
	if (info.timed_out) {
		throw ConnectionException("flow %s: inbound stream %d timed out waiting for a connection", flow_id,
		                          stream_id);
	}
	if (info.connected) {
		throw ConnectionException("flow %s: inbound stream %d already connected", flow_id, stream_id);
	}
	info.connected = true;

	InboundStreamConnection conn;
	conn.flow = entry->flow;
	conn.receiver = info.receiver;
	conn.release = [this, entry, stream_id]() {
		std::lock_guard<std::mutex> release_lck(mu);
		auto &released = entry->inbound_streams[stream_id];
		if (released.finished) {
			DUCKDB_LOG_ERROR(db_instance, StringUtil::Format("inbound stream %d released twice", stream_id));
			return;
		}
		released.finished = true;
	};
	return conn;
}

std::shared_ptr<Flow> FlowRegistry::LookupFlow(const string &flow_id) const {
	std::lock_guard<std::mutex> lck(mu);
	auto iter = flows.find(flow_id);
	if (iter == flows.end()) {
		return nullptr;
	}
	return iter->second->flow;
}

idx_t FlowRegistry::NumRegisteredFlows() const {
	std::lock_guard<std::mutex> lck(mu);
	idx_t count = 0;
	for (const auto &entry : flows) {
		if (entry.second->flow != nullptr) {
			++count;
		}
	}
	return count;
}

void FlowRegistry::ReapUnconnectedStreams() {
	struct ExpiredStream {
		string flow_id;
		StreamID stream_id;
		std::shared_ptr<RowReceiver> receiver;
	};

	std::unique_lock<std::mutex> lck(mu);
	while (!stopping) {
		const auto now = Clock::now();
		auto next_deadline = Clock::time_point::max();
		vector<ExpiredStream> expired;
		for (auto &[flow_id, entry] : flows) {
			if (entry->flow == nullptr) {
				continue;
			}
			for (auto &[stream_id, info] : entry->inbound_streams) {
				if (info.connected || info.timed_out) {
					continue;
				}
				if (entry->connect_deadline <= now) {
					info.timed_out = true;
					expired.emplace_back(ExpiredStream {flow_id, stream_id, info.receiver});
				} else {
					next_deadline = std::min(next_deadline, entry->connect_deadline);
				}
			}
		}

		if (!expired.empty()) {
			lck.unlock();
			for (auto &stream : expired) {
				DUCKDB_LOG_WARN(db_instance, StringUtil::Format("flow %s: no inbound stream connection for stream %d",
				                                                stream.flow_id, stream.stream_id));
				flowpb::ProducerMetadata meta;
				meta.mutable_error()->set_kind(flowpb::HANDSHAKE);
				meta.mutable_error()->set_message(StringUtil::Format(
				    "no inbound stream connection for stream %d of flow %s", stream.stream_id, stream.flow_id));
				stream.receiver->Push(nullptr, &meta);
				stream.receiver->ProducerDone();
			}
			lck.lock();
			continue;
		}

		if (next_deadline == Clock::time_point::max()) {
			reaper_cv.wait(lck);
		} else {
			reaper_cv.wait_until(lck, next_deadline);
		}
	}
}

} // namespace duckflow
