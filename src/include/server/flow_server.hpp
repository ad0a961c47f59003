// Entry points through which other nodes set up and run flows on this node.

#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"
#include "flow/flow.hpp"
#include "flow/flow_registry.hpp"
#include "flow/flow_scheduler.hpp"
#include "flow/flow_streams.hpp"
#include "flow/testing_knobs.hpp"
#include "mem/memory_monitor.hpp"
#include "storage/flow_db.hpp"
#include "storage/temp_storage_id_generator.hpp"
#include "utils/call_context.hpp"
#include "utils/regexp_cache.hpp"
#include "utils/tracing.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace duckdb {
class Connection;
class DuckDB;
} // namespace duckdb

namespace duckflow {

class Stopper;
class TempStorage;

// Setting which allows processors to spill to temp storage.
inline constexpr const char *USE_TEMP_STORAGE_SETTING = "duckflow_use_temp_storage";
// Setting which limits concurrently running asynchronous flows.
inline constexpr const char *MAX_RUNNING_FLOWS_SETTING = "duckflow_max_running_flows";
// Environment variable overriding the noteworthy memory usage of flow monitors, in bytes.
inline constexpr const char *NOTEWORTHY_MEMORY_USAGE_ENV = "DUCKFLOW_NOTEWORTHY_MEMORY_USAGE";
inline constexpr int64_t DEFAULT_NOTEWORTHY_MEMORY_USAGE = 10 * 1024;

// Holds the node ID once it is known; 0 means unresolved.
class NodeIDContainer {
public:
	int32_t Get() const {
		return node_id.load();
	}
	void Set(int32_t node_id_p) {
		node_id.store(node_id_p);
	}

private:
	std::atomic<int32_t> node_id {0};
};

struct ServerConfig {
	// Required. Used for logging, settings and the default flow database handles.
	duckdb::DuckDB *db = nullptr;
	// Coordinated database handle; defaults to one over `db`.
	FlowDB *client_db = nullptr;
	// Handle bypassing the transaction coordinator; defaults to one over `db`.
	FlowDB *flow_db = nullptr;
	// Required.
	NodeIDContainer *node_id = nullptr;
	string cluster_id;

	// The server monitor reserves from this one when set; otherwise `memory_budget` is its pool.
	MemoryMonitor *parent_memory_monitor = nullptr;
	int64_t memory_budget = UNLIMITED_BUDGET;

	// Optional temp storage engine for spilling processors.
	TempStorage *temp_storage = nullptr;
	// Defaults to a tracer which records nothing.
	BaseTracer *tracer = nullptr;
	// Required.
	Stopper *stopper = nullptr;
	// Needed by flows with outbound REMOTE streams.
	FlowStreamDialer *dialer = nullptr;

	TestingKnobs testing_knobs;
	// Used until the max running flows setting is changed.
	idx_t max_running_flows = DEFAULT_MAX_RUNNING_FLOWS;
	// How long inbound streams wait for their flow, and flows for their inbound streams.
	std::chrono::milliseconds flow_stream_timeout = DEFAULT_FLOW_STREAM_TIMEOUT;
};

// A set up flow and the context to run it under, carrying the flow's span and log tags.
struct FlowSetupResult {
	CallContext ctx;
	std::shared_ptr<Flow> flow;
};

class ServerImpl {
public:
	explicit ServerImpl(ServerConfig config_p);
	~ServerImpl();

	ServerImpl(const ServerImpl &) = delete;
	ServerImpl &operator=(const ServerImpl &) = delete;

	// Start the server monitor and the flow scheduler.
	void Start();

	// Set up a flow whose SYNC_RESPONSE stream feeds `output`; the flow is not started. The caller must run
	// Cleanup on the returned flow exactly once.
	FlowSetupResult SetupSyncFlow(const CallContext &ctx, const flowpb::SetupFlowRequest &req, RowReceiver &output);

	// Serve a RunSyncFlow call: the first message sets up a flow whose output goes back through `stream`. Returns
	// once the flow finished and was cleaned up. Throws on protocol errors and on the first failure to send.
	void RunSyncFlow(SyncFlowServerStream &stream);

	// Set up a flow and hand it to the scheduler. Failures are reported in the response, not thrown.
	flowpb::SimpleResponse SetupFlow(const CallContext &ctx, const flowpb::SetupFlowRequest &req);

	// Serve a FlowStream call: attach the inbound stream to its local consumer and push its rows.
	void FlowStream(FlowStreamServerStream &stream);

	// Cancel a running or queued flow. Returns false if there is no such flow.
	bool CancelFlow(const string &flow_id);

	int32_t NodeID() const {
		return config.node_id->Get();
	}
	MemoryMonitor &Monitor() {
		return memory_monitor;
	}
	FlowRegistry &Registry() {
		return *registry;
	}
	FlowScheduler &Scheduler() {
		return *scheduler;
	}
	TempStorageIDGenerator &TempStorageIDs() {
		return temp_storage_id_gen;
	}
	RegexpCache &Regexps() {
		return regexp_cache;
	}
	const ServerConfig &Config() const {
		return config;
	}

	// Current values of the settings.
	bool UseTempStorage();
	idx_t MaxRunningFlows();

private:
	FlowSetupResult SetupFlowInternal(const CallContext &ctx, const TraceSpan *parent_span,
	                                  const flowpb::SetupFlowRequest &req, RowReceiver *sync_output);
	std::chrono::milliseconds FlowStreamTimeout() const;
	CallContext ServerCtx(const CallContext &ctx) const;

	ServerConfig config;
	duckdb::DatabaseInstance &db_instance;
	unique_ptr<FlowDB> owned_client_db;
	unique_ptr<FlowDB> owned_flow_db;
	unique_ptr<BaseTracer> owned_tracer;
	int64_t noteworthy_memory_usage;

	std::mutex settings_mu;
	unique_ptr<duckdb::Connection> settings_conn;

	MemoryMonitor memory_monitor;
	TempStorageIDGenerator temp_storage_id_gen;
	RegexpCache regexp_cache;
	unique_ptr<FlowRegistry> registry;
	unique_ptr<FlowScheduler> scheduler;
};

} // namespace duckflow
