#pragma once

#include "duckflow_common.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "flow.pb.h"
#include "mem/memory_monitor.hpp"
#include "utils/time_zone.hpp"

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace duckflow {

class FlowDB;
class FlowStreamDialer;
class RegexpCache;
class TempStorage;
class TempStorageIDGenerator;
struct TestingKnobs;

// Session state under which a flow evaluates expressions.
struct EvalContext {
	TimeZoneLocation location;
	string database;
	vector<string> search_path;
	string cluster_id;
	int32_t node_id = 0;
	RegexpCache *re_cache = nullptr;

	// Flow memory monitor and the flow-level account drawn on it. The account is declared after the monitor so
	// it is closed first.
	unique_ptr<MemoryMonitor> mon;
	BoundAccount active_mem_acc;

	duckdb::timestamp_t stmt_timestamp;
	duckdb::timestamp_t txn_timestamp;
	flowpb::Timestamp cluster_timestamp;
};

// Everything a flow and its processors need from the node. Owned by the flow.
struct FlowContext {
	explicit FlowContext(duckdb::DatabaseInstance &db_instance_p) : db_instance(db_instance_p) {
	}

	string id;
	EvalContext eval_ctx;
	flowpb::TxnMeta txn;
	// Coordinated handle of the client that issued the query.
	FlowDB *client_db = nullptr;
	// Handle bypassing the node's transaction coordinator, for reads and writes issued by the flow.
	FlowDB *remote_txn_db = nullptr;
	int32_t node_id = 0;
	// Null when the node has no temp storage engine.
	TempStorage *temp_storage = nullptr;
	// Whether processors may spill to temp storage, read from the settings at setup.
	bool use_temp_storage = false;
	TempStorageIDGenerator *temp_storage_id_gen = nullptr;
	const TestingKnobs *testing_knobs = nullptr;
	FlowStreamDialer *dialer = nullptr;
	duckdb::DatabaseInstance &db_instance;
};

} // namespace duckflow
