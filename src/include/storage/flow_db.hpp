#pragma once

#include "duckflow_common.hpp"

namespace duckdb {
class Connection;
class DuckDB;
} // namespace duckdb

namespace duckflow {

// Handle to the node-local database that flows read from and write to.
//
// A server carries two of these: the coordinated handle, whose transactions go through the node's
// transaction coordinator, and the bypassing handle, reserved for reads and writes issued by the flow itself
// on behalf of a transaction that is coordinated elsewhere.
class FlowDB {
public:
	FlowDB(duckdb::DuckDB &db_p, string name_p, bool bypass_txn_coordinator_p);

	// Open a new connection. Each processor uses its own connection.
	unique_ptr<duckdb::Connection> Connect() const;

	const string &Name() const {
		return name;
	}
	bool BypassesTxnCoordinator() const {
		return bypass_txn_coordinator;
	}
	duckdb::DuckDB &Database() const {
		return db;
	}

private:
	duckdb::DuckDB &db;
	string name;
	bool bypass_txn_coordinator;
};

} // namespace duckflow
