#include "storage/flow_db.hpp"

#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"

namespace duckflow {

FlowDB::FlowDB(duckdb::DuckDB &db_p, string name_p, bool bypass_txn_coordinator_p)
    : db(db_p), name(std::move(name_p)), bypass_txn_coordinator(bypass_txn_coordinator_p) {
}

unique_ptr<duckdb::Connection> FlowDB::Connect() const {
	return make_uniq<duckdb::Connection>(db);
}

} // namespace duckflow
