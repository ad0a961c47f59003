#include "flow/processors/sql_query_processor.hpp"

#include "arrow_utils.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/main/query_result.hpp"
#include "duckdb/parser/keyword_helper.hpp"
#include "storage/flow_db.hpp"
#include "utils/error_utils.hpp"

namespace duckflow {

namespace {

void RunSessionStatement(duckdb::Connection &conn, const string &statement) {
	auto result = conn.Query(statement);
	if (result->HasError()) {
		result->ThrowError();
	}
}

} // namespace

SqlQueryProcessor::SqlQueryProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowReceiver *output_p,
                                     const flowpb::SqlQueryCoreSpec &spec)
    : Processor(flow_ctx_p, processor_id_p, /*input_p=*/nullptr, output_p), sql(spec.sql()) {
	if (sql.empty()) {
		throw InvalidInputException("sql_query processor %d has no query", processor_id_p);
	}
	if (flow_ctx_p.remote_txn_db == nullptr) {
		throw InternalException("sql_query processor %d: flow has no database handle", processor_id_p);
	}
}

void SqlQueryProcessor::Process(const CallContext &ctx) {
	auto conn = flow_ctx.remote_txn_db->Connect();
	const auto &eval_ctx = flow_ctx.eval_ctx;
	if (!eval_ctx.database.empty()) {
		RunSessionStatement(*conn, StringUtil::Format("USE %s", duckdb::KeywordHelper::WriteOptionallyQuoted(
		                                                            eval_ctx.database)));
	}
	if (!eval_ctx.search_path.empty()) {
		vector<string> quoted;
		for (const auto &schema : eval_ctx.search_path) {
			quoted.emplace_back(duckdb::KeywordHelper::WriteOptionallyQuoted(schema));
		}
		RunSessionStatement(*conn, StringUtil::Format("SET search_path = %s",
		                                              duckdb::KeywordHelper::WriteQuoted(
		                                                  StringUtil::Join(quoted, ","), '\'')));
	}

	auto result = conn->SendQuery(sql);
	if (result->HasError()) {
		result->ThrowError();
	}

	bool consumer_gone = false;
	std::shared_ptr<arrow::Schema> schema;
	auto status = QueryResultToArrow(*result, schema, [&](std::shared_ptr<arrow::RecordBatch> batch) {
		if (ctx.IsCancelled()) {
			return arrow::Status::Cancelled("flow cancelled");
		}
		// The batch is held by this processor until the consumer took it.
		const auto batch_size = RecordBatchMemoryUsage(*batch);
		account.Grow(batch_size);
		const bool keep_going = Emit(std::move(batch));
		account.Shrink(batch_size);
		if (!keep_going) {
			consumer_gone = true;
			return arrow::Status::Cancelled("consumer closed");
		}
		return arrow::Status::OK();
	});
	if (consumer_gone) {
		return;
	}
	ThrowIfNotOk(status, StringUtil::Format("sql_query processor %d", processor_id));
}

} // namespace duckflow
