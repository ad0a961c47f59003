#pragma once

#include "duckflow_common.hpp"

#include <arrow/record_batch.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/type.h>
#include <functional>
#include <memory>

namespace duckdb {
class QueryResult;
} // namespace duckdb

namespace duckflow {

// Serialize batches as an Arrow IPC stream. `schema` is written even when there are no batches.
arrow::Result<string> SerializeRecordBatches(const std::shared_ptr<arrow::Schema> &schema,
                                             const vector<std::shared_ptr<arrow::RecordBatch>> &batches);

// Read back an IPC stream written by SerializeRecordBatches.
arrow::Status DeserializeRecordBatches(const string &ipc_stream, std::shared_ptr<arrow::Schema> &schema,
                                       vector<std::shared_ptr<arrow::RecordBatch>> &batches);

// Convert a DuckDB query result into Arrow record batches, one per fetched chunk, handing each to `on_batch`.
arrow::Status QueryResultToArrow(duckdb::QueryResult &result, std::shared_ptr<arrow::Schema> &schema,
                                 const std::function<arrow::Status(std::shared_ptr<arrow::RecordBatch>)> &on_batch,
                                 idx_t *row_count = nullptr);

// Bytes of memory referenced by `batch`.
int64_t RecordBatchMemoryUsage(const arrow::RecordBatch &batch);

// Gather rows of `batches` in the order given by `rows`; each entry is (batch index, row index).
arrow::Result<std::shared_ptr<arrow::RecordBatch>>
TakeRows(const std::shared_ptr<arrow::Schema> &schema, const vector<std::shared_ptr<arrow::RecordBatch>> &batches,
         const vector<std::pair<idx_t, int64_t>> &rows);

} // namespace duckflow
