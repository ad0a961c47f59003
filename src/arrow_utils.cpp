#include "arrow_utils.hpp"

#include "duckdb/common/arrow/arrow_appender.hpp"
#include "duckdb/common/arrow/arrow_converter.hpp"
#include "duckdb/common/arrow/arrow_type_extension.hpp"
#include "duckdb/common/arrow/arrow_wrapper.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/query_result.hpp"

#include <arrow/array/builder_base.h>
#include <arrow/array/data.h>
#include <arrow/builder.h>
#include <arrow/c/bridge.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/byte_size.h>

namespace duckflow {

arrow::Result<string> SerializeRecordBatches(const std::shared_ptr<arrow::Schema> &schema,
                                             const vector<std::shared_ptr<arrow::RecordBatch>> &batches) {
	ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
	ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeStreamWriter(sink, schema));
	for (const auto &batch : batches) {
		ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
	}
	ARROW_RETURN_NOT_OK(writer->Close());
	ARROW_ASSIGN_OR_RAISE(auto buffer, sink->Finish());
	return buffer->ToString();
}

arrow::Status DeserializeRecordBatches(const string &ipc_stream, std::shared_ptr<arrow::Schema> &schema,
                                       vector<std::shared_ptr<arrow::RecordBatch>> &batches) {
	auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(ipc_stream));
	ARROW_ASSIGN_OR_RAISE(auto reader, arrow::ipc::RecordBatchStreamReader::Open(input));
	schema = reader->schema();
	while (true) {
		std::shared_ptr<arrow::RecordBatch> batch;
		ARROW_RETURN_NOT_OK(reader->ReadNext(&batch));
		if (batch == nullptr) {
			break;
		}
		batches.emplace_back(std::move(batch));
	}
	return arrow::Status::OK();
}

arrow::Status QueryResultToArrow(duckdb::QueryResult &result, std::shared_ptr<arrow::Schema> &schema,
                                 const std::function<arrow::Status(std::shared_ptr<arrow::RecordBatch>)> &on_batch,
                                 idx_t *row_count) {
	ArrowSchema arrow_schema;
	duckdb::ArrowConverter::ToArrowSchema(&arrow_schema, result.types, result.names, result.client_properties);
	ARROW_ASSIGN_OR_RAISE(schema, arrow::ImportSchema(&arrow_schema));

	idx_t count = 0;
	while (true) {
		auto chunk = result.Fetch();
		if (!chunk || chunk->size() == 0) {
			break;
		}

		ArrowArray arrow_array;
		auto extension_types = duckdb::ArrowTypeExtensionData::GetExtensionTypes(
		    *result.client_properties.client_context, result.types);
		duckdb::ArrowConverter::ToArrowArray(*chunk, &arrow_array, result.client_properties, extension_types);

		auto batch_result = arrow::ImportRecordBatch(&arrow_array, schema);
		if (!batch_result.ok()) {
			return arrow::Status::Invalid("Failed to import Arrow batch: ", batch_result.status().message());
		}
		auto batch = batch_result.MoveValueUnsafe();
		count += batch->num_rows();
		ARROW_RETURN_NOT_OK(on_batch(std::move(batch)));
	}
	if (result.HasError()) {
		return arrow::Status::Invalid(result.GetError());
	}

	if (row_count) {
		*row_count = count;
	}
	return arrow::Status::OK();
}

int64_t RecordBatchMemoryUsage(const arrow::RecordBatch &batch) {
	return arrow::util::TotalBufferSize(batch);
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>>
TakeRows(const std::shared_ptr<arrow::Schema> &schema, const vector<std::shared_ptr<arrow::RecordBatch>> &batches,
         const vector<std::pair<idx_t, int64_t>> &rows) {
	vector<std::shared_ptr<arrow::Array>> columns;
	columns.reserve(schema->num_fields());
	for (int col = 0; col < schema->num_fields(); ++col) {
		std::unique_ptr<arrow::ArrayBuilder> builder;
		ARROW_RETURN_NOT_OK(arrow::MakeBuilder(arrow::default_memory_pool(), schema->field(col)->type(), &builder));
		ARROW_RETURN_NOT_OK(builder->Reserve(static_cast<int64_t>(rows.size())));
		for (const auto &[batch_idx, row_idx] : rows) {
			const auto &data = batches[batch_idx]->column_data(col);
			ARROW_RETURN_NOT_OK(builder->AppendArraySlice(arrow::ArraySpan(*data), row_idx, 1));
		}
		std::shared_ptr<arrow::Array> column;
		ARROW_RETURN_NOT_OK(builder->Finish(&column));
		columns.emplace_back(std::move(column));
	}
	return arrow::RecordBatch::Make(schema, static_cast<int64_t>(rows.size()), std::move(columns));
}

} // namespace duckflow
