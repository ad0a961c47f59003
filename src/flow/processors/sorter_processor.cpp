#include "flow/processors/sorter_processor.hpp"

#include "arrow_utils.hpp"
#include "storage/temp_storage.hpp"
#include "storage/temp_storage_id_generator.hpp"
#include "utils/error_utils.hpp"

#include <algorithm>
#include <arrow/array.h>
#include <cstring>

namespace duckflow {

namespace {

void AppendBigEndian(string &out, uint64_t value) {
	for (int shift = 56; shift >= 0; shift -= 8) {
		out.push_back(static_cast<char>((value >> shift) & 0xFF));
	}
}

void AppendBigEndian32(string &out, uint32_t value) {
	for (int shift = 24; shift >= 0; shift -= 8) {
		out.push_back(static_cast<char>((value >> shift) & 0xFF));
	}
}

bool IsSortableType(arrow::Type::type type) {
	switch (type) {
	case arrow::Type::INT32:
	case arrow::Type::INT64:
	case arrow::Type::DOUBLE:
	case arrow::Type::STRING:
		return true;
	default:
		return false;
	}
}

// Three-way comparison of two non-null values of the same column.
int CompareValues(const arrow::Array &lhs, int64_t lhs_row, const arrow::Array &rhs, int64_t rhs_row) {
	switch (lhs.type_id()) {
	case arrow::Type::INT32: {
		auto l = static_cast<const arrow::Int32Array &>(lhs).Value(lhs_row);
		auto r = static_cast<const arrow::Int32Array &>(rhs).Value(rhs_row);
		return l < r ? -1 : (l > r ? 1 : 0);
	}
	case arrow::Type::INT64: {
		auto l = static_cast<const arrow::Int64Array &>(lhs).Value(lhs_row);
		auto r = static_cast<const arrow::Int64Array &>(rhs).Value(rhs_row);
		return l < r ? -1 : (l > r ? 1 : 0);
	}
	case arrow::Type::DOUBLE: {
		auto l = static_cast<const arrow::DoubleArray &>(lhs).Value(lhs_row);
		auto r = static_cast<const arrow::DoubleArray &>(rhs).Value(rhs_row);
		return l < r ? -1 : (l > r ? 1 : 0);
	}
	case arrow::Type::STRING: {
		auto l = static_cast<const arrow::StringArray &>(lhs).GetView(lhs_row);
		auto r = static_cast<const arrow::StringArray &>(rhs).GetView(rhs_row);
		return l.compare(r);
	}
	default:
		throw InternalException("sorter: unsupported sort column type %s", lhs.type()->ToString());
	}
}

} // namespace

string EncodeSortKey(const arrow::Array &array, int64_t row, bool descending) {
	string key;
	if (array.IsNull(row)) {
		key.push_back('\x00');
	} else {
		key.push_back('\x01');
		switch (array.type_id()) {
		case arrow::Type::INT32: {
			auto value = static_cast<uint32_t>(static_cast<const arrow::Int32Array &>(array).Value(row));
			AppendBigEndian32(key, value ^ (1U << 31));
			break;
		}
		case arrow::Type::INT64: {
			auto value = static_cast<uint64_t>(static_cast<const arrow::Int64Array &>(array).Value(row));
			AppendBigEndian(key, value ^ (1ULL << 63));
			break;
		}
		case arrow::Type::DOUBLE: {
			double value = static_cast<const arrow::DoubleArray &>(array).Value(row);
			uint64_t bits;
			std::memcpy(&bits, &value, sizeof(bits));
			bits = (bits & (1ULL << 63)) ? ~bits : (bits | (1ULL << 63));
			AppendBigEndian(key, bits);
			break;
		}
		case arrow::Type::STRING: {
			// 0x00 is escaped as 0x00 0xFF and the value ends with 0x00 0x01, so shorter strings sort first.
			auto value = static_cast<const arrow::StringArray &>(array).GetView(row);
			for (char c : value) {
				key.push_back(c);
				if (c == '\x00') {
					key.push_back('\xFF');
				}
			}
			key.push_back('\x00');
			key.push_back('\x01');
			break;
		}
		default:
			throw InternalException("sorter: unsupported sort column type %s", array.type()->ToString());
		}
	}
	if (descending) {
		for (auto &c : key) {
			c = static_cast<char>(~static_cast<unsigned char>(c));
		}
	}
	return key;
}

SorterProcessor::SorterProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p,
                                 RowReceiver *output_p, const flowpb::SorterCoreSpec &spec)
    : Processor(flow_ctx_p, processor_id_p, input_p, output_p), column(spec.column()),
      descending(spec.descending()) {
	if (input_p == nullptr) {
		throw InvalidInputException("sorter processor %d requires an input", processor_id_p);
	}
	if (column.empty()) {
		throw InvalidInputException("sorter processor %d has no sort column", processor_id_p);
	}
}

SorterProcessor::~SorterProcessor() {
	if (spilled) {
		flow_ctx.temp_storage->ClearPrefix(spill_prefix);
	}
}

void SorterProcessor::ResolveSortColumn(const arrow::Schema &input_schema) {
	sort_column = input_schema.GetFieldIndex(column);
	if (sort_column < 0) {
		throw InvalidInputException("sorter processor %d: unknown column %s", processor_id, column);
	}
	const auto &type = input_schema.field(sort_column)->type();
	if (!IsSortableType(type->id())) {
		throw InvalidInputException("sorter processor %d: cannot sort on column %s of type %s", processor_id, column,
		                            type->ToString());
	}
}

void SorterProcessor::StartSpilling() {
	spilled = true;
	spill_prefix = MakeTempStoragePrefix(flow_ctx.temp_storage_id_gen->NewID());
	for (const auto &batch : buffered) {
		SpillBatch(*batch);
	}
	buffered.clear();
	account.Clear();
}

void SorterProcessor::SpillBatch(const arrow::RecordBatch &batch) {
	const auto &sort_array = *batch.column(sort_column);
	for (int64_t row = 0; row < batch.num_rows(); ++row) {
		string key = spill_prefix;
		key += EncodeSortKey(sort_array, row, descending);
		AppendBigEndian(key, spill_seq++);

		auto value = SerializeRecordBatches(schema, {batch.Slice(row, 1)});
		ThrowIfNotOk(value.status(), StringUtil::Format("sorter processor %d: spill", processor_id));
		flow_ctx.temp_storage->Put(key, *value);
	}
}

void SorterProcessor::Process(const CallContext &ctx) {
	std::shared_ptr<arrow::RecordBatch> batch;
	while (NextInputBatch(ctx, batch)) {
		if (schema == nullptr) {
			schema = batch->schema();
			ResolveSortColumn(*schema);
		}
		if (batch->num_rows() == 0) {
			continue;
		}
		if (!spilled) {
			try {
				account.Grow(RecordBatchMemoryUsage(*batch));
				buffered.emplace_back(std::move(batch));
				continue;
			} catch (OutOfMemoryException &) {
				if (!flow_ctx.use_temp_storage || flow_ctx.temp_storage == nullptr) {
					throw;
				}
			}
			StartSpilling();
		}
		SpillBatch(*batch);
	}

	if (schema == nullptr) {
		return;
	}
	if (spilled) {
		EmitSpilled(ctx);
	} else {
		EmitInMemory(ctx);
	}
}

void SorterProcessor::EmitInMemory(const CallContext &ctx) {
	vector<std::pair<idx_t, int64_t>> rows;
	for (idx_t batch_idx = 0; batch_idx < buffered.size(); ++batch_idx) {
		for (int64_t row = 0; row < buffered[batch_idx]->num_rows(); ++row) {
			rows.emplace_back(batch_idx, row);
		}
	}
	std::stable_sort(rows.begin(), rows.end(), [&](const auto &lhs, const auto &rhs) {
		const auto &lhs_array = *buffered[lhs.first]->column(sort_column);
		const auto &rhs_array = *buffered[rhs.first]->column(sort_column);
		const bool lhs_null = lhs_array.IsNull(lhs.second);
		const bool rhs_null = rhs_array.IsNull(rhs.second);
		if (lhs_null || rhs_null) {
			// Nulls sort first ascending and last descending.
			return descending ? (!lhs_null && rhs_null) : (lhs_null && !rhs_null);
		}
		const int cmp = CompareValues(lhs_array, lhs.second, rhs_array, rhs.second);
		return descending ? cmp > 0 : cmp < 0;
	});

	for (idx_t start = 0; start < rows.size(); start += PROCESSOR_OUTPUT_BATCH_ROWS) {
		if (ctx.IsCancelled()) {
			throw InterruptException();
		}
		const idx_t end = std::min<idx_t>(rows.size(), start + PROCESSOR_OUTPUT_BATCH_ROWS);
		vector<std::pair<idx_t, int64_t>> chunk(rows.begin() + start, rows.begin() + end);
		auto out = TakeRows(schema, buffered, chunk);
		ThrowIfNotOk(out.status(), StringUtil::Format("sorter processor %d: gather", processor_id));
		if (!Emit(*out)) {
			break;
		}
	}
	buffered.clear();
	account.Clear();
}

void SorterProcessor::EmitSpilled(const CallContext &ctx) {
	vector<std::shared_ptr<arrow::RecordBatch>> pending;
	bool keep_going = true;
	auto flush = [&]() {
		if (pending.empty()) {
			return;
		}
		vector<std::pair<idx_t, int64_t>> rows;
		for (idx_t idx = 0; idx < pending.size(); ++idx) {
			rows.emplace_back(idx, 0);
		}
		auto out = TakeRows(schema, pending, rows);
		ThrowIfNotOk(out.status(), StringUtil::Format("sorter processor %d: gather", processor_id));
		pending.clear();
		keep_going = Emit(*out);
	};

	flow_ctx.temp_storage->Scan(spill_prefix, [&](const string &key, const string &value) {
		if (ctx.IsCancelled()) {
			throw InterruptException();
		}
		std::shared_ptr<arrow::Schema> row_schema;
		vector<std::shared_ptr<arrow::RecordBatch>> row_batches;
		ThrowIfNotOk(DeserializeRecordBatches(value, row_schema, row_batches),
		             StringUtil::Format("sorter processor %d: read spilled row", processor_id));
		for (auto &row_batch : row_batches) {
			pending.emplace_back(std::move(row_batch));
		}
		if (static_cast<int64_t>(pending.size()) >= PROCESSOR_OUTPUT_BATCH_ROWS) {
			flush();
		}
		return keep_going;
	});
	if (keep_going) {
		flush();
	}
}

} // namespace duckflow
