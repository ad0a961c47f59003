#pragma once

#include "flow/processor.hpp"

namespace duckflow {

// Sorts its input on one column. Nulls sort first ascending and last descending.
//
// Rows are buffered in memory against the processor account. When the account runs out, the buffered rows and
// all later ones are spilled to temp storage, keyed so that the storage's key order is the sort order.
class SorterProcessor : public Processor {
public:
	SorterProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p, RowReceiver *output_p,
	                const flowpb::SorterCoreSpec &spec);
	~SorterProcessor() override;

	string Name() const override {
		return "sorter";
	}

	// Whether the last run spilled to temp storage.
	bool Spilled() const {
		return spilled;
	}

protected:
	void Process(const CallContext &ctx) override;

private:
	void ResolveSortColumn(const arrow::Schema &input_schema);
	void StartSpilling();
	void SpillBatch(const arrow::RecordBatch &batch);
	void EmitInMemory(const CallContext &ctx);
	void EmitSpilled(const CallContext &ctx);

	string column;
	bool descending;

	std::shared_ptr<arrow::Schema> schema;
	int sort_column = -1;
	vector<std::shared_ptr<arrow::RecordBatch>> buffered;

	bool spilled = false;
	string spill_prefix;
	uint64_t spill_seq = 0;
};

// Key encoding of row `row` of `array` whose bytewise order matches the sort order. Supports int32, int64,
// double and utf8 columns.
string EncodeSortKey(const arrow::Array &array, int64_t row, bool descending);

} // namespace duckflow
