#pragma once

#include "flow/processor.hpp"

namespace duckflow {

// Emits the rows inlined in its spec.
class ValuesProcessor : public Processor {
public:
	// Throws InvalidInputException if the inlined rows cannot be decoded.
	ValuesProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowReceiver *output_p,
	                const flowpb::ValuesCoreSpec &spec);

	string Name() const override {
		return "values";
	}

protected:
	void Process(const CallContext &ctx) override;

private:
	std::shared_ptr<arrow::Schema> schema;
	vector<std::shared_ptr<arrow::RecordBatch>> batches;
};

} // namespace duckflow
