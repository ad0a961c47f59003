#include "flow/processors/noop_processor.hpp"

namespace duckflow {

NoopProcessor::NoopProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p,
                             RowReceiver *output_p)
    : Processor(flow_ctx_p, processor_id_p, input_p, output_p) {
	if (input_p == nullptr) {
		throw InvalidInputException("noop processor %d requires an input", processor_id_p);
	}
}

void NoopProcessor::Process(const CallContext &ctx) {
	std::shared_ptr<arrow::RecordBatch> batch;
	while (NextInputBatch(ctx, batch)) {
		if (!Emit(std::move(batch))) {
			return;
		}
	}
}

} // namespace duckflow
