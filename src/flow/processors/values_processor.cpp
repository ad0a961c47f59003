#include "flow/processors/values_processor.hpp"

#include "arrow_utils.hpp"

namespace duckflow {

ValuesProcessor::ValuesProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowReceiver *output_p,
                                 const flowpb::ValuesCoreSpec &spec)
    : Processor(flow_ctx_p, processor_id_p, /*input_p=*/nullptr, output_p) {
	auto status = DeserializeRecordBatches(spec.arrow_ipc_stream(), schema, batches);
	if (!status.ok()) {
		throw InvalidInputException("values processor %d: cannot decode rows: %s", processor_id_p,
		                            status.message());
	}
}

void ValuesProcessor::Process(const CallContext &ctx) {
	for (auto &batch : batches) {
		if (ctx.IsCancelled()) {
			throw InterruptException();
		}
		if (!Emit(batch)) {
			return;
		}
	}
}

} // namespace duckflow
