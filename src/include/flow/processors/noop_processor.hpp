#pragma once

#include "flow/processor.hpp"

namespace duckflow {

// Forwards its input unchanged.
class NoopProcessor : public Processor {
public:
	NoopProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p, RowReceiver *output_p);

	string Name() const override {
		return "noop";
	}

protected:
	void Process(const CallContext &ctx) override;
};

} // namespace duckflow
