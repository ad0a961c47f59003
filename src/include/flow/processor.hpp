#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"
#include "flow/flow_context.hpp"
#include "flow/row_channel.hpp"
#include "mem/memory_monitor.hpp"
#include "utils/call_context.hpp"

#include <optional>

namespace duckflow {

// Rows per batch emitted by processors that build their own output.
inline constexpr int64_t PROCESSOR_OUTPUT_BATCH_ROWS = 1024;

// A node of the flow DAG. Reads from at most one input channel and writes to one output receiver.
class Processor {
public:
	Processor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p, RowReceiver *output_p);
	virtual ~Processor() = default;

	Processor(const Processor &) = delete;
	Processor &operator=(const Processor &) = delete;

	// Run to completion. A failure is sent downstream as metadata and kept as Error(); the output is closed on
	// every path.
	void Run(const CallContext &ctx);

	virtual string Name() const = 0;

	int32_t ProcessorID() const {
		return processor_id;
	}
	const std::optional<flowpb::Error> &Error() const {
		return error;
	}

protected:
	virtual void Process(const CallContext &ctx) = 0;

	// Send a batch downstream. Returns false once the consumer no longer wants rows.
	bool Emit(std::shared_ptr<arrow::RecordBatch> batch);
	void EmitMetadata(const flowpb::ProducerMetadata &meta);

	// Read the next input batch, forwarding metadata downstream. Returns false at end of input.
	bool NextInputBatch(const CallContext &ctx, std::shared_ptr<arrow::RecordBatch> &batch);

	FlowContext &flow_ctx;
	const int32_t processor_id;
	RowChannel *input;
	RowReceiver *output;
	// Memory used by this processor, drawn on the flow monitor.
	BoundAccount account;

private:
	std::optional<flowpb::Error> error;
	bool consumer_closed = false;
};

// Create the processor for `spec`. Throws InvalidInputException for an unknown or malformed core.
unique_ptr<Processor> NewProcessor(FlowContext &flow_ctx, const flowpb::ProcessorSpec &spec, RowChannel *input,
                                   RowReceiver *output);

// Routes every row to each of its outputs.
class MirrorRouter : public RowReceiver {
public:
	explicit MirrorRouter(vector<RowReceiver *> outputs_p);

	ConsumerStatus Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) override;
	void ProducerDone() override;

private:
	vector<RowReceiver *> outputs;
	vector<bool> closed;
};

} // namespace duckflow
