#include "flow/processor.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"
#include "flow/processors/noop_processor.hpp"
#include "flow/processors/sorter_processor.hpp"
#include "flow/processors/sql_query_processor.hpp"
#include "flow/processors/values_processor.hpp"
#include "utils/error_utils.hpp"

namespace duckflow {

Processor::Processor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowChannel *input_p, RowReceiver *output_p)
    : flow_ctx(flow_ctx_p), processor_id(processor_id_p), input(input_p), output(output_p),
      account(flow_ctx_p.eval_ctx.mon->MakeBoundAccount()) {
}

void Processor::Run(const CallContext &ctx) {
	try {
		if (ctx.IsCancelled()) {
			throw InterruptException();
		}
		Process(ctx);
	} catch (std::exception &ex) {
		flowpb::ProducerMetadata meta;
		*meta.mutable_error() = FlowErrorFromException(ex);
		error = meta.error();
		DUCKDB_LOG_DEBUG(flow_ctx.db_instance,
		                 ctx.Annotate(StringUtil::Format("processor %d (%s) failed: %s", processor_id, Name(),
		                                                 meta.error().message())));
		output->Push(nullptr, &meta);
	}
	if (input != nullptr) {
		input->ConsumerDone();
	}
	output->ProducerDone();
	account.Close();
}

bool Processor::Emit(std::shared_ptr<arrow::RecordBatch> batch) {
	if (consumer_closed) {
		return false;
	}
	if (output->Push(std::move(batch), nullptr) == ConsumerStatus::CONSUMER_CLOSED) {
		consumer_closed = true;
	}
	return !consumer_closed;
}

void Processor::EmitMetadata(const flowpb::ProducerMetadata &meta) {
	output->Push(nullptr, &meta);
}

bool Processor::NextInputBatch(const CallContext &ctx, std::shared_ptr<arrow::RecordBatch> &batch) {
	if (input == nullptr) {
		return false;
	}
	ChannelItem item;
	while (true) {
		if (ctx.IsCancelled()) {
			throw InterruptException();
		}
		if (!input->Next(item)) {
			return false;
		}
		if (item.meta.has_value()) {
			EmitMetadata(*item.meta);
		}
		if (item.batch != nullptr) {
			batch = std::move(item.batch);
			return true;
		}
	}
}

unique_ptr<Processor> NewProcessor(FlowContext &flow_ctx, const flowpb::ProcessorSpec &spec, RowChannel *input,
                                   RowReceiver *output) {
	const auto &core = spec.core();
	switch (core.core_case()) {
	case flowpb::ProcessorCoreUnion::kValues:
		if (input != nullptr) {
			throw InvalidInputException("values processor %d takes no input", spec.processor_id());
		}
		return make_uniq<ValuesProcessor>(flow_ctx, spec.processor_id(), output, core.values());
	case flowpb::ProcessorCoreUnion::kNoop:
		return make_uniq<NoopProcessor>(flow_ctx, spec.processor_id(), input, output);
	case flowpb::ProcessorCoreUnion::kSqlQuery:
		if (input != nullptr) {
			throw InvalidInputException("sql_query processor %d takes no input", spec.processor_id());
		}
		return make_uniq<SqlQueryProcessor>(flow_ctx, spec.processor_id(), output, core.sql_query());
	case flowpb::ProcessorCoreUnion::kSorter:
		return make_uniq<SorterProcessor>(flow_ctx, spec.processor_id(), input, output, core.sorter());
	default:
		throw InvalidInputException("unsupported processor core for processor %d", spec.processor_id());
	}
}

MirrorRouter::MirrorRouter(vector<RowReceiver *> outputs_p) : outputs(std::move(outputs_p)), closed(outputs.size()) {
}

ConsumerStatus MirrorRouter::Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) {
	bool any_open = false;
	for (idx_t idx = 0; idx < outputs.size(); ++idx) {
		if (closed[idx]) {
			continue;
		}
		if (outputs[idx]->Push(batch, meta) == ConsumerStatus::CONSUMER_CLOSED) {
			closed[idx] = true;
		} else {
			any_open = true;
		}
	}
	return any_open ? ConsumerStatus::NEED_MORE_ROWS : ConsumerStatus::CONSUMER_CLOSED;
}

void MirrorRouter::ProducerDone() {
	for (auto *out : outputs) {
		out->ProducerDone();
	}
}

} // namespace duckflow
