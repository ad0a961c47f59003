#include "flow/outbox.hpp"

#include "utils/error_utils.hpp"

namespace duckflow {

Outbox::Outbox(FlowStreamDialer &dialer_p, string target_addr_p, flowpb::FlowStreamHeader header_p,
               CallContext ctx_p)
    : dialer(&dialer_p), target_addr(std::move(target_addr_p)), header(std::move(header_p)), ctx(std::move(ctx_p)) {
}

Outbox::Outbox(OutboundFlowStream &stream_p) : stream(&stream_p) {
}

ConsumerStatus Outbox::Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) {
	if (error.has_value()) {
		return ConsumerStatus::CONSUMER_CLOSED;
	}
	if (batch != nullptr) {
		buffered_rows += batch->num_rows();
		buffered_batches.emplace_back(std::move(batch));
	}
	if (meta != nullptr) {
		buffered_metadata.emplace_back(*meta);
	}
	if (buffered_rows >= OUTBOX_BUFFER_ROWS || meta != nullptr) {
		Flush();
	}
	return error.has_value() ? ConsumerStatus::CONSUMER_CLOSED : ConsumerStatus::NEED_MORE_ROWS;
}

void Outbox::ProducerDone() {
	if (error.has_value()) {
		return;
	}
	Flush();
	if (error.has_value()) {
		return;
	}
	try {
		if (stream == nullptr) {
			// Nothing was sent; the consumer still needs the header to learn the stream ended.
			SendBuffered();
		}
		stream->CloseSend();
	} catch (std::exception &ex) {
		RecordFailure(ex);
	}
}

void Outbox::Flush() {
	if (buffered_batches.empty() && buffered_metadata.empty()) {
		return;
	}
	try {
		SendBuffered();
	} catch (std::exception &ex) {
		RecordFailure(ex);
	}
}

void Outbox::SendBuffered() {
	if (stream == nullptr) {
		owned_stream = dialer->Dial(ctx, target_addr);
		stream = owned_stream.get();
	}

	vector<ProducerMessage> messages;
	for (auto &batch : buffered_batches) {
		ProducerMessage msg;
		msg.batch = std::move(batch);
		messages.emplace_back(std::move(msg));
	}
	if (messages.empty()) {
		messages.emplace_back();
	}
	messages.back().metadata = std::move(buffered_metadata);
	if (header.has_value()) {
		messages.front().header = std::move(header);
		header.reset();
	}
	buffered_batches.clear();
	buffered_metadata.clear();
	buffered_rows = 0;

	for (const auto &msg : messages) {
		stream->Send(msg);
	}
}

void Outbox::RecordFailure(const std::exception &ex) {
	if (!error.has_value()) {
		error = FlowErrorFromException(ex);
	}
	buffered_batches.clear();
	buffered_metadata.clear();
	buffered_rows = 0;
}

OutboxSyncFlowStream::OutboxSyncFlowStream(SyncFlowServerStream &stream_p) : stream(stream_p) {
}

void OutboxSyncFlowStream::Send(const ProducerMessage &msg) {
	try {
		stream.Send(msg);
	} catch (std::exception &ex) {
		if (!error.has_value()) {
			error = FlowErrorFromException(ex);
		}
		throw;
	}
}

void OutboxSyncFlowStream::CloseSend() {
}

void OutboxSyncFlowStream::ThrowIfError() const {
	if (error.has_value()) {
		ThrowFlowError(*error);
	}
}

} // namespace duckflow
