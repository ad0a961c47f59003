#pragma once

#include "flow/flow_streams.hpp"
#include "flow/row_receiver.hpp"

#include <optional>

namespace duckflow {

// Rows an outbox buffers before sending them.
inline constexpr int64_t OUTBOX_BUFFER_ROWS = 16;

// Sends the rows of one output stream to a consumer on another node (or to the RunSyncFlow caller).
//
// Rows are buffered and flushed once OUTBOX_BUFFER_ROWS rows accumulated, when metadata arrives and when the
// producer is done. A send failure closes the outbox: later pushes report CONSUMER_CLOSED and the failure is
// kept as Error() for the flow to pick up.
class Outbox : public RowReceiver {
public:
	// Outbox dialing `target_addr` on first flush; the first message carries `header`.
	Outbox(FlowStreamDialer &dialer_p, string target_addr_p, flowpb::FlowStreamHeader header_p, CallContext ctx_p);
	// Outbox sending to an already open stream, without header.
	explicit Outbox(OutboundFlowStream &stream_p);

	ConsumerStatus Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) override;
	void ProducerDone() override;

	const std::optional<flowpb::Error> &Error() const {
		return error;
	}

private:
	void Flush();
	void SendBuffered();
	void RecordFailure(const std::exception &ex);

	FlowStreamDialer *dialer = nullptr;
	string target_addr;
	std::optional<flowpb::FlowStreamHeader> header;
	CallContext ctx;

	unique_ptr<OutboundFlowStream> owned_stream;
	OutboundFlowStream *stream = nullptr;

	vector<std::shared_ptr<arrow::RecordBatch>> buffered_batches;
	vector<flowpb::ProducerMetadata> buffered_metadata;
	int64_t buffered_rows = 0;
	std::optional<flowpb::Error> error;
};

// RunSyncFlow's response stream seen as an outbound stream. Keeps the first send failure.
class OutboxSyncFlowStream : public OutboundFlowStream {
public:
	explicit OutboxSyncFlowStream(SyncFlowServerStream &stream_p);

	void Send(const ProducerMessage &msg) override;
	void CloseSend() override;

	// Rethrow the first send failure, if any.
	void ThrowIfError() const;

private:
	SyncFlowServerStream &stream;
	std::optional<flowpb::Error> error;
};

} // namespace duckflow
