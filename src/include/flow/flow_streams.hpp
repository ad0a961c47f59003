// Transport-neutral views of the streaming RPCs. The Flight service adapts its readers and writers to these;
// tests drive the server through in-memory implementations.

#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"
#include "utils/call_context.hpp"

#include <arrow/record_batch.h>
#include <memory>
#include <optional>

namespace duckflow {

// One message on a data stream from producer to consumer.
struct ProducerMessage {
	// Set on the first message of an inbound stream only.
	std::optional<flowpb::FlowStreamHeader> header;
	std::shared_ptr<arrow::RecordBatch> batch;
	vector<flowpb::ProducerMetadata> metadata;
};

// Server side of RunSyncFlow: the consumer sends a setup request and receives the flow's rows.
class SyncFlowServerStream {
public:
	virtual ~SyncFlowServerStream() = default;

	// Receive the next consumer message. Returns false at end of stream.
	virtual bool Recv(flowpb::ConsumerSignal &signal) = 0;
	// Send a message to the consumer. Throws IOException on transport failure.
	virtual void Send(const ProducerMessage &msg) = 0;
	virtual const CallContext &Context() const = 0;
};

// Server side of FlowStream: a remote producer pushes rows into a local flow.
class FlowStreamServerStream {
public:
	virtual ~FlowStreamServerStream() = default;

	// Receive the next producer message. Returns false at end of stream.
	virtual bool Recv(ProducerMessage &msg) = 0;
	virtual const CallContext &Context() const = 0;
};

// Client side of FlowStream, used by outboxes.
class OutboundFlowStream {
public:
	virtual ~OutboundFlowStream() = default;

	// Throws IOException on transport failure.
	virtual void Send(const ProducerMessage &msg) = 0;
	// Finish the stream and wait for the consumer to acknowledge it.
	virtual void CloseSend() = 0;
};

// Opens outbound streams to other nodes.
class FlowStreamDialer {
public:
	virtual ~FlowStreamDialer() = default;

	virtual unique_ptr<OutboundFlowStream> Dial(const CallContext &ctx, const string &target_addr) = 0;
};

} // namespace duckflow
