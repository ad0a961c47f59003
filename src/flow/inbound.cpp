#include "flow/inbound.hpp"

#include "utils/error_utils.hpp"

namespace duckflow {

namespace {

ConsumerStatus PushMessage(ProducerMessage &msg, RowReceiver &receiver) {
	auto status = ConsumerStatus::NEED_MORE_ROWS;
	if (msg.batch != nullptr) {
		status = receiver.Push(std::move(msg.batch), nullptr);
	}
	for (const auto &meta : msg.metadata) {
		if (receiver.Push(nullptr, &meta) == ConsumerStatus::CONSUMER_CLOSED) {
			status = ConsumerStatus::CONSUMER_CLOSED;
		}
	}
	return status;
}

} // namespace

void ProcessInboundStream(const CallContext &ctx, FlowStreamServerStream &stream, ProducerMessage first_msg,
                          RowReceiver &receiver) {
	struct ProducerDoneGuard {
		RowReceiver &receiver;
		~ProducerDoneGuard() {
			receiver.ProducerDone();
		}
	} guard {receiver};

	try {
		if (PushMessage(first_msg, receiver) == ConsumerStatus::CONSUMER_CLOSED) {
			return;
		}
		ProducerMessage msg;
		while (stream.Recv(msg)) {
			if (ctx.IsCancelled()) {
				throw InterruptException();
			}
			if (PushMessage(msg, receiver) == ConsumerStatus::CONSUMER_CLOSED) {
				return;
			}
			msg = ProducerMessage();
		}
	} catch (std::exception &ex) {
		flowpb::ProducerMetadata meta;
		*meta.mutable_error() = FlowErrorFromException(ex);
		receiver.Push(nullptr, &meta);
		throw;
	}
}

} // namespace duckflow
