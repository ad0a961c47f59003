#pragma once

#include "flow/flow_streams.hpp"
#include "flow/row_receiver.hpp"

namespace duckflow {

// Push the rows of an inbound stream into `receiver`, starting with the already received `first_msg`, until
// the producer ends the stream or the consumer closes. Calls receiver.ProducerDone() on every path; a stream
// failure is also pushed to the receiver as metadata before it is rethrown.
void ProcessInboundStream(const CallContext &ctx, FlowStreamServerStream &stream, ProducerMessage first_msg,
                          RowReceiver &receiver);

} // namespace duckflow
