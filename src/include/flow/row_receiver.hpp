#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"

#include <arrow/record_batch.h>
#include <memory>

namespace duckflow {

enum class ConsumerStatus : uint8_t {
	// The consumer wants more rows.
	NEED_MORE_ROWS,
	// The consumer is gone; the producer should stop.
	CONSUMER_CLOSED,
};

// Consumer side of a stream of record batches.
class RowReceiver {
public:
	virtual ~RowReceiver() = default;

	// Push a batch, metadata, or both. Either may be null.
	virtual ConsumerStatus Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) = 0;

	// Called exactly once per producer when it will push nothing more.
	virtual void ProducerDone() = 0;
};

} // namespace duckflow
