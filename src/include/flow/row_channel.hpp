#pragma once

#include "flow/row_receiver.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace duckflow {

// Items buffered by a channel before producers block.
inline constexpr idx_t ROW_CHANNEL_BUFFER_SIZE = 16;

struct ChannelItem {
	std::shared_ptr<arrow::RecordBatch> batch;
	std::optional<flowpb::ProducerMetadata> meta;
};

// Bounded queue connecting one or more producers to a single consumer. Items from all producers are merged in
// arrival order; the channel ends once every producer called ProducerDone.
class RowChannel : public RowReceiver {
public:
	explicit RowChannel(idx_t num_senders_p, idx_t capacity_p = ROW_CHANNEL_BUFFER_SIZE);

	ConsumerStatus Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) override;
	void ProducerDone() override;

	// Block for the next item. Returns false once all producers are done and the queue is drained.
	// Throws InterruptException if the channel was cancelled.
	bool Next(ChannelItem &item);

	// The consumer stops reading; later pushes of rows are dropped.
	void ConsumerDone();

	// Wake everyone up; blocked and future Next calls throw.
	void Cancel();

private:
	const idx_t capacity;
	std::mutex mu;
	std::condition_variable not_empty;
	std::condition_variable not_full;
	std::deque<ChannelItem> queue;
	idx_t open_senders;
	bool consumer_closed = false;
	bool cancelled = false;
};

} // namespace duckflow
