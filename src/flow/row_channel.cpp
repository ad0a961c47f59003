#include "flow/row_channel.hpp"

namespace duckflow {

RowChannel::RowChannel(idx_t num_senders_p, idx_t capacity_p) : capacity(capacity_p), open_senders(num_senders_p) {
}

ConsumerStatus RowChannel::Push(std::shared_ptr<arrow::RecordBatch> batch, const flowpb::ProducerMetadata *meta) {
	std::unique_lock<std::mutex> lck(mu);
	if (consumer_closed || cancelled) {
		return ConsumerStatus::CONSUMER_CLOSED;
	}
	// Metadata never waits for space; it is rare and must not be lost behind a slow consumer.
	if (meta == nullptr) {
		not_full.wait(lck, [this]() { return queue.size() < capacity || consumer_closed || cancelled; });
		if (consumer_closed || cancelled) {
			return ConsumerStatus::CONSUMER_CLOSED;
		}
	}
	ChannelItem item;
	item.batch = std::move(batch);
	if (meta != nullptr) {
		item.meta = *meta;
	}
	queue.emplace_back(std::move(item));
	not_empty.notify_one();
	return ConsumerStatus::NEED_MORE_ROWS;
}

void RowChannel::ProducerDone() {
	std::lock_guard<std::mutex> lck(mu);
	if (open_senders == 0) {
		throw InternalException("RowChannel::ProducerDone called more times than there are senders");
	}
	--open_senders;
	if (open_senders == 0) {
		not_empty.notify_all();
	}
}

bool RowChannel::Next(ChannelItem &item) {
	std::unique_lock<std::mutex> lck(mu);
	not_empty.wait(lck, [this]() { return cancelled || !queue.empty() || open_senders == 0; });
	if (cancelled) {
		throw InterruptException();
	}
	if (queue.empty()) {
		return false;
	}
	item = std::move(queue.front());
	queue.pop_front();
	not_full.notify_one();
	return true;
}

void RowChannel::ConsumerDone() {
	std::lock_guard<std::mutex> lck(mu);
	consumer_closed = true;
	queue.clear();
	not_full.notify_all();
}

void RowChannel::Cancel() {
	std::lock_guard<std::mutex> lck(mu);
	cancelled = true;
	not_empty.notify_all();
	not_full.notify_all();
}

} // namespace duckflow
