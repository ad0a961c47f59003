#pragma once

#include <atomic>
#include <cstdint>

namespace duckflow {

// Hands out process-unique IDs which processors use as key prefixes in temp storage, so that concurrently
// running processors never share a key space.
class TempStorageIDGenerator {
public:
	TempStorageIDGenerator() = default;

	TempStorageIDGenerator(const TempStorageIDGenerator &) = delete;
	TempStorageIDGenerator &operator=(const TempStorageIDGenerator &) = delete;

	// Returns the next ID; the first call returns 1.
	uint64_t NewID() {
		return counter.fetch_add(1, std::memory_order_relaxed) + 1;
	}

	// Largest ID handed out so far, 0 if none.
	uint64_t HighWaterMark() const {
		return counter.load(std::memory_order_relaxed);
	}

private:
	std::atomic<uint64_t> counter {0};
};

} // namespace duckflow
