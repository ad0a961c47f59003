// Hierarchical memory accounting.
//
// A MemoryMonitor tracks the bytes allocated by its accounts against a budget. The budget is either a fixed
// pool (root monitors) or bytes reserved from a parent monitor (child monitors). Children reserve from their
// parent in blocks of `increment` bytes so that small allocations do not go through the whole hierarchy.
//
// Node layout: one root monitor per server, one child monitor per flow, one BoundAccount per processor.

#pragma once

#include "duckflow_common.hpp"

#include <mutex>

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace duckflow {

class BoundAccount;

// Default block size used by child monitors to reserve memory from their parent.
inline constexpr int64_t DEFAULT_POOL_ALLOCATION_SIZE = 10 * 1024;

// Pool budget which places no limit on a root monitor.
inline constexpr int64_t UNLIMITED_BUDGET = -1;

class MemoryMonitor {
public:
	// `increment` is the block size used to reserve from the parent; -1 selects the default.
	// A monitor whose allocation exceeds `noteworthy_usage_bytes` logs it once.
	MemoryMonitor(string name_p, int64_t increment_p, int64_t noteworthy_usage_bytes_p,
	              duckdb::DatabaseInstance *log_db_p = nullptr);
	~MemoryMonitor();

	MemoryMonitor(const MemoryMonitor &) = delete;
	MemoryMonitor &operator=(const MemoryMonitor &) = delete;

	// Start the monitor. With a parent, memory is reserved from it and `limit` optionally caps this
	// monitor further; without one `limit` is the pool budget. Negative limits mean no cap.
	void Start(MemoryMonitor *parent_p, int64_t limit_p = UNLIMITED_BUDGET);

	// Stop the monitor and return all reserved memory to the parent. Safe to call more than once.
	void Stop();

	// Create an account that allocates from this monitor.
	BoundAccount MakeBoundAccount();

	const string &Name() const {
		return name;
	}
	// Bytes currently allocated by accounts of this monitor.
	int64_t AllocBytes() const;
	// High-water mark of AllocBytes().
	int64_t MaximumBytes() const;
	// Bytes reserved from the parent (or the pool) and not yet returned.
	int64_t ReservedBytes() const;
	// Number of started, not yet stopped, child monitors.
	idx_t NumOpenChildren() const;
	bool IsStarted() const;

private:
	friend class BoundAccount;

	// Throws OutOfMemoryException if `bytes` cannot be allocated. Nothing changes on failure.
	void ReserveMemory(int64_t bytes);
	void ReleaseMemory(int64_t bytes);

	// Reserve `bytes` more from the parent. Caller holds `mu`.
	void IncreaseBudgetLocked(int64_t bytes);
	// Round `bytes` up to a multiple of the increment.
	int64_t RoundSize(int64_t bytes) const;

	const string name;
	const int64_t increment;
	const int64_t noteworthy_usage_bytes;
	duckdb::DatabaseInstance *log_db;

	mutable std::mutex mu;
	MemoryMonitor *parent = nullptr;
	int64_t limit = UNLIMITED_BUDGET;
	bool started = false;
	int64_t cur_allocated = 0;
	int64_t max_allocated = 0;
	int64_t reserved = 0;
	bool logged_noteworthy = false;
	idx_t open_children = 0;
};

// A ledger of memory used by one owner, drawn against a monitor.
// Not thread-safe: an account belongs to a single processor or flow.
class BoundAccount {
public:
	BoundAccount() = default;
	explicit BoundAccount(MemoryMonitor &monitor_p);
	~BoundAccount();

	BoundAccount(BoundAccount &&other) noexcept;
	BoundAccount &operator=(BoundAccount &&other) noexcept;
	BoundAccount(const BoundAccount &) = delete;
	BoundAccount &operator=(const BoundAccount &) = delete;

	// Record `bytes` more. Throws OutOfMemoryException when the monitor budget would be exceeded, in which
	// case Used() is unchanged.
	void Grow(int64_t bytes);
	void Shrink(int64_t bytes);
	// Account for an item changing size from `old_size` to `new_size`.
	void ResizeItem(int64_t old_size, int64_t new_size);
	// Release everything recorded so far; the account stays usable.
	void Clear();
	// Release everything and detach from the monitor. Safe to call more than once.
	void Close();

	int64_t Used() const {
		return used;
	}
	bool IsOpen() const {
		return monitor != nullptr;
	}

private:
	MemoryMonitor *monitor = nullptr;
	int64_t used = 0;
};

} // namespace duckflow
