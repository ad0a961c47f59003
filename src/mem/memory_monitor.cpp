#include "mem/memory_monitor.hpp"

#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"

namespace duckflow {

MemoryMonitor::MemoryMonitor(string name_p, int64_t increment_p, int64_t noteworthy_usage_bytes_p,
                             duckdb::DatabaseInstance *log_db_p)
    : name(std::move(name_p)), increment(increment_p > 0 ? increment_p : DEFAULT_POOL_ALLOCATION_SIZE),
      noteworthy_usage_bytes(noteworthy_usage_bytes_p), log_db(log_db_p) {
}

MemoryMonitor::~MemoryMonitor() {
	Stop();
}

void MemoryMonitor::Start(MemoryMonitor *parent_p, int64_t limit_p) {
	{
		std::lock_guard<std::mutex> lck(mu);
		if (started) {
			throw InternalException("memory monitor %s started twice", name);
		}
		started = true;
		parent = parent_p;
		limit = limit_p;
		cur_allocated = 0;
		max_allocated = 0;
		reserved = 0;
		logged_noteworthy = false;
	}
	if (parent != nullptr) {
		std::lock_guard<std::mutex> lck(parent->mu);
		++parent->open_children;
	}
}

void MemoryMonitor::Stop() {
	MemoryMonitor *stopped_parent = nullptr;
	int64_t to_release = 0;
	{
		std::lock_guard<std::mutex> lck(mu);
		if (!started) {
			return;
		}
		if (cur_allocated != 0 && log_db != nullptr) {
			DUCKDB_LOG_ERROR(*log_db, StringUtil::Format("%s: monitor stopped with %lld bytes still allocated", name,
			                                             static_cast<long long>(cur_allocated)));
		}
		started = false;
		stopped_parent = parent;
		to_release = reserved;
		parent = nullptr;
		cur_allocated = 0;
		reserved = 0;
	}
	if (stopped_parent != nullptr) {
		if (to_release > 0) {
			stopped_parent->ReleaseMemory(to_release);
		}
		std::lock_guard<std::mutex> lck(stopped_parent->mu);
		--stopped_parent->open_children;
	}
}

BoundAccount MemoryMonitor::MakeBoundAccount() {
	if (!IsStarted()) {
		throw InternalException("%s: cannot open an account on a stopped monitor", name);
	}
	return BoundAccount(*this);
}

int64_t MemoryMonitor::AllocBytes() const {
	std::lock_guard<std::mutex> lck(mu);
	return cur_allocated;
}

int64_t MemoryMonitor::MaximumBytes() const {
	std::lock_guard<std::mutex> lck(mu);
	return max_allocated;
}

int64_t MemoryMonitor::ReservedBytes() const {
	std::lock_guard<std::mutex> lck(mu);
	return reserved;
}

idx_t MemoryMonitor::NumOpenChildren() const {
	std::lock_guard<std::mutex> lck(mu);
	return open_children;
}

bool MemoryMonitor::IsStarted() const {
	std::lock_guard<std::mutex> lck(mu);
	return started;
}

int64_t MemoryMonitor::RoundSize(int64_t bytes) const {
	return (bytes + increment - 1) / increment * increment;
}

void MemoryMonitor::IncreaseBudgetLocked(int64_t bytes) {
	// Prefer a whole block so the next small allocations stay local; fall back to the exact shortfall when the
	// parent cannot spare a full block.
	const int64_t rounded = RoundSize(bytes);
	try {
		parent->ReserveMemory(rounded);
		reserved += rounded;
		return;
	} catch (OutOfMemoryException &) {
		if (rounded == bytes) {
			throw;
		}
	}
	parent->ReserveMemory(bytes);
	reserved += bytes;
}

void MemoryMonitor::ReserveMemory(int64_t bytes) {
	std::lock_guard<std::mutex> lck(mu);
	if (!started) {
		throw InternalException("%s: allocation on a stopped monitor", name);
	}
	if (limit >= 0 && cur_allocated + bytes > limit) {
		throw OutOfMemoryException("%s: memory budget exceeded: %lld bytes requested, %lld currently allocated, "
		                           "%lld bytes in budget",
		                           name, static_cast<long long>(bytes), static_cast<long long>(cur_allocated),
		                           static_cast<long long>(limit));
	}
	if (parent != nullptr && cur_allocated + bytes > reserved) {
		try {
			IncreaseBudgetLocked(cur_allocated + bytes - reserved);
		} catch (OutOfMemoryException &ex) {
			throw OutOfMemoryException("%s: memory budget exceeded: %lld bytes requested, %lld currently "
			                           "allocated: %s",
			                           name, static_cast<long long>(bytes), static_cast<long long>(cur_allocated),
			                           duckdb::ErrorData(ex).RawMessage());
		}
	}
	cur_allocated += bytes;
	if (cur_allocated > max_allocated) {
		max_allocated = cur_allocated;
	}
	if (!logged_noteworthy && noteworthy_usage_bytes > 0 && cur_allocated > noteworthy_usage_bytes) {
		logged_noteworthy = true;
		if (log_db != nullptr) {
			DUCKDB_LOG_INFO(*log_db, StringUtil::Format("%s: memory usage increases to %lld bytes", name,
			                                            static_cast<long long>(cur_allocated)));
		}
	}
}

void MemoryMonitor::ReleaseMemory(int64_t bytes) {
	MemoryMonitor *release_to = nullptr;
	int64_t surplus = 0;
	{
		std::lock_guard<std::mutex> lck(mu);
		if (bytes > cur_allocated) {
			throw InternalException("%s: no memory to release, current %lld, free %lld", name,
			                        static_cast<long long>(cur_allocated), static_cast<long long>(bytes));
		}
		cur_allocated -= bytes;
		// Keep at most one block of slack reserved from the parent.
		if (parent != nullptr && reserved - cur_allocated > increment) {
			surplus = reserved - cur_allocated - increment;
			reserved -= surplus;
			release_to = parent;
		}
	}
	if (release_to != nullptr && surplus > 0) {
		release_to->ReleaseMemory(surplus);
	}
}

BoundAccount::BoundAccount(MemoryMonitor &monitor_p) : monitor(&monitor_p) {
}

BoundAccount::~BoundAccount() {
	Close();
}

BoundAccount::BoundAccount(BoundAccount &&other) noexcept : monitor(other.monitor), used(other.used) {
	other.monitor = nullptr;
	other.used = 0;
}

BoundAccount &BoundAccount::operator=(BoundAccount &&other) noexcept {
	if (this != &other) {
		Close();
		monitor = other.monitor;
		used = other.used;
		other.monitor = nullptr;
		other.used = 0;
	}
	return *this;
}

void BoundAccount::Grow(int64_t bytes) {
	if (monitor == nullptr) {
		throw InternalException("allocation on a closed account");
	}
	if (bytes <= 0) {
		return;
	}
	monitor->ReserveMemory(bytes);
	used += bytes;
}

void BoundAccount::Shrink(int64_t bytes) {
	if (monitor == nullptr || bytes <= 0) {
		return;
	}
	if (bytes > used) {
		throw InternalException("%s: no memory to release from account, used %lld, free %lld", monitor->Name(),
		                        static_cast<long long>(used), static_cast<long long>(bytes));
	}
	monitor->ReleaseMemory(bytes);
	used -= bytes;
}

void BoundAccount::ResizeItem(int64_t old_size, int64_t new_size) {
	const int64_t delta = new_size - old_size;
	if (delta > 0) {
		Grow(delta);
	} else if (delta < 0) {
		Shrink(-delta);
	}
}

void BoundAccount::Clear() {
	if (monitor != nullptr && used > 0) {
		monitor->ReleaseMemory(used);
	}
	used = 0;
}

void BoundAccount::Close() {
	if (monitor == nullptr) {
		return;
	}
	Clear();
	monitor = nullptr;
}

} // namespace duckflow
