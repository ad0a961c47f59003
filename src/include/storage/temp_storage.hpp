// Scratch key-value storage used by processors that spill to disk.

#pragma once

#include "duckflow_common.hpp"

#include <functional>
#include <map>
#include <mutex>

namespace duckdb {
class FileHandle;
class FileSystem;
} // namespace duckdb

namespace duckflow {

// Key-value engine for temporary data. Keys are compared bytewise; callers partition the key space with the
// prefixes from TempStorageIDGenerator.
class TempStorage {
public:
	virtual ~TempStorage() = default;

	virtual void Put(const string &key, const string &value) = 0;
	// Returns false if `key` is absent.
	virtual bool Get(const string &key, string &value) = 0;
	// Invoke `fn` for every key starting with `prefix`, in key order. Iteration stops when `fn` returns false.
	virtual void Scan(const string &prefix, const std::function<bool(const string &key, const string &value)> &fn) = 0;
	// Delete every key starting with `prefix`.
	virtual void ClearPrefix(const string &prefix) = 0;
};

// Temp storage backed by an append-only data file on local disk. The key index lives in memory; values are
// read back from the file on demand. Clearing keys reclaims their space: the file is truncated once no keys
// are left, and live values are compacted to the front once dead bytes outweigh them. The data file is
// removed when the storage is destroyed.
class DiskTempStorage : public TempStorage {
public:
	// Creates a new data file under `directory`, which must exist.
	explicit DiskTempStorage(const string &directory);
	~DiskTempStorage() override;

	void Put(const string &key, const string &value) override;
	bool Get(const string &key, string &value) override;
	void Scan(const string &prefix, const std::function<bool(const string &key, const string &value)> &fn) override;
	void ClearPrefix(const string &prefix) override;

	const string &Path() const {
		return path;
	}
	// Number of live keys.
	idx_t KeyCount() const;

private:
	struct ValueLocation {
		idx_t offset;
		idx_t length;
	};

	string ReadValue(const ValueLocation &loc);
	// Reclaims dead space after keys were dropped. Requires `mu`.
	void ReclaimLocked();

	unique_ptr<duckdb::FileSystem> fs;
	string path;
	unique_ptr<duckdb::FileHandle> handle;

	mutable std::mutex mu;
	std::map<string, ValueLocation> index;
	idx_t end_offset = 0;
	// Bytes referenced by `index`; the rest of the file up to `end_offset` is dead.
	idx_t live_bytes = 0;
};

// Encode `id` as an 8-byte big-endian key prefix, so that prefixes of increasing IDs sort in order.
string MakeTempStoragePrefix(uint64_t id);

} // namespace duckflow
