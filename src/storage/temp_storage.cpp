#include "storage/temp_storage.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/types/uuid.hpp"

#include <algorithm>

namespace duckflow {

namespace {

// Compaction only kicks in once at least this much of the file is dead.
constexpr idx_t MIN_COMPACTION_BYTES = 1 << 20;

// Smallest key greater than every key with the given prefix, or empty if there is none.
string PrefixEnd(const string &prefix) {
	string end = prefix;
	while (!end.empty()) {
		auto last = static_cast<unsigned char>(end.back());
		if (last != 0xFF) {
			end.back() = static_cast<char>(last + 1);
			return end;
		}
		end.pop_back();
	}
	return end;
}

} // namespace

DiskTempStorage::DiskTempStorage(const string &directory) : fs(duckdb::FileSystem::CreateLocal()) {
	if (!fs->DirectoryExists(directory)) {
		throw IOException("temp storage directory %s does not exist", directory);
	}
	path = fs->JoinPath(directory, StringUtil::Format("duckflow-temp-%s.data",
	                                                  duckdb::UUID::ToString(duckdb::UUID::GenerateRandomUUID())));
	handle = fs->OpenFile(path, duckdb::FileFlags::FILE_FLAGS_READ | duckdb::FileFlags::FILE_FLAGS_WRITE |
	                                duckdb::FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
}

DiskTempStorage::~DiskTempStorage() {
	handle.reset();
	if (fs->FileExists(path)) {
		fs->RemoveFile(path);
	}
}

void DiskTempStorage::Put(const string &key, const string &value) {
	std::lock_guard<std::mutex> lck(mu);
	if (!value.empty()) {
		handle->Write(const_cast<char *>(value.data()), static_cast<int64_t>(value.size()), end_offset);
	}
	auto &loc = index[key];
	live_bytes -= loc.length;
	loc = ValueLocation {end_offset, value.size()};
	live_bytes += value.size();
	end_offset += value.size();
	if (end_offset - live_bytes >= MIN_COMPACTION_BYTES && end_offset - live_bytes > live_bytes) {
		ReclaimLocked();
	}
}

string DiskTempStorage::ReadValue(const ValueLocation &loc) {
	string value(loc.length, '\0');
	if (loc.length > 0) {
		handle->Read(&value[0], static_cast<int64_t>(loc.length), loc.offset);
	}
	return value;
}

bool DiskTempStorage::Get(const string &key, string &value) {
	std::lock_guard<std::mutex> lck(mu);
	auto iter = index.find(key);
	if (iter == index.end()) {
		return false;
	}
	value = ReadValue(iter->second);
	return true;
}

void DiskTempStorage::Scan(const string &prefix,
                           const std::function<bool(const string &key, const string &value)> &fn) {
	// Collect keys first so `fn` may write to the storage. Values are looked up again when read since a write
	// may move or drop them in between.
	vector<string> keys;
	{
		std::lock_guard<std::mutex> lck(mu);
		for (auto iter = index.lower_bound(prefix); iter != index.end(); ++iter) {
			if (!StringUtil::StartsWith(iter->first, prefix)) {
				break;
			}
			keys.emplace_back(iter->first);
		}
	}
	for (const auto &key : keys) {
		string value;
		{
			std::lock_guard<std::mutex> lck(mu);
			auto iter = index.find(key);
			if (iter == index.end()) {
				continue;
			}
			value = ReadValue(iter->second);
		}
		if (!fn(key, value)) {
			return;
		}
	}
}

void DiskTempStorage::ClearPrefix(const string &prefix) {
	std::lock_guard<std::mutex> lck(mu);
	auto begin = index.lower_bound(prefix);
	const auto end_key = PrefixEnd(prefix);
	auto end = end_key.empty() ? index.end() : index.lower_bound(end_key);
	if (begin == end) {
		return;
	}
	for (auto iter = begin; iter != end; ++iter) {
		live_bytes -= iter->second.length;
	}
	index.erase(begin, end);
	ReclaimLocked();
}

void DiskTempStorage::ReclaimLocked() {
	if (index.empty()) {
		handle->Truncate(0);
		end_offset = 0;
		live_bytes = 0;
		return;
	}
	const idx_t dead_bytes = end_offset - live_bytes;
	if (dead_bytes < MIN_COMPACTION_BYTES || dead_bytes <= live_bytes) {
		return;
	}
	// Slide live values to the front in file order. A value never moves past its old offset, so nothing
	// unread is overwritten.
	vector<ValueLocation *> live;
	live.reserve(index.size());
	for (auto &entry : index) {
		live.emplace_back(&entry.second);
	}
	std::sort(live.begin(), live.end(),
	          [](const ValueLocation *a, const ValueLocation *b) { return a->offset < b->offset; });
	idx_t write_offset = 0;
	for (auto loc : live) {
		if (loc->offset != write_offset && loc->length > 0) {
			auto value = ReadValue(*loc);
			handle->Write(&value[0], static_cast<int64_t>(value.size()), write_offset);
		}
		loc->offset = write_offset;
		write_offset += loc->length;
	}
	handle->Truncate(static_cast<int64_t>(write_offset));
	end_offset = write_offset;
}

idx_t DiskTempStorage::KeyCount() const {
	std::lock_guard<std::mutex> lck(mu);
	return index.size();
}

string MakeTempStoragePrefix(uint64_t id) {
	string prefix(sizeof(uint64_t), '\0');
	for (idx_t idx = 0; idx < sizeof(uint64_t); ++idx) {
		prefix[idx] = static_cast<char>((id >> (8 * (sizeof(uint64_t) - 1 - idx))) & 0xFF);
	}
	return prefix;
}

} // namespace duckflow
