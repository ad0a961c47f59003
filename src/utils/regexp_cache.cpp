#include "utils/regexp_cache.hpp"

namespace duckflow {

RegexpCache::RegexpCache(idx_t capacity_p) : capacity(capacity_p) {
}

std::shared_ptr<const std::regex> RegexpCache::GetRegexp(const string &pattern) {
	{
		std::lock_guard<std::mutex> lck(mu);
		auto iter = lookup.find(pattern);
		if (iter != lookup.end()) {
			entries.splice(entries.begin(), entries, iter->second);
			return iter->second->second;
		}
	}

	// Compile outside the lock; a concurrent miss on the same pattern compiles twice and keeps one.
	std::shared_ptr<const std::regex> compiled;
	try {
		compiled = std::make_shared<const std::regex>(pattern);
	} catch (std::regex_error &ex) {
		throw InvalidInputException("invalid regular expression %s: %s", pattern, ex.what());
	}

	std::lock_guard<std::mutex> lck(mu);
	auto iter = lookup.find(pattern);
	if (iter != lookup.end()) {
		entries.splice(entries.begin(), entries, iter->second);
		return iter->second->second;
	}
	if (capacity == 0) {
		return compiled;
	}
	entries.emplace_front(pattern, compiled);
	lookup[pattern] = entries.begin();
	if (entries.size() > capacity) {
		lookup.erase(entries.back().first);
		entries.pop_back();
	}
	return compiled;
}

idx_t RegexpCache::Size() const {
	std::lock_guard<std::mutex> lck(mu);
	return entries.size();
}

} // namespace duckflow
