#pragma once

#include "duckflow_common.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <regex>

namespace duckflow {

// Number of compiled patterns a server keeps for its flows.
inline constexpr idx_t DEFAULT_REGEXP_CACHE_SIZE = 512;

// LRU cache of compiled regular expressions, shared by all flows of a server.
class RegexpCache {
public:
	explicit RegexpCache(idx_t capacity_p);

	// Get the compiled form of `pattern`, compiling it on a miss. Throws InvalidInputException if `pattern`
	// does not compile.
	std::shared_ptr<const std::regex> GetRegexp(const string &pattern);

	idx_t Size() const;

private:
	using Entry = std::pair<string, std::shared_ptr<const std::regex>>;

	const idx_t capacity;
	mutable std::mutex mu;
	// Most recently used first.
	std::list<Entry> entries;
	unordered_map<string, std::list<Entry>::iterator> lookup;
};

} // namespace duckflow
