#pragma once

#include "duckflow_common.hpp"

namespace duckflow {

// Directory holding the IANA time zone database.
inline constexpr const char *DEFAULT_ZONEINFO_DIR = "/usr/share/zoneinfo";

// A resolved time zone.
struct TimeZoneLocation {
	// "UTC", "Local", the numeric offset as given, or the IANA name.
	string name;
	// True for UTC and numeric offsets, whose offset from UTC never changes.
	bool fixed = true;
	// Offset from UTC for fixed zones.
	int32_t offset_seconds = 0;
};

// Resolve a session time zone string. Accepts "" or "UTC", "Local", a numeric hour offset such as "-8" or
// "+5.5", or a name from the IANA database under `zoneinfo_dir`. Throws InvalidInputException otherwise.
TimeZoneLocation TimeZoneStringToLocation(const string &location, const string &zoneinfo_dir = DEFAULT_ZONEINFO_DIR);

} // namespace duckflow
