#include "utils/time_zone.hpp"

#include "duckdb/common/file_system.hpp"

#include <cmath>
#include <cstdlib>

namespace duckflow {

namespace {

constexpr int32_t SECONDS_PER_HOUR = 60 * 60;

// Parse a signed decimal hour offset; the whole string must be consumed.
bool ParseHourOffset(const string &location, double &hours) {
	if (location.empty()) {
		return false;
	}
	const char *begin = location.c_str();
	char *end = nullptr;
	hours = std::strtod(begin, &end);
	return end == begin + location.size() && std::isfinite(hours);
}

} // namespace

TimeZoneLocation TimeZoneStringToLocation(const string &location, const string &zoneinfo_dir) {
	if (location.empty() || StringUtil::CIEquals(location, "UTC")) {
		return TimeZoneLocation {"UTC", /*fixed=*/true, /*offset_seconds=*/0};
	}
	if (location == "Local") {
		return TimeZoneLocation {"Local", /*fixed=*/false, /*offset_seconds=*/0};
	}

	double hours = 0;
	if (ParseHourOffset(location, hours)) {
		return TimeZoneLocation {location, /*fixed=*/true,
		                         static_cast<int32_t>(std::lround(hours * SECONDS_PER_HOUR))};
	}

	// Zone names are relative paths into the database; anything escaping it is not a zone.
	if (location[0] == '/' || location.find("..") != string::npos) {
		throw InvalidInputException("cannot find time zone %s", location);
	}
	auto fs = duckdb::FileSystem::CreateLocal();
	if (!fs->FileExists(fs->JoinPath(zoneinfo_dir, location))) {
		throw InvalidInputException("cannot find time zone %s", location);
	}
	return TimeZoneLocation {location, /*fixed=*/false, /*offset_seconds=*/0};
}

} // namespace duckflow
