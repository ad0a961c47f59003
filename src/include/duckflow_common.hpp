#pragma once

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "duckdb/common/vector.hpp"

#include <cstdint>

namespace duckflow {

using duckdb::idx_t;
using duckdb::make_uniq;
using duckdb::string;
using duckdb::StringUtil;
using duckdb::unique_ptr;
using duckdb::unordered_map;
using duckdb::vector;

using duckdb::ConnectionException;
using duckdb::InternalException;
using duckdb::InterruptException;
using duckdb::InvalidInputException;
using duckdb::IOException;
using duckdb::OutOfMemoryException;

// Version identifies the flow protocol version.
//
// This version is separate from the release numbering; it is only changed when the flow API changes. The
// planner populates the version in SetupFlowRequest, and a server only accepts requests with versions in the
// range [MIN_ACCEPTED_VERSION, VERSION].
//
// The window lets mixed-version nodes coexist during an upgrade: a new feature bumps VERSION while the planner
// keeps issuing the older version; once every node understands the new version, the planner starts using it,
// and MIN_ACCEPTED_VERSION can be raised later to drop the old one.
inline constexpr int32_t VERSION = 4;

// Oldest protocol version this server is compatible with.
inline constexpr int32_t MIN_ACCEPTED_VERSION = 4;

// Identifies a stream within a flow.
using StreamID = int32_t;

} // namespace duckflow
