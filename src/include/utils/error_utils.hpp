// Conversions between exceptions, wire errors and Arrow statuses.

#pragma once

#include "duckflow_common.hpp"
#include "flow.pb.h"

#include <arrow/status.h>
#include <exception>

namespace duckflow {

// Error kind a thrown exception is reported as.
flowpb::ErrorKind ErrorKindFromException(const std::exception &ex);

// Wire form of a thrown exception.
flowpb::Error FlowErrorFromException(const std::exception &ex);

// Rethrow a wire error as the exception type matching its kind.
[[noreturn]] void ThrowFlowError(const flowpb::Error &error);

// Status returned to Flight clients for a thrown exception.
arrow::Status StatusFromException(const std::exception &ex);

// Throw the exception matching a failed Arrow status, prefixing the message with `what`.
void ThrowIfNotOk(const arrow::Status &status, const string &what);

} // namespace duckflow
