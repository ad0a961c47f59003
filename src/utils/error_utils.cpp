#include "utils/error_utils.hpp"

#include "duckdb/common/error_data.hpp"

namespace duckflow {

flowpb::ErrorKind ErrorKindFromException(const std::exception &ex) {
	duckdb::ErrorData error(ex);
	switch (error.Type()) {
	case duckdb::ExceptionType::INVALID_INPUT:
		return flowpb::PROTOCOL;
	case duckdb::ExceptionType::OUT_OF_MEMORY:
		return flowpb::RESOURCE;
	case duckdb::ExceptionType::CONNECTION:
		return flowpb::HANDSHAKE;
	case duckdb::ExceptionType::INTERRUPT:
		return flowpb::CANCELLED;
	default:
		return flowpb::EXECUTION;
	}
}

flowpb::Error FlowErrorFromException(const std::exception &ex) {
	duckdb::ErrorData error(ex);
	flowpb::Error result;
	result.set_kind(ErrorKindFromException(ex));
	result.set_message(error.RawMessage());
	return result;
}

void ThrowFlowError(const flowpb::Error &error) {
	switch (error.kind()) {
	case flowpb::PROTOCOL:
		throw InvalidInputException(error.message());
	case flowpb::RESOURCE:
		throw OutOfMemoryException(error.message());
	case flowpb::HANDSHAKE:
		throw ConnectionException(error.message());
	case flowpb::CANCELLED:
		throw InterruptException();
	case flowpb::DEPLOYMENT:
		throw IOException("flow deployment failed: %s", error.message());
	default:
		throw duckdb::ExecutorException(error.message());
	}
}

arrow::Status StatusFromException(const std::exception &ex) {
	duckdb::ErrorData error(ex);
	switch (error.Type()) {
	case duckdb::ExceptionType::INVALID_INPUT:
		return arrow::Status::Invalid(error.RawMessage());
	case duckdb::ExceptionType::OUT_OF_MEMORY:
		return arrow::Status::OutOfMemory(error.RawMessage());
	case duckdb::ExceptionType::INTERRUPT:
		return arrow::Status::Cancelled(error.RawMessage());
	case duckdb::ExceptionType::IO:
	case duckdb::ExceptionType::CONNECTION:
		return arrow::Status::IOError(error.RawMessage());
	default:
		return arrow::Status::UnknownError(error.RawMessage());
	}
}

void ThrowIfNotOk(const arrow::Status &status, const string &what) {
	if (status.ok()) {
		return;
	}
	const auto message = StringUtil::Format("%s: %s", what, status.message());
	if (status.IsOutOfMemory()) {
		throw OutOfMemoryException(message);
	}
	if (status.IsCancelled()) {
		throw InterruptException();
	}
	if (status.IsInvalid() || status.IsTypeError()) {
		throw InvalidInputException(message);
	}
	throw IOException(message);
}

} // namespace duckflow
