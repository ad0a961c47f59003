// Per-call context threaded through the server entry points: cancellation, the current tracing span and log
// tags.

#pragma once

#include "duckflow_common.hpp"

#include <arrow/util/cancel.h>
#include <functional>
#include <memory>

namespace duckflow {

class TraceSpan;

class CallContext {
public:
	CallContext() = default;

	// Copy of this context which is also cancelled when `token` is stopped.
	CallContext WithStopToken(arrow::StopToken token) const;
	// Copy of this context which is also cancelled once `check` returns true.
	CallContext WithCancelCheck(std::function<bool()> check) const;
	// Copy of this context carrying `span` as the current span.
	CallContext WithSpan(std::shared_ptr<TraceSpan> span) const;
	// Copy of this context with `key=value` appended to the log tags.
	CallContext WithLogTag(const string &key, const string &value) const;
	// Copy of this context that keeps the span and log tags but drops every cancellation source.
	CallContext Detached() const;

	bool IsCancelled() const;

	const std::shared_ptr<TraceSpan> &Span() const {
		return span;
	}
	const string &LogTags() const {
		return log_tags;
	}
	// Prefix `msg` with the log tags, e.g. "[n=1,f=1b2c3d4e] msg".
	string Annotate(const string &msg) const;

private:
	vector<arrow::StopToken> stop_tokens;
	vector<std::function<bool()>> cancel_checks;
	std::shared_ptr<TraceSpan> span;
	string log_tags;
};

} // namespace duckflow
