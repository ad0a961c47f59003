// Tracer which records the spans opened by flows.

#pragma once

#include "duckflow_common.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace duckflow {

// Forward declaration.
class BaseTracer;

enum class SpanRelation : uint8_t {
	ROOT,
	FOLLOWS_FROM,
};

// A span opened by a tracer. The owner must call Finish() once the traced operation completes; further
// calls are no-ops.
class TraceSpan {
public:
	TraceSpan(BaseTracer &tracer_p, string operation_p, uint64_t span_id_p, uint64_t parent_span_id_p,
	          SpanRelation relation_p);

	TraceSpan(const TraceSpan &) = delete;
	TraceSpan &operator=(const TraceSpan &) = delete;

	void Finish();
	bool IsFinished() const {
		return finished.load();
	}

	const string &Operation() const {
		return operation;
	}
	uint64_t SpanID() const {
		return span_id;
	}
	uint64_t ParentSpanID() const {
		return parent_span_id;
	}
	SpanRelation Relation() const {
		return relation;
	}

private:
	BaseTracer &tracer;
	string operation;
	uint64_t span_id;
	uint64_t parent_span_id;
	SpanRelation relation;
	std::chrono::steady_clock::time_point start_time;
	std::atomic<bool> finished {false};
};

// Record of one finished span.
struct FinishedSpan {
	string operation;
	uint64_t span_id;
	uint64_t parent_span_id;
	SpanRelation relation;
	uint64_t duration_micros;
};

class BaseTracer {
public:
	BaseTracer() = default;
	virtual ~BaseTracer() = default;

	// Start a span without parent.
	std::shared_ptr<TraceSpan> StartSpan(string operation);

	// Start a span causally following `parent` without being part of it.
	std::shared_ptr<TraceSpan> StartFollowsFromSpan(string operation, const TraceSpan &parent);

	// Get all finished spans.
	virtual vector<FinishedSpan> GetFinishedSpans() const = 0;

	// Number of spans started and not yet finished.
	int64_t NumOpenSpans() const {
		return open_spans.load();
	}

private:
	friend TraceSpan;

	// Mark the completion of a span.
	virtual void RecordFinish(FinishedSpan span) = 0;

	std::atomic<uint64_t> next_span_id {1};
	std::atomic<int64_t> open_spans {0};
};

class NoopTracer : public BaseTracer {
public:
	NoopTracer() = default;
	~NoopTracer() override = default;

	vector<FinishedSpan> GetFinishedSpans() const override;

private:
	void RecordFinish(FinishedSpan span) override;
};

// Tracer which keeps finished spans in memory.
class LocalTracer : public BaseTracer {
public:
	LocalTracer() = default;
	~LocalTracer() override = default;

	vector<FinishedSpan> GetFinishedSpans() const override;

private:
	void RecordFinish(FinishedSpan span) override;

	mutable std::mutex mu;
	vector<FinishedSpan> finished_spans;
};

} // namespace duckflow
