#include "utils/tracing.hpp"

namespace duckflow {

TraceSpan::TraceSpan(BaseTracer &tracer_p, string operation_p, uint64_t span_id_p, uint64_t parent_span_id_p,
                     SpanRelation relation_p)
    : tracer(tracer_p), operation(std::move(operation_p)), span_id(span_id_p), parent_span_id(parent_span_id_p),
      relation(relation_p), start_time(std::chrono::steady_clock::now()) {
}

void TraceSpan::Finish() {
	if (finished.exchange(true)) {
		return;
	}
	const auto duration = std::chrono::steady_clock::now() - start_time;
	FinishedSpan finished_span {
	    operation, span_id, parent_span_id, relation,
	    static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(duration).count())};
	tracer.open_spans.fetch_sub(1);
	tracer.RecordFinish(std::move(finished_span));
}

std::shared_ptr<TraceSpan> BaseTracer::StartSpan(string operation) {
	open_spans.fetch_add(1);
	return std::make_shared<TraceSpan>(*this, std::move(operation), next_span_id.fetch_add(1), /*parent_span_id=*/0,
	                                   SpanRelation::ROOT);
}

std::shared_ptr<TraceSpan> BaseTracer::StartFollowsFromSpan(string operation, const TraceSpan &parent) {
	open_spans.fetch_add(1);
	return std::make_shared<TraceSpan>(*this, std::move(operation), next_span_id.fetch_add(1), parent.SpanID(),
	                                   SpanRelation::FOLLOWS_FROM);
}

vector<FinishedSpan> NoopTracer::GetFinishedSpans() const {
	return {};
}

void NoopTracer::RecordFinish(FinishedSpan span) {
}

vector<FinishedSpan> LocalTracer::GetFinishedSpans() const {
	const std::lock_guard<std::mutex> lck(mu);
	return finished_spans;
}

void LocalTracer::RecordFinish(FinishedSpan span) {
	const std::lock_guard<std::mutex> lck(mu);
	finished_spans.emplace_back(std::move(span));
}

} // namespace duckflow
