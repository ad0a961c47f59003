#include "utils/call_context.hpp"

#include "utils/tracing.hpp"

namespace duckflow {

CallContext CallContext::WithStopToken(arrow::StopToken token) const {
	CallContext ctx = *this;
	ctx.stop_tokens.emplace_back(std::move(token));
	return ctx;
}

CallContext CallContext::WithCancelCheck(std::function<bool()> check) const {
	CallContext ctx = *this;
	ctx.cancel_checks.emplace_back(std::move(check));
	return ctx;
}

CallContext CallContext::WithSpan(std::shared_ptr<TraceSpan> span_p) const {
	CallContext ctx = *this;
	ctx.span = std::move(span_p);
	return ctx;
}

CallContext CallContext::WithLogTag(const string &key, const string &value) const {
	CallContext ctx = *this;
	if (!ctx.log_tags.empty()) {
		ctx.log_tags += ",";
	}
	ctx.log_tags += StringUtil::Format("%s=%s", key, value);
	return ctx;
}

CallContext CallContext::Detached() const {
	CallContext ctx;
	ctx.span = span;
	ctx.log_tags = log_tags;
	return ctx;
}

bool CallContext::IsCancelled() const {
	for (const auto &token : stop_tokens) {
		if (token.IsStopRequested()) {
			return true;
		}
	}
	for (const auto &check : cancel_checks) {
		if (check()) {
			return true;
		}
	}
	return false;
}

string CallContext::Annotate(const string &msg) const {
	if (log_tags.empty()) {
		return msg;
	}
	return StringUtil::Format("[%s] %s", log_tags, msg);
}

} // namespace duckflow
