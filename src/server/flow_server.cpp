#include "server/flow_server.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"
#include "flow/inbound.hpp"
#include "flow/outbox.hpp"
#include "utils/error_utils.hpp"
#include "utils/stopper.hpp"
#include "utils/time_zone.hpp"

#include <cstdlib>

namespace duckflow {

namespace {

int64_t NoteworthyMemoryUsageFromEnv() {
	const char *env = std::getenv(NOTEWORTHY_MEMORY_USAGE_ENV);
	if (env == nullptr || *env == '\0') {
		return DEFAULT_NOTEWORTHY_MEMORY_USAGE;
	}
	char *end = nullptr;
	const long long value = std::strtoll(env, &end, 10);
	if (*end != '\0' || value < 0) {
		throw InvalidInputException("%s must be a non-negative number of bytes, got %s", NOTEWORTHY_MEMORY_USAGE_ENV,
		                            env);
	}
	return value;
}

void RegisterSettings(duckdb::DatabaseInstance &db_instance, idx_t max_running_flows) {
	auto &db_config = duckdb::DBConfig::GetConfig(db_instance);
	db_config.AddExtensionOption(USE_TEMP_STORAGE_SETTING,
	                             "set to true to enable use of disk for larger distributed sql queries",
	                             duckdb::LogicalType::BOOLEAN, duckdb::Value::BOOLEAN(false));
	db_config.AddExtensionOption(MAX_RUNNING_FLOWS_SETTING,
	                             "maximum number of asynchronous flows running concurrently on this node",
	                             duckdb::LogicalType::UBIGINT, duckdb::Value::UBIGINT(max_running_flows));
}

// Failures after the request passed validation are deployment failures, unless memory or the caller gave out.
[[noreturn]] void RethrowAsDeploymentError(std::exception &ex) {
	duckdb::ErrorData error(ex);
	if (error.Type() == duckdb::ExceptionType::OUT_OF_MEMORY || error.Type() == duckdb::ExceptionType::INTERRUPT) {
		throw;
	}
	throw IOException(error.RawMessage());
}

} // namespace

ServerImpl::ServerImpl(ServerConfig config_p)
    : config(std::move(config_p)), db_instance(*config.db->instance),
      noteworthy_memory_usage(NoteworthyMemoryUsageFromEnv()),
      memory_monitor("flow-server", /*increment_p=*/-1, /*noteworthy_usage_bytes_p=*/0, &db_instance),
      regexp_cache(DEFAULT_REGEXP_CACHE_SIZE) {
	if (config.node_id == nullptr || config.stopper == nullptr) {
		throw InternalException("ServerConfig requires a node ID container and a stopper");
	}
	if (config.client_db == nullptr) {
		owned_client_db = make_uniq<FlowDB>(*config.db, "client", /*bypass_txn_coordinator_p=*/false);
		config.client_db = owned_client_db.get();
	}
	if (config.flow_db == nullptr) {
		owned_flow_db = make_uniq<FlowDB>(*config.db, "flow", /*bypass_txn_coordinator_p=*/true);
		config.flow_db = owned_flow_db.get();
	}
	if (config.tracer == nullptr) {
		owned_tracer = make_uniq<NoopTracer>();
		config.tracer = owned_tracer.get();
	}

	RegisterSettings(db_instance, config.max_running_flows);
	settings_conn = make_uniq<duckdb::Connection>(*config.db);
	registry = make_uniq<FlowRegistry>(db_instance);
	scheduler = make_uniq<FlowScheduler>(db_instance, *config.stopper, config.max_running_flows);
}

ServerImpl::~ServerImpl() = default;

void ServerImpl::Start() {
	memory_monitor.Start(config.parent_memory_monitor, config.memory_budget);
	scheduler->Start();
}

bool ServerImpl::UseTempStorage() {
	std::lock_guard<std::mutex> lck(settings_mu);
	duckdb::Value value;
	if (!settings_conn->context->TryGetCurrentSetting(USE_TEMP_STORAGE_SETTING, value) || value.IsNull()) {
		return false;
	}
	return value.GetValue<bool>();
}

idx_t ServerImpl::MaxRunningFlows() {
	std::lock_guard<std::mutex> lck(settings_mu);
	duckdb::Value value;
	if (!settings_conn->context->TryGetCurrentSetting(MAX_RUNNING_FLOWS_SETTING, value) || value.IsNull()) {
		return config.max_running_flows;
	}
	return value.GetValue<uint64_t>();
}

std::chrono::milliseconds ServerImpl::FlowStreamTimeout() const {
	if (config.testing_knobs.flow_stream_timeout.count() > 0) {
		return config.testing_knobs.flow_stream_timeout;
	}
	return config.flow_stream_timeout;
}

CallContext ServerImpl::ServerCtx(const CallContext &ctx) const {
	return ctx.WithLogTag("n", std::to_string(NodeID()));
}

FlowSetupResult ServerImpl::SetupFlowInternal(const CallContext &ctx, const TraceSpan *parent_span,
                                              const flowpb::SetupFlowRequest &req, RowReceiver *sync_output) {
	if (req.version() < MIN_ACCEPTED_VERSION || req.version() > VERSION) {
		const auto msg =
		    StringUtil::Format("version mismatch in flow request: %d; this node accepts %d through %d",
		                       req.version(), MIN_ACCEPTED_VERSION, VERSION);
		DUCKDB_LOG_WARN(db_instance, ctx.Annotate(msg));
		throw InvalidInputException(msg);
	}
	const int32_t node_id = NodeID();
	if (node_id == 0) {
		throw InternalException("setupFlow called before the NodeID was resolved");
	}
	if (req.flow().flow_id().empty()) {
		throw InvalidInputException("flow request has no flow ID");
	}

	auto span = parent_span == nullptr ? config.tracer->StartSpan("flow")
	                                   : config.tracer->StartFollowsFromSpan("flow", *parent_span);

	auto monitor = make_uniq<MemoryMonitor>("flow", /*increment_p=*/-1, noteworthy_memory_usage, &db_instance);
	monitor->Start(&memory_monitor);
	auto acc = monitor->MakeBoundAccount();

	const auto &req_eval_ctx = req.eval_context();
	TimeZoneLocation location;
	try {
		location = TimeZoneStringToLocation(req_eval_ctx.location());
	} catch (std::exception &ex) {
		// No flow exists yet to release these.
		acc.Close();
		monitor->Stop();
		span->Finish();
		RethrowAsDeploymentError(ex);
	}

	auto flow_ctx = make_uniq<FlowContext>(db_instance);
	flow_ctx->id = req.flow().flow_id();
	auto &eval_ctx = flow_ctx->eval_ctx;
	eval_ctx.location = std::move(location);
	eval_ctx.database = req_eval_ctx.database();
	eval_ctx.search_path.assign(req_eval_ctx.search_path().begin(), req_eval_ctx.search_path().end());
	eval_ctx.cluster_id = config.cluster_id;
	eval_ctx.node_id = node_id;
	eval_ctx.re_cache = &regexp_cache;
	eval_ctx.mon = std::move(monitor);
	eval_ctx.active_mem_acc = std::move(acc);
	eval_ctx.stmt_timestamp = duckdb::Timestamp::FromEpochNanoSeconds(req_eval_ctx.stmt_timestamp_nanos());
	eval_ctx.txn_timestamp = duckdb::Timestamp::FromEpochNanoSeconds(req_eval_ctx.txn_timestamp_nanos());
	eval_ctx.cluster_timestamp = req_eval_ctx.cluster_timestamp();

	flow_ctx->txn = req.txn();
	flow_ctx->client_db = config.client_db;
	flow_ctx->remote_txn_db = config.flow_db;
	flow_ctx->node_id = node_id;
	flow_ctx->temp_storage = config.temp_storage;
	flow_ctx->use_temp_storage = UseTempStorage();
	flow_ctx->temp_storage_id_gen = &temp_storage_id_gen;
	flow_ctx->testing_knobs = &config.testing_knobs;
	flow_ctx->dialer = config.dialer;

	auto flow = std::make_shared<Flow>(std::move(flow_ctx), *registry, sync_output, span, FlowStreamTimeout());
	auto flow_call_ctx = flow->AnnotateCtx(ctx).WithSpan(span);
	try {
		if (config.testing_knobs.before_flow_setup) {
			config.testing_knobs.before_flow_setup(req);
		}
		flow->Setup(flow_call_ctx, req.flow());
	} catch (std::exception &ex) {
		DUCKDB_LOG_ERROR(db_instance, flow_call_ctx.Annotate(StringUtil::Format(
		                                  "error setting up flow: %s", duckdb::ErrorData(ex).Message())));
		flow->Cleanup(flow_call_ctx);
		RethrowAsDeploymentError(ex);
	}
	return FlowSetupResult {std::move(flow_call_ctx), std::move(flow)};
}

FlowSetupResult ServerImpl::SetupSyncFlow(const CallContext &ctx, const flowpb::SetupFlowRequest &req,
                                          RowReceiver &output) {
	return SetupFlowInternal(ServerCtx(ctx), ctx.Span().get(), req, &output);
}

void ServerImpl::RunSyncFlow(SyncFlowServerStream &stream) {
	flowpb::ConsumerSignal first_msg;
	if (!stream.Recv(first_msg) || !first_msg.has_setup_flow_request()) {
		throw InvalidInputException("first message in RunSyncFlow doesn't contain SetupFlowRequest");
	}

	// Node shutdown cancels the flow like the caller going away does.
	auto ctx = stream.Context().WithStopToken(config.stopper->ShouldQuiesce());
	OutboxSyncFlowStream sync_stream(stream);
	Outbox outbox(sync_stream);

	config.stopper->RunTask("RunSyncFlow", [&]() {
		auto result = SetupSyncFlow(ctx, first_msg.setup_flow_request(), outbox);
		try {
			result.flow->Start(result.ctx);
			result.flow->Wait(result.ctx);
		} catch (std::exception &) {
			result.flow->Cleanup(result.ctx);
			throw;
		}
		result.flow->Cleanup(result.ctx);
	});
	sync_stream.ThrowIfError();
}

flowpb::SimpleResponse ServerImpl::SetupFlow(const CallContext &ctx, const flowpb::SetupFlowRequest &req) {
	flowpb::SimpleResponse response;
	try {
		// The flow outlives this call: it must not be cancelled when the caller goes away.
		auto result = SetupFlowInternal(ServerCtx(ctx.Detached()), ctx.Span().get(), req, /*sync_output=*/nullptr);
		scheduler->SetMaxRunningFlows(MaxRunningFlows());
		try {
			scheduler->ScheduleFlow(result.ctx, result.flow);
		} catch (std::exception &) {
			result.flow->Cleanup(result.ctx);
			throw;
		}
	} catch (std::exception &ex) {
		auto error = FlowErrorFromException(ex);
		if (error.kind() != flowpb::PROTOCOL && error.kind() != flowpb::RESOURCE) {
			error.set_kind(flowpb::DEPLOYMENT);
		}
		*response.mutable_error() = std::move(error);
	}
	return response;
}

void ServerImpl::FlowStream(FlowStreamServerStream &stream) {
	ProducerMessage first_msg;
	if (!stream.Recv(first_msg)) {
		throw InvalidInputException("missing header message");
	}
	if (!first_msg.header.has_value() || first_msg.header->flow_id().empty()) {
		throw InvalidInputException("no header in first message");
	}
	const auto flow_id = first_msg.header->flow_id();
	const StreamID stream_id = first_msg.header->stream_id();

	auto ctx = ServerCtx(stream.Context());
	auto conn = registry->ConnectInboundStream(ctx, flow_id, stream_id, FlowStreamTimeout());
	struct ReleaseGuard {
		std::function<void()> &release;
		~ReleaseGuard() {
			release();
		}
	} guard {conn.release};

	auto flow_ctx = conn.flow->AnnotateCtx(ctx).WithSpan(conn.flow->Span());
	try {
		ProcessInboundStream(flow_ctx, stream, std::move(first_msg), *conn.receiver);
	} catch (std::exception &ex) {
		DUCKDB_LOG_ERROR(db_instance, flow_ctx.Annotate(StringUtil::Format("inbound stream %d error: %s", stream_id,
		                                                                   duckdb::ErrorData(ex).Message())));
		throw;
	}
}

bool ServerImpl::CancelFlow(const string &flow_id) {
	auto flow = registry->LookupFlow(flow_id);
	if (flow != nullptr) {
		flow->Cancel();
		return true;
	}
	return scheduler->CancelQueuedFlow(flow_id);
}

} // namespace duckflow
