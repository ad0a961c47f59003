#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <arrow/builder.h>

using namespace duckflow; // NOLINT

namespace {

constexpr StreamID SORTER_INPUT = 1;
constexpr StreamID RESPONSE_STREAM = 2;

// Run `req` through RunSyncFlow and return the stream holding what the flow sent back.
unique_ptr<FakeSyncFlowServerStream> RunSync(TestServer &node, const flowpb::SetupFlowRequest &req) {
	flowpb::ConsumerSignal signal;
	*signal.mutable_setup_flow_request() = req;
	auto stream = make_uniq<FakeSyncFlowServerStream>(std::move(signal));
	node.Server().RunSyncFlow(*stream);
	return stream;
}

// Values feeding a sorter which answers the sync call.
flowpb::SetupFlowRequest SortFlow(const string &flow_id, const string &ipc, bool descending) {
	return MakeSetupRequest(
	    flow_id,
	    {ValuesSpec(1, ipc, PassThrough(Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT))),
	     SorterSpec(2, "v", descending, Unordered({Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT)}),
	                PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
}

// 0..n-1 in a scrambled order, split into batches of 100 rows.
vector<std::shared_ptr<arrow::RecordBatch>> ScrambledBatches(int64_t n) {
	vector<std::shared_ptr<arrow::RecordBatch>> batches;
	vector<int64_t> values;
	for (int64_t idx = 0; idx < n; ++idx) {
		values.emplace_back((idx * 7919) % n);
		if (values.size() == 100) {
			batches.emplace_back(MakeInt64Batch("v", values));
			values.clear();
		}
	}
	if (!values.empty()) {
		batches.emplace_back(MakeInt64Batch("v", values));
	}
	return batches;
}

vector<int64_t> Range(int64_t n) {
	vector<int64_t> values;
	for (int64_t idx = 0; idx < n; ++idx) {
		values.emplace_back(idx);
	}
	return values;
}

} // namespace

TEST_CASE("Values flow answers a sync call", "[processors]") {
	TestServer node;
	auto req = MakeSetupRequest(
	    "values", {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("v", {3, 1, 2}), MakeInt64Batch("v", {5})}),
	                          PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
	auto stream = RunSync(node, req);
	REQUIRE_FALSE(stream->FirstError().has_value());
	REQUIRE(CollectInt64(stream->Batches()) == vector<int64_t> {3, 1, 2, 5});
}

TEST_CASE("Sorter sorts in memory", "[processors]") {
	TestServer node;
	const auto ipc = MakeIPCStream(ScrambledBatches(1000));

	SECTION("ascending") {
		auto stream = RunSync(node, SortFlow("sort-asc", ipc, /*descending=*/false));
		REQUIRE_FALSE(stream->FirstError().has_value());
		REQUIRE(CollectInt64(stream->Batches()) == Range(1000));
	}
	SECTION("descending") {
		auto stream = RunSync(node, SortFlow("sort-desc", ipc, /*descending=*/true));
		REQUIRE_FALSE(stream->FirstError().has_value());
		auto expected = Range(1000);
		std::reverse(expected.begin(), expected.end());
		REQUIRE(CollectInt64(stream->Batches()) == expected);
	}
	REQUIRE(node.Server().Monitor().AllocBytes() == 0);
}

TEST_CASE("Sorter places nulls first ascending and last descending", "[processors]") {
	TestServer node;
	arrow::Int64Builder builder;
	REQUIRE(builder.Append(2).ok());
	REQUIRE(builder.AppendNull().ok());
	REQUIRE(builder.Append(1).ok());
	std::shared_ptr<arrow::Array> array;
	REQUIRE(builder.Finish(&array).ok());
	auto batch = arrow::RecordBatch::Make(arrow::schema({arrow::field("v", arrow::int64())}), 3, {array});
	const auto ipc = MakeIPCStream({batch});

	auto check = [&](bool descending, const vector<string> &expected) {
		auto stream = RunSync(node, SortFlow(descending ? "nulls-desc" : "nulls-asc", ipc, descending));
		REQUIRE_FALSE(stream->FirstError().has_value());
		vector<string> rendered;
		for (const auto &out : stream->Batches()) {
			const auto &values = static_cast<const arrow::Int64Array &>(*out->column(0));
			for (int64_t row = 0; row < values.length(); ++row) {
				rendered.emplace_back(values.IsNull(row) ? "NULL" : std::to_string(values.Value(row)));
			}
		}
		REQUIRE(rendered == expected);
	};
	check(/*descending=*/false, {"NULL", "1", "2"});
	check(/*descending=*/true, {"2", "1", "NULL"});
}

TEST_CASE("Sorter spills to temp storage when memory runs out", "[processors]") {
	TestServer node(
	    1, [](ServerConfig &config) { config.memory_budget = 16 * 1024; }, /*with_temp_storage=*/true);
	const auto ipc = MakeIPCStream(ScrambledBatches(4000));

	SECTION("without temp storage the flow fails") {
		auto stream = RunSync(node, SortFlow("no-spill", ipc, /*descending=*/false));
		auto error = stream->FirstError();
		REQUIRE(error.has_value());
		REQUIRE(error->kind() == flowpb::RESOURCE);
	}
	SECTION("with temp storage the rows come back sorted") {
		node.Execute("SET GLOBAL duckflow_use_temp_storage = true");
		REQUIRE(node.Server().UseTempStorage());

		auto stream = RunSync(node, SortFlow("spill", ipc, /*descending=*/false));
		REQUIRE_FALSE(stream->FirstError().has_value());
		REQUIRE(CollectInt64(stream->Batches()) == Range(4000));
		// Spilled rows are removed once the flow is cleaned up.
		REQUIRE(node.TempStorage()->KeyCount() == 0);
	}
	REQUIRE(node.Server().Monitor().AllocBytes() == 0);
	REQUIRE(node.Server().Monitor().NumOpenChildren() == 0);
}

TEST_CASE("Sorter rejects unknown sort columns", "[processors]") {
	TestServer node;
	auto req = MakeSetupRequest(
	    "bad-column",
	    {ValuesSpec(1, MakeIPCStream({MakeInt64Batch("w", {1})}),
	                PassThrough(Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT))),
	     SorterSpec(2, "v", false, Unordered({Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT)}),
	                PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
	auto stream = RunSync(node, req);
	auto error = stream->FirstError();
	REQUIRE(error.has_value());
	REQUIRE(error->kind() == flowpb::PROTOCOL);
	REQUIRE_THAT(error->message(), Catch::Contains("unknown column v"));
}

TEST_CASE("SQL query processor reads the node database", "[processors]") {
	TestServer node;
	node.Execute("CREATE TABLE numbers AS SELECT range AS v FROM range(100)");

	SECTION("plain query") {
		auto req = MakeSetupRequest(
		    "sql", {SqlQuerySpec(1, "SELECT v FROM numbers WHERE v % 10 = 0 ORDER BY v",
		                         PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
		auto stream = RunSync(node, req);
		REQUIRE_FALSE(stream->FirstError().has_value());
		REQUIRE(CollectInt64(stream->Batches()) == vector<int64_t> {0, 10, 20, 30, 40, 50, 60, 70, 80, 90});
	}
	SECTION("query feeding a sorter") {
		auto req = MakeSetupRequest(
		    "sql-sort",
		    {SqlQuerySpec(1, "SELECT v FROM numbers WHERE v < 5",
		                  PassThrough(Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT))),
		     SorterSpec(2, "v", /*descending=*/true,
		                Unordered({Endpoint(flowpb::StreamEndpointSpec::LOCAL, SORTER_INPUT)}),
		                PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
		auto stream = RunSync(node, req);
		REQUIRE_FALSE(stream->FirstError().has_value());
		REQUIRE(CollectInt64(stream->Batches()) == vector<int64_t> {4, 3, 2, 1, 0});
	}
	SECTION("search path from the evaluation context") {
		node.Execute("CREATE SCHEMA other");
		node.Execute("CREATE TABLE other.hidden AS SELECT 42::BIGINT AS v");
		auto req = MakeSetupRequest(
		    "sql-search-path",
		    {SqlQuerySpec(1, "SELECT v FROM hidden",
		                  PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE, RESPONSE_STREAM)))});
		req.mutable_eval_context()->add_search_path("other");
		auto stream = RunSync(node, req);
		REQUIRE_FALSE(stream->FirstError().has_value());
		REQUIRE(CollectInt64(stream->Batches()) == vector<int64_t> {42});
	}
	SECTION("query errors are sent to the consumer") {
		auto req = MakeSetupRequest(
		    "sql-error", {SqlQuerySpec(1, "SELECT * FROM no_such_table",
		                               PassThrough(Endpoint(flowpb::StreamEndpointSpec::SYNC_RESPONSE,
		                                                    RESPONSE_STREAM)))});
		auto stream = RunSync(node, req);
		auto error = stream->FirstError();
		REQUIRE(error.has_value());
		REQUIRE(error->kind() == flowpb::EXECUTION);
		REQUIRE_THAT(error->message(), Catch::Contains("no_such_table"));
	}
}
