#pragma once

#include "flow/processor.hpp"

namespace duckflow {

// Runs a query against the node-local database under the flow's database and search path.
class SqlQueryProcessor : public Processor {
public:
	SqlQueryProcessor(FlowContext &flow_ctx_p, int32_t processor_id_p, RowReceiver *output_p,
	                  const flowpb::SqlQueryCoreSpec &spec);

	string Name() const override {
		return "sql_query";
	}

protected:
	void Process(const CallContext &ctx) override;

private:
	string sql;
};

} // namespace duckflow
