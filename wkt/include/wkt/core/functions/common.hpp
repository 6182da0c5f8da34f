#pragma once
#include "wkt/common.hpp"
#include "wkt/core/io/wkt_reader.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

namespace wkt {

namespace core {

//------------------------------------------------------------------------------
// Settings
//------------------------------------------------------------------------------
struct WKTSettings {
	static constexpr const char *SUPPORT_EWKT = "wkt_support_ewkt";
	static constexpr const char *SUPPORT_WKT12 = "wkt_support_wkt12";
	static constexpr const char *STRICT_WKT11 = "wkt_strict_wkt11";
	static constexpr const char *IGNORE_EXTRA_TOKENS = "wkt_ignore_extra_tokens";
	static constexpr const char *FACTORY_GENERATOR = "wkt_factory_generator";
	static constexpr const char *DEFAULT_DIMENSIONS = "wkt_default_dimensions";

	static void Register(DatabaseInstance &db);
};

//------------------------------------------------------------------------------
// Bind data
//------------------------------------------------------------------------------
// The reader configuration, captured from the settings when the function is bound
struct WKTReaderBindData : public FunctionData {
	bool support_ewkt = false;
	bool support_wkt12 = false;
	bool strict_wkt11 = false;
	bool ignore_extra_tokens = false;
	bool use_factory_generator = true;
	string default_dimensions = "XY";

	WKTReader CreateReader() const;

	static unique_ptr<FunctionData> Bind(ClientContext &context, ScalarFunction &bound_function,
	                                     vector<unique_ptr<Expression>> &arguments);

public:
	unique_ptr<FunctionData> Copy() const override;
	bool Equals(const FunctionData &other_p) const override;
};

//------------------------------------------------------------------------------
// Local state
//------------------------------------------------------------------------------
// Each executing thread gets its own reader
struct WKTFunctionLocalState : FunctionLocalState {
public:
	WKTReader reader;

public:
	explicit WKTFunctionLocalState(WKTReader reader) : reader(std::move(reader)) {
	}
	static unique_ptr<FunctionLocalState> Init(ExpressionState &state, const BoundFunctionExpression &expr,
	                                           FunctionData *bind_data);
	static WKTFunctionLocalState &Get(ExpressionState &state);
};

// Parses every input string and maps the geometry to a result value
template <class RESULT_TYPE, class OP>
static void ExecuteWKTFunction(DataChunk &args, ExpressionState &state, Vector &result, OP &&op) {
	auto &lstate = WKTFunctionLocalState::Get(state);
	const auto &reader = lstate.reader;
	UnaryExecutor::Execute<string_t, RESULT_TYPE>(args.data[0], result, args.size(), [&](const string_t &text) {
		const auto geom = reader.Parse(text.GetString());
		return op(geom);
	});
}

} // namespace core

} // namespace wkt
