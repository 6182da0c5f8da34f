#include "wkt/common.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/cartesian_factory.hpp"

#include "duckdb/execution/expression_executor_state.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

namespace wkt {

namespace core {

//------------------------------------------------------------------------------
// Settings
//------------------------------------------------------------------------------
constexpr const char *WKTSettings::SUPPORT_EWKT;
constexpr const char *WKTSettings::SUPPORT_WKT12;
constexpr const char *WKTSettings::STRICT_WKT11;
constexpr const char *WKTSettings::IGNORE_EXTRA_TOKENS;
constexpr const char *WKTSettings::FACTORY_GENERATOR;
constexpr const char *WKTSettings::DEFAULT_DIMENSIONS;

void WKTSettings::Register(DatabaseInstance &db) {
	auto &config = DBConfig::GetConfig(db);
	config.AddExtensionOption(SUPPORT_EWKT, "Accept PostGIS EWKT (SRID prefix and POINTM style tags) in WKT functions",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption(SUPPORT_WKT12, "Accept SFS 1.2 Z, M and ZM dimension tags in WKT functions",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption(STRICT_WKT11,
	                          "Only accept 2D WKT 1.1 in WKT functions (ignored when EWKT or WKT 1.2 is enabled)",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption(IGNORE_EXTRA_TOKENS, "Ignore any text following a complete geometry in WKT functions",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));
	config.AddExtensionOption(FACTORY_GENERATOR,
	                          "Build each geometry with the dimensions and SRID it declares, instead of the default",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(true));
	config.AddExtensionOption(DEFAULT_DIMENSIONS,
	                          "Dimensions of the default geometry factory used by WKT functions (XY, XYZ, XYM, XYZM)",
	                          LogicalType::VARCHAR, Value("XY"));
}

static bool GetBoolSetting(ClientContext &context, const char *name, bool default_value) {
	Value value;
	if (!context.TryGetCurrentSetting(name, value) || value.IsNull()) {
		return default_value;
	}
	return value.GetValue<bool>();
}

//------------------------------------------------------------------------------
// Bind data
//------------------------------------------------------------------------------
WKTReader WKTReaderBindData::CreateReader() const {
	WKTReaderOptions options;
	options.default_factory = CartesianFactory::FromDimensions(default_dimensions);
	if (use_factory_generator) {
		options.factory_generator = CartesianFactory::Generate;
	}
	options.support_ewkt = support_ewkt;
	options.support_wkt12 = support_wkt12;
	options.strict_wkt11 = strict_wkt11;
	options.ignore_extra_tokens = ignore_extra_tokens;
	return WKTReader(std::move(options));
}

unique_ptr<FunctionData> WKTReaderBindData::Bind(ClientContext &context, ScalarFunction &bound_function,
                                                 vector<unique_ptr<Expression>> &arguments) {
	auto result = make_uniq<WKTReaderBindData>();
	result->support_ewkt = GetBoolSetting(context, WKTSettings::SUPPORT_EWKT, false);
	result->support_wkt12 = GetBoolSetting(context, WKTSettings::SUPPORT_WKT12, false);
	result->strict_wkt11 = GetBoolSetting(context, WKTSettings::STRICT_WKT11, false);
	result->ignore_extra_tokens = GetBoolSetting(context, WKTSettings::IGNORE_EXTRA_TOKENS, false);
	result->use_factory_generator = GetBoolSetting(context, WKTSettings::FACTORY_GENERATOR, true);

	Value dimensions;
	if (context.TryGetCurrentSetting(WKTSettings::DEFAULT_DIMENSIONS, dimensions) && !dimensions.IsNull()) {
		result->default_dimensions = StringUtil::Upper(dimensions.ToString());
	}
	// Fail at bind time rather than for every row
	CartesianFactory::FromDimensions(result->default_dimensions);

	DUCKDB_LOG_DEBUG(context, "%s: ewkt=%s wkt12=%s strict=%s ignore_extra_tokens=%s generator=%s dimensions=%s",
	                 bound_function.name, result->support_ewkt ? "true" : "false",
	                 result->support_wkt12 ? "true" : "false", result->strict_wkt11 ? "true" : "false",
	                 result->ignore_extra_tokens ? "true" : "false",
	                 result->use_factory_generator ? "true" : "false", result->default_dimensions);

	return std::move(result);
}

unique_ptr<FunctionData> WKTReaderBindData::Copy() const {
	auto result = make_uniq<WKTReaderBindData>();
	result->support_ewkt = support_ewkt;
	result->support_wkt12 = support_wkt12;
	result->strict_wkt11 = strict_wkt11;
	result->ignore_extra_tokens = ignore_extra_tokens;
	result->use_factory_generator = use_factory_generator;
	result->default_dimensions = default_dimensions;
	return std::move(result);
}

bool WKTReaderBindData::Equals(const FunctionData &other_p) const {
	auto &other = other_p.Cast<WKTReaderBindData>();
	return support_ewkt == other.support_ewkt && support_wkt12 == other.support_wkt12 &&
	       strict_wkt11 == other.strict_wkt11 && ignore_extra_tokens == other.ignore_extra_tokens &&
	       use_factory_generator == other.use_factory_generator && default_dimensions == other.default_dimensions;
}

//------------------------------------------------------------------------------
// Local state
//------------------------------------------------------------------------------
unique_ptr<FunctionLocalState> WKTFunctionLocalState::Init(ExpressionState &state, const BoundFunctionExpression &expr,
                                                           FunctionData *bind_data) {
	auto &info = bind_data->Cast<WKTReaderBindData>();
	return make_uniq<WKTFunctionLocalState>(info.CreateReader());
}

WKTFunctionLocalState &WKTFunctionLocalState::Get(ExpressionState &state) {
	return ExecuteFunctionState::GetFunctionState(state)->Cast<WKTFunctionLocalState>();
}

} // namespace core

} // namespace wkt
