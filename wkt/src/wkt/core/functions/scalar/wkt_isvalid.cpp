#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/client_context.hpp"

#include "wkt/common.hpp"
#include "wkt/core/functions/scalar.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/doc_util.hpp"

namespace wkt {

namespace core {

// Never throws on bad input, the reason is only logged
static void IsValidFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = WKTFunctionLocalState::Get(state);
	auto &context = state.GetContext();
	const auto &reader = lstate.reader;

	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(), [&](const string_t &text) {
		Geometry geom;
		string error;
		if (reader.TryParse(text.GetString(), geom, error)) {
			return true;
		}
		DUCKDB_LOG_DEBUG(context, "WKT_IsValid rejected '%s': %s", text.GetString(), error);
		return false;
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
	Returns true if the string is valid WKT under the current `wkt_*` settings.

	The reason a string is rejected is logged at DEBUG level, see `enable_logging`.
)";

static constexpr const char *DOC_EXAMPLE = R"(
	SELECT WKT_IsValid('POINT(1 2)');
	----
	true

	SELECT WKT_IsValid('FOO(1 2)');
	----
	false
)";

//------------------------------------------------------------------------------
// Register Functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterWktIsValid(DatabaseInstance &db) {
	ScalarFunctionSet set("WKT_IsValid");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, IsValidFunction,
	                               WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));
	ExtensionUtil::RegisterFunction(db, set);
	DocUtil::AddDocumentation(db, {"WKT_IsValid", DOC_DESCRIPTION, DOC_EXAMPLE, "property"});
}

} // namespace core

} // namespace wkt
