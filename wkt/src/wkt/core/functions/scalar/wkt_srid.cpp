#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"
#include "wkt/common.hpp"
#include "wkt/core/functions/scalar.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/doc_util.hpp"

namespace wkt {

namespace core {

static void SRIDFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteWKTFunction<int32_t>(args, state, result, [](const Geometry &geom) { return geom.GetSRID(); });
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
	Returns the SRID of the geometry described by a WKT string, or 0 if it has none.

	Only EWKT carries an SRID, so this requires `SET wkt_support_ewkt = true`.
)";

static constexpr const char *DOC_EXAMPLE = R"(
	SET wkt_support_ewkt = true;
	SELECT WKT_SRID('SRID=4326;POINT(1 2)');
	----
	4326
)";

//------------------------------------------------------------------------------
// Register Functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterWktSRID(DatabaseInstance &db) {
	ScalarFunctionSet set("WKT_SRID");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::INTEGER, SRIDFunction,
	                               WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));
	ExtensionUtil::RegisterFunction(db, set);
	DocUtil::AddDocumentation(db, {"WKT_SRID", DOC_DESCRIPTION, DOC_EXAMPLE, "property"});
}

} // namespace core

} // namespace wkt
