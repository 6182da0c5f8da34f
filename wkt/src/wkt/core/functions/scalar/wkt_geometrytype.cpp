#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"
#include "wkt/common.hpp"
#include "wkt/core/functions/scalar.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/doc_util.hpp"

namespace wkt {

namespace core {

static void GeometryTypeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteWKTFunction<string_t>(args, state, result, [&](const Geometry &geom) {
		return StringVector::AddString(result, GeometryTypes::ToString(geom.GetType()));
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
	Returns the type of the geometry described by a WKT string.

	An empty POINT is reported as a MULTIPOINT.
)";

static constexpr const char *DOC_EXAMPLE = R"(
	SELECT WKT_GeometryType('POLYGON((0 0, 1 0, 1 1, 0 0))');
	----
	POLYGON

	SELECT WKT_GeometryType('POINT EMPTY');
	----
	MULTIPOINT
)";

//------------------------------------------------------------------------------
// Register Functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterWktGeometryType(DatabaseInstance &db) {
	ScalarFunctionSet set("WKT_GeometryType");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, GeometryTypeFunction,
	                               WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));
	ExtensionUtil::RegisterFunction(db, set);
	DocUtil::AddDocumentation(db, {"WKT_GeometryType", DOC_DESCRIPTION, DOC_EXAMPLE, "property"});
}

} // namespace core

} // namespace wkt
