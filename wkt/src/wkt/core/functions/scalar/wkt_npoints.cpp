#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"
#include "wkt/common.hpp"
#include "wkt/core/functions/scalar.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/doc_util.hpp"

namespace wkt {

namespace core {

static void NumPointsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteWKTFunction<uint64_t>(args, state, result,
	                             [](const Geometry &geom) { return static_cast<uint64_t>(geom.GetVertexCount()); });
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
	Returns the number of vertices in the geometry described by a WKT string.
)";

static constexpr const char *DOC_EXAMPLE = R"(
	SELECT WKT_NPoints('LINESTRING(0 0, 1 1, 2 2)');
	----
	3
)";

//------------------------------------------------------------------------------
// Register Functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterWktNPoints(DatabaseInstance &db) {
	ScalarFunctionSet set("WKT_NPoints");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::UBIGINT, NumPointsFunction,
	                               WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));
	ExtensionUtil::RegisterFunction(db, set);
	DocUtil::AddDocumentation(db, {"WKT_NPoints", DOC_DESCRIPTION, DOC_EXAMPLE, "property"});
}

} // namespace core

} // namespace wkt
