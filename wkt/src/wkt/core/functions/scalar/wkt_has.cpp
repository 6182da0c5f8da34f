#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"

#include "wkt/common.hpp"
#include "wkt/core/functions/scalar.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/doc_util.hpp"

namespace wkt {

namespace core {

template <bool HAS_Z_NOT_M>
static void HasFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteWKTFunction<bool>(args, state, result, [](const Geometry &geom) {
		const auto &props = geom.GetProperties();
		return HAS_Z_NOT_M ? props.HasZ() : props.HasM();
	});
}

static void ZMFlagFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteWKTFunction<uint8_t>(args, state, result,
	                            [](const Geometry &geom) { return geom.GetProperties().ZMFlag(); });
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
// HAS_Z
static constexpr const char *HAS_Z_DESCRIPTION = R"(
	Check if the geometry described by a WKT string has Z values.
)";

static constexpr const char *HAS_Z_EXAMPLE = R"(
	-- HasZ for a 2D geometry
	SELECT WKT_HasZ('POINT(1 1)');
	----
	false

	-- HasZ for an untagged 3D geometry, the third ordinate is Z
	SELECT WKT_HasZ('POINT(1 1 1)');
	----
	true

	-- HasZ for a 3DM geometry
	SET wkt_support_wkt12 = true;
	SELECT WKT_HasZ('POINT M(1 1 1)');
	----
	false
)";

// HAS_M
static constexpr const char *HAS_M_DESCRIPTION = R"(
	Check if the geometry described by a WKT string has M values.
)";

static constexpr const char *HAS_M_EXAMPLE = R"(
	-- HasM for a 2D geometry
	SELECT WKT_HasM('POINT(1 1)');
	----
	false

	-- HasM for a 4D geometry
	SELECT WKT_HasM('POINT(1 1 1 1)');
	----
	true

	-- HasM for an EWKT 3DM geometry
	SET wkt_support_ewkt = true;
	SELECT WKT_HasM('POINTM(1 1 1)');
	----
	true
)";

// ZMFLAG
static constexpr const char *ZMFLAG_DESCRIPTION = R"(
	Returns a flag indicating the presence of Z and M values in the geometry described by a WKT string.
	0 = No Z or M values
	1 = M values only
	2 = Z values only
	3 = Z and M values
)";

static constexpr const char *ZMFLAG_EXAMPLE = R"(
	SET wkt_support_wkt12 = true;

	SELECT WKT_ZMFlag('POINT(1 1)');
	----
	0

	SELECT WKT_ZMFlag('POINT M(1 1 1)');
	----
	1

	SELECT WKT_ZMFlag('POINT Z(1 1 1)');
	----
	2

	SELECT WKT_ZMFlag('POINT ZM(1 1 1 1)');
	----
	3
)";

//------------------------------------------------------------------------------
// Register Functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterWktHas(DatabaseInstance &db) {
	ScalarFunctionSet wkt_hasz("WKT_HasZ");
	wkt_hasz.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, HasFunction<true>,
	                                    WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));

	ScalarFunctionSet wkt_hasm("WKT_HasM");
	wkt_hasm.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, HasFunction<false>,
	                                    WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));

	ScalarFunctionSet wkt_zmflag("WKT_ZMFlag");
	wkt_zmflag.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::UTINYINT, ZMFlagFunction,
	                                      WKTReaderBindData::Bind, nullptr, nullptr, WKTFunctionLocalState::Init));

	ExtensionUtil::RegisterFunction(db, wkt_hasz);
	ExtensionUtil::RegisterFunction(db, wkt_hasm);
	ExtensionUtil::RegisterFunction(db, wkt_zmflag);

	DocUtil::AddDocumentation(db, {"WKT_HasZ", HAS_Z_DESCRIPTION, HAS_Z_EXAMPLE, "property"});
	DocUtil::AddDocumentation(db, {"WKT_HasM", HAS_M_DESCRIPTION, HAS_M_EXAMPLE, "property"});
	DocUtil::AddDocumentation(db, {"WKT_ZMFlag", ZMFLAG_DESCRIPTION, ZMFLAG_EXAMPLE, "property"});
}

} // namespace core

} // namespace wkt
