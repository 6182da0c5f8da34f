#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

struct CoreScalarFunctions {
public:
	static void Register(DatabaseInstance &db) {
		RegisterWktGeometryType(db);
		RegisterWktHas(db);
		RegisterWktIsValid(db);
		RegisterWktNPoints(db);
		RegisterWktSRID(db);
	}

private:
	// WKT_GeometryType
	static void RegisterWktGeometryType(DatabaseInstance &db);

	// WKT_HasZ, WKT_HasM, WKT_ZMFlag
	static void RegisterWktHas(DatabaseInstance &db);

	// WKT_IsValid
	static void RegisterWktIsValid(DatabaseInstance &db);

	// WKT_NPoints
	static void RegisterWktNPoints(DatabaseInstance &db);

	// WKT_SRID
	static void RegisterWktSRID(DatabaseInstance &db);
};

} // namespace core

} // namespace wkt
