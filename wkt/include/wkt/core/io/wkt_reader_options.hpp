#pragma once
#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry_factory.hpp"

namespace wkt {

namespace core {

struct WKTReaderOptions {
	// Used when there is no generator, or the generator returns nothing.
	// Left empty, the reader substitutes a 2D CartesianFactory.
	shared_ptr<GeometryFactory> default_factory;
	// Called at most once per parse, when the factory is first needed
	FactoryGenerator factory_generator;
	// PostGIS "SRID=n;" prefix and "POINTM" style tags
	bool support_ewkt = false;
	// SFS 1.2 "POINT Z", "POINT M" and "POINT ZM" tags
	bool support_wkt12 = false;
	// Only X and Y allowed. Ignored when support_ewkt or support_wkt12 is set.
	bool strict_wkt11 = false;
	bool ignore_extra_tokens = false;
};

} // namespace core

} // namespace wkt
