#pragma once
#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry.hpp"

#include <functional>

namespace wkt {

namespace core {

// Tri-state used for the Z and M expectations of a parse
enum class DimensionFlag : uint8_t { UNKNOWN = 0, ABSENT, PRESENT };

struct DimensionFlags {
	static DimensionFlag FromBool(bool value) {
		return value ? DimensionFlag::PRESENT : DimensionFlag::ABSENT;
	}
};

struct FactoryCapabilities {
	bool has_z;
	bool has_m;

	FactoryCapabilities() : has_z(false), has_m(false) {
	}
	FactoryCapabilities(bool has_z, bool has_m) : has_z(has_z), has_m(has_m) {
	}
};

// What a factory generator gets to decide on. The dimension flags may still be
// UNKNOWN if nothing in the input has declared them yet.
struct FactoryRequest {
	bool has_srid = false;
	int32_t srid = 0;
	DimensionFlag z = DimensionFlag::UNKNOWN;
	DimensionFlag m = DimensionFlag::UNKNOWN;
};

//------------------------------------------------------------------------------
// GeometryFactory
//------------------------------------------------------------------------------
// Builds the geometries handed out by the WKT reader. The reader never looks
// inside what the factory returns, it only passes the results back in as parts
// of bigger geometries.
class GeometryFactory {
public:
	virtual ~GeometryFactory() = default;

	virtual FactoryCapabilities GetCapabilities() const = 0;

	// extra holds the ordinates beyond x and y for the axes this factory
	// supports, in (z, m) order. Trailing ones may be missing.
	virtual Geometry CreatePoint(double x, double y, const vector<double> &extra) const = 0;
	virtual Geometry CreateLineString(vector<Geometry> points) const = 0;
	virtual Geometry CreateLinearRing(vector<Geometry> points) const = 0;
	virtual Geometry CreatePolygon(Geometry outer_ring, vector<Geometry> hole_rings) const = 0;
	virtual Geometry CreateMultiPoint(vector<Geometry> points) const = 0;
	virtual Geometry CreateMultiLineString(vector<Geometry> lines) const = 0;
	virtual Geometry CreateMultiPolygon(vector<Geometry> polygons) const = 0;
	virtual Geometry CreateCollection(vector<Geometry> geometries) const = 0;
};

// Returning nullptr makes the reader fall back to its default factory
using FactoryGenerator = std::function<shared_ptr<GeometryFactory>(const FactoryRequest &request)>;

} // namespace core

} // namespace wkt
