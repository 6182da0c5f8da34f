#pragma once
#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry_factory.hpp"

namespace wkt {

namespace core {

// Plain cartesian geometries. Every geometry built is stamped with the
// factory's Z/M capabilities and SRID.
class CartesianFactory : public GeometryFactory {
private:
	GeometryProperties properties;
	int32_t srid;

	vector<Vertex> CollectVertices(const vector<Geometry> &points) const;

public:
	explicit CartesianFactory(bool has_z = false, bool has_m = false, int32_t srid = 0)
	    : properties(has_z, has_m), srid(srid) {
	}

	// Factory generator: supports exactly the axes the request marks as present
	static shared_ptr<GeometryFactory> Generate(const FactoryRequest &request);

	// Parses "XY", "XYZ", "XYM" or "XYZM" (case insensitive)
	static shared_ptr<GeometryFactory> FromDimensions(const string &dimensions, int32_t srid = 0);

	FactoryCapabilities GetCapabilities() const override {
		return FactoryCapabilities(properties.HasZ(), properties.HasM());
	}

	Geometry CreatePoint(double x, double y, const vector<double> &extra) const override;
	Geometry CreateLineString(vector<Geometry> points) const override;
	Geometry CreateLinearRing(vector<Geometry> points) const override;
	Geometry CreatePolygon(Geometry outer_ring, vector<Geometry> hole_rings) const override;
	Geometry CreateMultiPoint(vector<Geometry> points) const override;
	Geometry CreateMultiLineString(vector<Geometry> lines) const override;
	Geometry CreateMultiPolygon(vector<Geometry> polygons) const override;
	Geometry CreateCollection(vector<Geometry> geometries) const override;
};

} // namespace core

} // namespace wkt
