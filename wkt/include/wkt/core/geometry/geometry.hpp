#pragma once

#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry_properties.hpp"
#include "wkt/core/geometry/geometry_type.hpp"
#include "wkt/core/geometry/vertex.hpp"

namespace wkt {

namespace core {

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
// Single part geometries (points, linestrings, rings) own a list of vertices,
// multi part geometries (polygons, multi-geometries, collections) own a list of
// child geometries. A polygon's parts are its rings, the first one being the
// shell.
class Geometry {
private:
	GeometryType type;
	GeometryProperties properties;
	int32_t srid;
	vector<Vertex> vertices;
	vector<Geometry> parts;

	Geometry(GeometryType type, GeometryProperties props, int32_t srid)
	    : type(type), properties(props), srid(srid) {
	}

public:
	// By default, create an empty 2D point
	Geometry() : type(GeometryType::POINT), properties(false, false), srid(0) {
	}

	static Geometry CreateSinglePart(GeometryType type, GeometryProperties props, int32_t srid,
	                                 vector<Vertex> vertices);
	static Geometry CreateMultiPart(GeometryType type, GeometryProperties props, int32_t srid,
	                                vector<Geometry> parts);

public:
	GeometryType GetType() const {
		return type;
	}
	const GeometryProperties &GetProperties() const {
		return properties;
	}
	int32_t GetSRID() const {
		return srid;
	}

	const vector<Vertex> &Vertices() const {
		D_ASSERT(GeometryTypes::IsSinglePart(type));
		return vertices;
	}

	const Vertex &GetVertex(idx_t index) const {
		D_ASSERT(index < vertices.size());
		return vertices[index];
	}
	const Geometry &GetPart(idx_t index) const {
		D_ASSERT(index < parts.size());
		return parts[index];
	}

	idx_t GetPartCount() const {
		return parts.size();
	}

	// Total number of vertices, recursing into parts
	idx_t GetVertexCount() const;

	// A multi part geometry is empty if all of its parts are empty
	bool IsEmpty() const;
};

} // namespace core

} // namespace wkt
