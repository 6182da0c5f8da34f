#include "wkt/common.hpp"
#include "wkt/core/geometry/cartesian_factory.hpp"

namespace wkt {

namespace core {

static void CheckPartTypes(const vector<Geometry> &parts, GeometryType expected, GeometryType target) {
	for (auto &part : parts) {
		if (part.GetType() != expected) {
			throw InvalidInputException("Cannot add a %s to a %s", GeometryTypes::ToString(part.GetType()),
			                            GeometryTypes::ToString(target));
		}
	}
}

shared_ptr<GeometryFactory> CartesianFactory::Generate(const FactoryRequest &request) {
	const auto has_z = request.z == DimensionFlag::PRESENT;
	const auto has_m = request.m == DimensionFlag::PRESENT;
	return make_shared_ptr<CartesianFactory>(has_z, has_m, request.has_srid ? request.srid : 0);
}

shared_ptr<GeometryFactory> CartesianFactory::FromDimensions(const string &dimensions, int32_t srid) {
	auto dims = StringUtil::Upper(dimensions);
	if (dims == "XY") {
		return make_shared_ptr<CartesianFactory>(false, false, srid);
	}
	if (dims == "XYZ") {
		return make_shared_ptr<CartesianFactory>(true, false, srid);
	}
	if (dims == "XYM") {
		return make_shared_ptr<CartesianFactory>(false, true, srid);
	}
	if (dims == "XYZM") {
		return make_shared_ptr<CartesianFactory>(true, true, srid);
	}
	throw InvalidInputException("Unknown dimensions '%s', expected one of XY, XYZ, XYM or XYZM", dimensions);
}

vector<Vertex> CartesianFactory::CollectVertices(const vector<Geometry> &points) const {
	vector<Vertex> vertices;
	vertices.reserve(points.size());
	for (auto &point : points) {
		if (point.GetType() != GeometryType::POINT) {
			throw InvalidInputException("Expected a POINT as vertex, got a %s", GeometryTypes::ToString(point.GetType()));
		}
		if (point.IsEmpty()) {
			throw InvalidInputException("Cannot use an empty POINT as vertex");
		}
		vertices.push_back(point.GetVertex(0));
	}
	return vertices;
}

Geometry CartesianFactory::CreatePoint(double x, double y, const vector<double> &extra) const {
	const auto max_extra = properties.Dimensions() - 2;
	if (extra.size() > max_extra) {
		throw InvalidInputException("Point has %d extra ordinates but the factory only supports %d", extra.size(),
		                            max_extra);
	}
	Vertex vertex(x, y);
	idx_t i = 0;
	if (properties.HasZ() && i < extra.size()) {
		vertex.z = extra[i++];
	}
	if (properties.HasM() && i < extra.size()) {
		vertex.m = extra[i++];
	}
	vector<Vertex> vertices;
	vertices.push_back(vertex);
	return Geometry::CreateSinglePart(GeometryType::POINT, properties, srid, std::move(vertices));
}

Geometry CartesianFactory::CreateLineString(vector<Geometry> points) const {
	return Geometry::CreateSinglePart(GeometryType::LINESTRING, properties, srid, CollectVertices(points));
}

Geometry CartesianFactory::CreateLinearRing(vector<Geometry> points) const {
	return Geometry::CreateSinglePart(GeometryType::LINEARRING, properties, srid, CollectVertices(points));
}

Geometry CartesianFactory::CreatePolygon(Geometry outer_ring, vector<Geometry> hole_rings) const {
	vector<Geometry> rings;
	rings.reserve(hole_rings.size() + 1);
	rings.push_back(std::move(outer_ring));
	for (auto &hole : hole_rings) {
		rings.push_back(std::move(hole));
	}
	for (auto &ring : rings) {
		if (ring.GetType() == GeometryType::LINESTRING) {
			// Retag as a ring, closure is not checked
			ring = Geometry::CreateSinglePart(GeometryType::LINEARRING, ring.GetProperties(), ring.GetSRID(),
			                                  ring.Vertices());
		} else if (ring.GetType() != GeometryType::LINEARRING) {
			throw InvalidInputException("Cannot use a %s as polygon ring", GeometryTypes::ToString(ring.GetType()));
		}
	}
	return Geometry::CreateMultiPart(GeometryType::POLYGON, properties, srid, std::move(rings));
}

Geometry CartesianFactory::CreateMultiPoint(vector<Geometry> points) const {
	CheckPartTypes(points, GeometryType::POINT, GeometryType::MULTIPOINT);
	return Geometry::CreateMultiPart(GeometryType::MULTIPOINT, properties, srid, std::move(points));
}

Geometry CartesianFactory::CreateMultiLineString(vector<Geometry> lines) const {
	CheckPartTypes(lines, GeometryType::LINESTRING, GeometryType::MULTILINESTRING);
	return Geometry::CreateMultiPart(GeometryType::MULTILINESTRING, properties, srid, std::move(lines));
}

Geometry CartesianFactory::CreateMultiPolygon(vector<Geometry> polygons) const {
	CheckPartTypes(polygons, GeometryType::POLYGON, GeometryType::MULTIPOLYGON);
	return Geometry::CreateMultiPart(GeometryType::MULTIPOLYGON, properties, srid, std::move(polygons));
}

Geometry CartesianFactory::CreateCollection(vector<Geometry> geometries) const {
	return Geometry::CreateMultiPart(GeometryType::GEOMETRYCOLLECTION, properties, srid, std::move(geometries));
}

} // namespace core

} // namespace wkt
