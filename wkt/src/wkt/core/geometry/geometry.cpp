#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry.hpp"

namespace wkt {

namespace core {

Geometry Geometry::CreateSinglePart(GeometryType type, GeometryProperties props, int32_t srid,
                                    vector<Vertex> vertices) {
	if (!GeometryTypes::IsSinglePart(type)) {
		throw InvalidInputException("Cannot create a %s from a list of vertices", GeometryTypes::ToString(type));
	}
	Geometry result(type, props, srid);
	result.vertices = std::move(vertices);
	return result;
}

Geometry Geometry::CreateMultiPart(GeometryType type, GeometryProperties props, int32_t srid,
                                   vector<Geometry> parts) {
	if (!GeometryTypes::IsMultiPart(type)) {
		throw InvalidInputException("Cannot create a %s from a list of parts", GeometryTypes::ToString(type));
	}
	Geometry result(type, props, srid);
	result.parts = std::move(parts);
	return result;
}

idx_t Geometry::GetVertexCount() const {
	if (GeometryTypes::IsSinglePart(type)) {
		return vertices.size();
	}
	idx_t count = 0;
	for (auto &part : parts) {
		count += part.GetVertexCount();
	}
	return count;
}

bool Geometry::IsEmpty() const {
	if (GeometryTypes::IsSinglePart(type)) {
		return vertices.empty();
	}
	for (auto &part : parts) {
		if (!part.IsEmpty()) {
			return false;
		}
	}
	return true;
}

} // namespace core

} // namespace wkt
