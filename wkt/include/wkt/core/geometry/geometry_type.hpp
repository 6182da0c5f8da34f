#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

enum class GeometryType : uint8_t {
	POINT = 0,
	LINESTRING,
	POLYGON,
	MULTIPOINT,
	MULTILINESTRING,
	MULTIPOLYGON,
	GEOMETRYCOLLECTION,
	// Only ever appears as a polygon ring
	LINEARRING
};

struct GeometryTypes {
	static bool IsSinglePart(GeometryType type) {
		return type == GeometryType::POINT || type == GeometryType::LINESTRING || type == GeometryType::LINEARRING;
	}

	static bool IsMultiPart(GeometryType type) {
		return type == GeometryType::POLYGON || type == GeometryType::MULTIPOINT ||
		       type == GeometryType::MULTILINESTRING || type == GeometryType::MULTIPOLYGON ||
		       type == GeometryType::GEOMETRYCOLLECTION;
	}

	static string ToString(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return "POINT";
		case GeometryType::LINESTRING:
			return "LINESTRING";
		case GeometryType::POLYGON:
			return "POLYGON";
		case GeometryType::MULTIPOINT:
			return "MULTIPOINT";
		case GeometryType::MULTILINESTRING:
			return "MULTILINESTRING";
		case GeometryType::MULTIPOLYGON:
			return "MULTIPOLYGON";
		case GeometryType::GEOMETRYCOLLECTION:
			return "GEOMETRYCOLLECTION";
		case GeometryType::LINEARRING:
			return "LINEARRING";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
		}
	}
};

} // namespace core

} // namespace wkt
