#pragma once

#include "wkt/common.hpp"

namespace wkt {

namespace core {

// A vertex always carries all four ordinates. Whether z and m are meaningful is
// decided by the GeometryProperties of the geometry that owns it, unused
// ordinates are left at zero.
struct Vertex {
	double x;
	double y;
	double z;
	double m;

public:
	Vertex() : x(0), y(0), z(0), m(0) {
	}
	Vertex(double x_p, double y_p) : x(x_p), y(y_p), z(0), m(0) {
	}
	Vertex(double x_p, double y_p, double z_p, double m_p) : x(x_p), y(y_p), z(z_p), m(m_p) {
	}

	bool operator==(const Vertex &other) const {
		return x == other.x && y == other.y && z == other.z && m == other.m;
	}

	bool operator!=(const Vertex &other) const {
		return !(*this == other);
	}
};

} // namespace core

} // namespace wkt
