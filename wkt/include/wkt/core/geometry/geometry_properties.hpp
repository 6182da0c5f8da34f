#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

struct GeometryProperties {
private:
	static constexpr const uint8_t Z = 0x01;
	static constexpr const uint8_t M = 0x02;
	uint8_t flags = 0;

public:
	GeometryProperties(bool has_z, bool has_m) {
		SetZ(has_z);
		SetM(has_m);
	}

	inline bool HasZ() const {
		return (flags & Z) != 0;
	}
	inline bool HasM() const {
		return (flags & M) != 0;
	}
	inline void SetZ(bool value) {
		flags = value ? (flags | Z) : (flags & ~Z);
	}
	inline void SetM(bool value) {
		flags = value ? (flags | M) : (flags & ~M);
	}

	// Number of ordinates stored per vertex
	uint32_t Dimensions() const {
		return 2 + HasZ() + HasM();
	}

	// 0 = XY, 1 = XYM, 2 = XYZ, 3 = XYZM
	uint8_t ZMFlag() const {
		return static_cast<uint8_t>((HasZ() ? 2 : 0) + (HasM() ? 1 : 0));
	}
};

} // namespace core

} // namespace wkt
