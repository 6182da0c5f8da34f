#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

struct CoreModule {
public:
	static void Register(DatabaseInstance &db);
};

} // namespace core

} // namespace wkt
