#include "wkt/core/module.hpp"

#include "wkt/common.hpp"
#include "wkt/core/functions/common.hpp"
#include "wkt/core/functions/scalar.hpp"

namespace wkt {

namespace core {

void CoreModule::Register(DatabaseInstance &db) {
	// Settings first, the functions read them at bind time
	WKTSettings::Register(db);
	CoreScalarFunctions::Register(db);
}

} // namespace core

} // namespace wkt
