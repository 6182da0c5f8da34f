#define DUCKDB_EXTENSION_MAIN

#include "wkt_extension.hpp"
#include "duckdb.hpp"

#include "wkt/common.hpp"
#include "wkt/core/module.hpp"

namespace duckdb {

static void LoadInternal(DatabaseInstance &instance) {
	wkt::core::CoreModule::Register(instance);
}

void WktExtension::Load(DuckDB &db) {
	LoadInternal(*db.instance);
}

std::string WktExtension::Name() {
	return "wkt";
}

} // namespace duckdb

extern "C" {

DUCKDB_EXTENSION_API void wkt_init(duckdb::DatabaseInstance &db) {
	duckdb::LoadInternal(db);
}

DUCKDB_EXTENSION_API const char *wkt_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
