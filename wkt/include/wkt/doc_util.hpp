#pragma once
#include "duckdb.hpp"
#include "duckdb/main/extension_util.hpp"

namespace wkt {

// Catalog documentation for one of the WKT_ functions. The description and
// example are raw string literals and get dedented before they are stored.
struct FunctionDoc {
	const char *name;
	const char *description;
	const char *example;
	const char *category;
};

struct DocUtil {
	// Attaches the documentation to an already registered scalar function, tagged
	// with the extension name and the category
	static void AddDocumentation(duckdb::DatabaseInstance &db, const FunctionDoc &doc);

	// Removes the indentation shared by all non-blank lines, along with leading
	// blank lines and trailing whitespace
	static duckdb::string Dedent(const char *text);
};

} // namespace wkt
