#include <catch2/catch.hpp>

#include "duckdb.hpp"
#include "wkt_extension.hpp"
#include "wkt/doc_util.hpp"

using namespace duckdb;

static Value QueryValue(Connection &con, const string &query) {
	auto result = con.Query(query);
	INFO(query);
	REQUIRE_FALSE(result->HasError());
	return result->GetValue(0, 0);
}

static string QueryError(Connection &con, const string &query) {
	auto result = con.Query(query);
	if (!result->HasError()) {
		return "";
	}
	return result->GetError();
}

TEST_CASE("WKT functions", "[wkt][extension]") {
	DuckDB db(nullptr);
	db.LoadExtension<WktExtension>();
	Connection con(db);

	CHECK(QueryValue(con, "SELECT WKT_GeometryType('POINT (1 2)')").ToString() == "POINT");
	CHECK(QueryValue(con, "SELECT WKT_GeometryType('POINT EMPTY')").ToString() == "MULTIPOINT");
	CHECK(QueryValue(con, "SELECT WKT_GeometryType('polygon((0 0, 1 0, 1 1, 0 0))')").ToString() == "POLYGON");

	CHECK(QueryValue(con, "SELECT WKT_NPoints('POLYGON((0 0,10 0,10 10,0 10,0 0),(2 2,2 4,4 4,4 2,2 2))')")
	          .GetValue<uint64_t>() == 10);

	// Untagged extra values are picked up by the factory generator
	CHECK(QueryValue(con, "SELECT WKT_HasZ('POINT (1 2 3)')").GetValue<bool>());
	CHECK_FALSE(QueryValue(con, "SELECT WKT_HasM('POINT (1 2 3)')").GetValue<bool>());
	CHECK(QueryValue(con, "SELECT WKT_ZMFlag('POINT (1 2 3 4)')").GetValue<uint8_t>() == 3);
	CHECK(QueryValue(con, "SELECT WKT_SRID('POINT (1 2)')").GetValue<int32_t>() == 0);

	SECTION("NULL in, NULL out") {
		CHECK(QueryValue(con, "SELECT WKT_GeometryType(NULL)").IsNull());
		CHECK(QueryValue(con, "SELECT WKT_IsValid(NULL)").IsNull());
	}

	SECTION("many rows") {
		auto count = QueryValue(con, "SELECT SUM(WKT_NPoints('LINESTRING (0 0, ' || i || ' ' || i || ')')) "
		                             "FROM range(1000) t(i)");
		CHECK(count.GetValue<int64_t>() == 2000);
	}
}

TEST_CASE("WKT parse errors in queries", "[wkt][extension]") {
	DuckDB db(nullptr);
	db.LoadExtension<WktExtension>();
	Connection con(db);

	CHECK_THAT(QueryError(con, "SELECT WKT_GeometryType('FOO (1 2)')"),
	           Catch::Contains("WKT Parser: Unknown type tag: 'foo'"));
	CHECK_THAT(QueryError(con, "SELECT WKT_NPoints('POINT (1 2) extra')"), Catch::Contains("Extra tokens"));

	SECTION("WKT_IsValid never throws") {
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('FOO (1 2)')").GetValue<bool>());
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2')").GetValue<bool>());
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2 3 4 5)')").GetValue<bool>());
		CHECK(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2)')").GetValue<bool>());

		auto valid = QueryValue(con, "SELECT COUNT(*) FILTER (WHERE WKT_IsValid(wkt)) FROM (VALUES "
		                             "('POINT (1 2)'), ('LINESTRING (0 0'), ('GEOMETRYCOLLECTION EMPTY'), ('')) t(wkt)");
		CHECK(valid.GetValue<int64_t>() == 2);
	}
}

TEST_CASE("WKT settings", "[wkt][extension]") {
	DuckDB db(nullptr);
	db.LoadExtension<WktExtension>();
	Connection con(db);

	SECTION("SFS 1.2 tags") {
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('POINT Z (1 2 3)')").GetValue<bool>());
		con.Query("SET wkt_support_wkt12 = true");
		CHECK(QueryValue(con, "SELECT WKT_HasZ('POINT Z (1 2 3)')").GetValue<bool>());
		CHECK(QueryValue(con, "SELECT WKT_ZMFlag('POINT M (1 2 3)')").GetValue<uint8_t>() == 1);
		CHECK_THAT(QueryError(con, "SELECT WKT_HasZ('GEOMETRYCOLLECTION Z (POINT Z (1 2 3), POINT (4 5))')"),
		           Catch::Contains("Dimension mismatch"));
	}

	SECTION("EWKT") {
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('SRID=4326;POINT(1 2)')").GetValue<bool>());
		con.Query("SET wkt_support_ewkt = true");
		CHECK(QueryValue(con, "SELECT WKT_SRID('SRID=4326;POINT(1 2)')").GetValue<int32_t>() == 4326);
		CHECK(QueryValue(con, "SELECT WKT_HasM('POINTM(1 2 3)')").GetValue<bool>());
	}

	SECTION("strict WKT 1.1") {
		con.Query("SET wkt_strict_wkt11 = true");
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2 3)')").GetValue<bool>());
		CHECK(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2)')").GetValue<bool>());
	}

	SECTION("extra tokens") {
		con.Query("SET wkt_ignore_extra_tokens = true");
		CHECK(QueryValue(con, "SELECT WKT_GeometryType('POINT (1 2) extra')").ToString() == "POINT");
	}

	SECTION("default factory") {
		con.Query("SET wkt_factory_generator = false");
		// A 2D default factory has no room for a third value
		CHECK_FALSE(QueryValue(con, "SELECT WKT_IsValid('POINT (1 2 3)')").GetValue<bool>());

		con.Query("SET wkt_default_dimensions = 'XYM'");
		CHECK(QueryValue(con, "SELECT WKT_HasM('POINT (1 2 3)')").GetValue<bool>());
		CHECK_FALSE(QueryValue(con, "SELECT WKT_HasZ('POINT (1 2 3)')").GetValue<bool>());
		// Every geometry carries the factory's dimensions
		CHECK(QueryValue(con, "SELECT WKT_ZMFlag('POINT (1 2)')").GetValue<uint8_t>() == 1);

		con.Query("SET wkt_default_dimensions = 'XYQ'");
		CHECK_THAT(QueryError(con, "SELECT WKT_NPoints('POINT (1 2)')"),
		           Catch::Contains("Unknown dimensions 'XYQ'"));
	}
}

TEST_CASE("WKT functions are documented", "[wkt][extension]") {
	DuckDB db(nullptr);
	db.LoadExtension<WktExtension>();
	Connection con(db);

	auto result = con.Query("SELECT DISTINCT function_name FROM duckdb_functions() WHERE function_name LIKE 'WKT_%' "
	                        "AND description IS NOT NULL ORDER BY function_name");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->RowCount() == 7);
	CHECK(result->GetValue(0, 0).ToString() == "WKT_GeometryType");
	CHECK(result->GetValue(0, 6).ToString() == "WKT_ZMFlag");
}

TEST_CASE("WKT function documentation is dedented", "[wkt][extension]") {
	CHECK(wkt::DocUtil::Dedent("\n\t\tSELECT 1;\n\t\t----\n\n\t\t\t1\n\t") == "SELECT 1;\n----\n\n\t1");
	CHECK(wkt::DocUtil::Dedent("  one\n two  \n") == " one\ntwo");
	CHECK(wkt::DocUtil::Dedent("\n\n") == "");
	CHECK(wkt::DocUtil::Dedent(nullptr) == "");

	DuckDB db(nullptr);
	db.LoadExtension<WktExtension>();
	Connection con(db);

	auto description = QueryValue(con, "SELECT description FROM duckdb_functions() WHERE function_name = 'WKT_SRID'");
	CHECK(description.ToString() == "Returns the SRID of the geometry described by a WKT string, or 0 if it has none.\n\n"
	                                "Only EWKT carries an SRID, so this requires `SET wkt_support_ewkt = true`.");
}
