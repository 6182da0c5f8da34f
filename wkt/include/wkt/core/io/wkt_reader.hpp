#pragma once
#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry.hpp"
#include "wkt/core/geometry/geometry_factory.hpp"
#include "wkt/core/io/wkt_reader_options.hpp"

namespace wkt {

namespace core {

class WKTParseContext;

//------------------------------------------------------------------------------
// WKTReader
//------------------------------------------------------------------------------
// Parses WKT, and optionally EWKT and SFS 1.2 WKT, into geometries built by a
// GeometryFactory. All per-parse state lives in a WKTParseContext, so a
// configured reader can be shared between threads.
class WKTReader {
private:
	WKTReaderOptions options;

	Geometry ParseTypeTag(WKTParseContext &context, bool nested) const;
	Geometry ParseCoordinates(WKTParseContext &context) const;

	Geometry ParsePoint(WKTParseContext &context, bool convert_empty) const;
	vector<Geometry> ParseLineStringPoints(WKTParseContext &context) const;
	Geometry ParseLineString(WKTParseContext &context) const;
	Geometry ParsePolygon(WKTParseContext &context) const;
	Geometry ParseMultiPoint(WKTParseContext &context) const;
	Geometry ParseMultiLineString(WKTParseContext &context) const;
	Geometry ParseMultiPolygon(WKTParseContext &context) const;
	Geometry ParseGeometryCollection(WKTParseContext &context) const;

	// Strips a leading "srid=<digits>;" from lower-cased input
	static idx_t ParseSRIDPrefix(const string &text, bool &has_srid, int32_t &srid);

public:
	explicit WKTReader(WKTReaderOptions options = WKTReaderOptions());

	const shared_ptr<GeometryFactory> &GetDefaultFactory() const {
		return options.default_factory;
	}
	// Passing nullptr restores the 2D CartesianFactory
	void SetDefaultFactory(shared_ptr<GeometryFactory> factory);

	const FactoryGenerator &GetFactoryGenerator() const {
		return options.factory_generator;
	}
	void SetFactoryGenerator(FactoryGenerator generator) {
		options.factory_generator = std::move(generator);
	}

	bool SupportsEWKT() const {
		return options.support_ewkt;
	}
	void SetSupportEWKT(bool value) {
		options.support_ewkt = value;
	}

	bool SupportsWKT12() const {
		return options.support_wkt12;
	}
	void SetSupportWKT12(bool value) {
		options.support_wkt12 = value;
	}

	// Strict mode only takes effect while both extensions are disabled
	bool IsStrictWKT11() const {
		return options.strict_wkt11 && !options.support_ewkt && !options.support_wkt12;
	}
	void SetStrictWKT11(bool value) {
		options.strict_wkt11 = value;
	}

	bool IgnoresExtraTokens() const {
		return options.ignore_extra_tokens;
	}
	void SetIgnoreExtraTokens(bool value) {
		options.ignore_extra_tokens = value;
	}

	// Throws a WKTParseException if the text is not valid
	Geometry Parse(const string &text) const;

	// Returns false and sets the error message if the text is not valid
	bool TryParse(const string &text, Geometry &result, string &error) const;
};

} // namespace core

} // namespace wkt
