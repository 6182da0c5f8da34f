#include "wkt/common.hpp"
#include "wkt/core/geometry/cartesian_factory.hpp"
#include "wkt/core/io/wkt_exception.hpp"
#include "wkt/core/io/wkt_parse_context.hpp"
#include "wkt/core/io/wkt_reader.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/limits.hpp"

namespace wkt {

namespace core {

static bool TryGetGeometryType(const string &tag, GeometryType &type) {
	if (tag == "point") {
		type = GeometryType::POINT;
	} else if (tag == "linestring") {
		type = GeometryType::LINESTRING;
	} else if (tag == "polygon") {
		type = GeometryType::POLYGON;
	} else if (tag == "multipoint") {
		type = GeometryType::MULTIPOINT;
	} else if (tag == "multilinestring") {
		type = GeometryType::MULTILINESTRING;
	} else if (tag == "multipolygon") {
		type = GeometryType::MULTIPOLYGON;
	} else if (tag == "geometrycollection") {
		type = GeometryType::GEOMETRYCOLLECTION;
	} else {
		return false;
	}
	return true;
}

WKTReader::WKTReader(WKTReaderOptions options_p) : options(std::move(options_p)) {
	if (!options.default_factory) {
		options.default_factory = make_shared_ptr<CartesianFactory>();
	}
}

void WKTReader::SetDefaultFactory(shared_ptr<GeometryFactory> factory) {
	if (!factory) {
		factory = make_shared_ptr<CartesianFactory>();
	}
	options.default_factory = std::move(factory);
}

//------------------------------------------------------------------------------
// Type tags
//------------------------------------------------------------------------------
Geometry WKTReader::ParseTypeTag(WKTParseContext &context, bool nested) const {
	context.Expect(WKTTokenType::WORD);
	auto tag = context.Current().text;

	// EWKT fuses the M marker into the tag, e.g. "pointm"
	string marker;
	if (options.support_ewkt && tag.size() > 1 && tag.back() == 'm') {
		tag.pop_back();
		marker = "m";
	}

	// An unknown tag is only reported once the dimension marker has been checked
	GeometryType type;
	string unknown_tag_error;
	if (!TryGetGeometryType(tag, type)) {
		unknown_tag_error = StringUtil::Format("Unknown type tag: '%s' %s", context.Current().text,
		                                       context.GetErrorContext());
	}
	context.Next();

	// SFS 1.2 has a separate "z", "m" or "zm" token
	if (marker.empty() && options.support_wkt12) {
		if (context.CurrentIsWord("z") || context.CurrentIsWord("m") || context.CurrentIsWord("zm")) {
			marker = context.Current().text;
			context.Next();
		}
	}

	// Strict WKT 1.1 has no marker at all, so every tag declares 2D
	if (!marker.empty() || IsStrictWKT11()) {
		context.DeclareDimensions(StringUtil::StartsWith(marker, "z"), StringUtil::EndsWith(marker, "m"), nested);
	}

	if (!unknown_tag_error.empty()) {
		throw WKTParseException(unknown_tag_error);
	}

	switch (type) {
	case GeometryType::POINT:
		return ParsePoint(context, true);
	case GeometryType::LINESTRING:
		return ParseLineString(context);
	case GeometryType::POLYGON:
		return ParsePolygon(context);
	case GeometryType::MULTIPOINT:
		return ParseMultiPoint(context);
	case GeometryType::MULTILINESTRING:
		return ParseMultiLineString(context);
	case GeometryType::MULTIPOLYGON:
		return ParseMultiPolygon(context);
	case GeometryType::GEOMETRYCOLLECTION:
		return ParseGeometryCollection(context);
	default:
		throw InternalException("Unhandled geometry type in WKT reader");
	}
}

//------------------------------------------------------------------------------
// Coordinates
//------------------------------------------------------------------------------
Geometry WKTReader::ParseCoordinates(WKTParseContext &context) const {
	const auto x = context.ConsumeNumber();
	const auto y = context.ConsumeNumber();

	vector<double> extra;
	if (!context.DimensionsKnown()) {
		// The first tuple of an untagged geometry decides for the whole parse
		while (context.CurrentIs(WKTTokenType::NUMBER)) {
			extra.push_back(context.Current().number);
			context.Next();
		}
		context.InferDimensions(extra.size());
	} else {
		const auto &caps = context.GetCapabilities();
		for (idx_t axis = 0; axis < 2; axis++) {
			const auto expected = axis == 0 ? context.ExpectZ() : context.ExpectM();
			const auto supported = axis == 0 ? caps.has_z : caps.has_m;
			double value = 0;
			if (expected == DimensionFlag::PRESENT) {
				if (!context.CurrentIs(WKTTokenType::NUMBER)) {
					throw WKTParseException("Dimension mismatch: expected %s coordinate but found %s %s",
					                        axis == 0 ? "Z" : "M", context.Current().ToString(),
					                        context.GetErrorContext());
				}
				value = context.Current().number;
				context.Next();
			}
			// The factory may support an axis the input did not declare
			if (supported) {
				extra.push_back(value);
			}
		}
	}

	return context.ResolveFactory().CreatePoint(x, y, extra);
}

//------------------------------------------------------------------------------
// Geometries
//------------------------------------------------------------------------------
Geometry WKTReader::ParsePoint(WKTParseContext &context, bool convert_empty) const {
	// An empty point has no representation of its own, it becomes an empty multipoint
	if (convert_empty && context.CurrentIsWord("empty")) {
		context.Next();
		return context.ResolveFactory().CreateMultiPoint(vector<Geometry>());
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	auto point = ParseCoordinates(context);
	context.Expect(WKTTokenType::END);
	context.Next();
	return point;
}

vector<Geometry> WKTReader::ParseLineStringPoints(WKTParseContext &context) const {
	vector<Geometry> points;
	if (context.CurrentIsWord("empty")) {
		context.Next();
		return points;
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	// "()" is accepted as an empty linestring
	if (!context.CurrentIs(WKTTokenType::END)) {
		points.push_back(ParseCoordinates(context));
		while (!context.CurrentIs(WKTTokenType::END)) {
			context.Expect(WKTTokenType::COMMA);
			context.Next();
			points.push_back(ParseCoordinates(context));
		}
	}
	context.Next();
	return points;
}

Geometry WKTReader::ParseLineString(WKTParseContext &context) const {
	auto points = ParseLineStringPoints(context);
	return context.ResolveFactory().CreateLineString(std::move(points));
}

Geometry WKTReader::ParsePolygon(WKTParseContext &context) const {
	if (context.CurrentIsWord("empty")) {
		context.Next();
		auto &factory = context.ResolveFactory();
		return factory.CreatePolygon(factory.CreateLinearRing(vector<Geometry>()), vector<Geometry>());
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();

	// Rings go through the linestring production, the factory turns them into rings
	vector<Geometry> hole_rings;
	auto outer_ring = ParseLineString(context);
	while (!context.CurrentIs(WKTTokenType::END)) {
		context.Expect(WKTTokenType::COMMA);
		context.Next();
		hole_rings.push_back(ParseLineString(context));
	}
	context.Next();

	return context.ResolveFactory().CreatePolygon(std::move(outer_ring), std::move(hole_rings));
}

Geometry WKTReader::ParseMultiPoint(WKTParseContext &context) const {
	vector<Geometry> points;
	if (context.CurrentIsWord("empty")) {
		context.Next();
		return context.ResolveFactory().CreateMultiPoint(std::move(points));
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	while (true) {
		// Both "MULTIPOINT ((1 2), (3 4))" and "MULTIPOINT (1 2, 3 4)" are common
		if (context.CurrentIs(WKTTokenType::NUMBER)) {
			points.push_back(ParseCoordinates(context));
		} else {
			points.push_back(ParsePoint(context, false));
		}
		if (context.CurrentIs(WKTTokenType::END)) {
			break;
		}
		context.Expect(WKTTokenType::COMMA);
		context.Next();
	}
	context.Next();
	return context.ResolveFactory().CreateMultiPoint(std::move(points));
}

Geometry WKTReader::ParseMultiLineString(WKTParseContext &context) const {
	vector<Geometry> lines;
	if (context.CurrentIsWord("empty")) {
		context.Next();
		return context.ResolveFactory().CreateMultiLineString(std::move(lines));
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	lines.push_back(ParseLineString(context));
	while (!context.CurrentIs(WKTTokenType::END)) {
		context.Expect(WKTTokenType::COMMA);
		context.Next();
		lines.push_back(ParseLineString(context));
	}
	context.Next();
	return context.ResolveFactory().CreateMultiLineString(std::move(lines));
}

Geometry WKTReader::ParseMultiPolygon(WKTParseContext &context) const {
	vector<Geometry> polygons;
	if (context.CurrentIsWord("empty")) {
		context.Next();
		return context.ResolveFactory().CreateMultiPolygon(std::move(polygons));
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	polygons.push_back(ParsePolygon(context));
	while (!context.CurrentIs(WKTTokenType::END)) {
		context.Expect(WKTTokenType::COMMA);
		context.Next();
		polygons.push_back(ParsePolygon(context));
	}
	context.Next();
	return context.ResolveFactory().CreateMultiPolygon(std::move(polygons));
}

Geometry WKTReader::ParseGeometryCollection(WKTParseContext &context) const {
	vector<Geometry> geometries;
	if (context.CurrentIsWord("empty")) {
		context.Next();
		return context.ResolveFactory().CreateCollection(std::move(geometries));
	}
	context.Expect(WKTTokenType::BEGIN);
	context.Next();
	geometries.push_back(ParseTypeTag(context, true));
	while (!context.CurrentIs(WKTTokenType::END)) {
		context.Expect(WKTTokenType::COMMA);
		context.Next();
		geometries.push_back(ParseTypeTag(context, true));
	}
	context.Next();
	return context.ResolveFactory().CreateCollection(std::move(geometries));
}

//------------------------------------------------------------------------------
// Entry points
//------------------------------------------------------------------------------
idx_t WKTReader::ParseSRIDPrefix(const string &text, bool &has_srid, int32_t &srid) {
	static constexpr const char *PREFIX = "srid=";
	static constexpr idx_t PREFIX_LEN = 5;

	if (!StringUtil::StartsWith(text, PREFIX)) {
		return 0;
	}
	idx_t pos = PREFIX_LEN;
	int64_t value = 0;
	while (pos < text.size() && StringUtil::CharacterIsDigit(text[pos])) {
		value = value * 10 + (text[pos] - '0');
		if (value > NumericLimits<int32_t>::Maximum()) {
			throw WKTParseException("SRID '%s' is out of range", text.substr(0, pos + 1));
		}
		pos++;
	}
	// Anything else is left to the tokenizer, which rejects it
	if (pos == PREFIX_LEN || pos >= text.size() || text[pos] != ';') {
		return 0;
	}
	has_srid = true;
	srid = static_cast<int32_t>(value);
	return pos + 1;
}

Geometry WKTReader::Parse(const string &text) const {
	auto input = StringUtil::Lower(text);

	bool has_srid = false;
	int32_t srid = 0;
	idx_t offset = 0;
	if (options.support_ewkt) {
		offset = ParseSRIDPrefix(input, has_srid, srid);
	}

	WKTParseContext context(options, input.substr(offset), has_srid, srid);
	auto geometry = ParseTypeTag(context, false);

	if (!options.ignore_extra_tokens && !context.CurrentIs(WKTTokenType::END_OF_INPUT)) {
		throw WKTParseException("Extra tokens beginning with %s %s", context.Current().ToString(),
		                        context.GetErrorContext());
	}
	return geometry;
}

bool WKTReader::TryParse(const string &text, Geometry &result, string &error) const {
	try {
		result = Parse(text);
		return true;
	} catch (std::exception &ex) {
		ErrorData error_data(ex);
		if (error_data.Type() != ExceptionType::INVALID_INPUT) {
			throw;
		}
		error = error_data.RawMessage();
		return false;
	}
}

} // namespace core

} // namespace wkt
