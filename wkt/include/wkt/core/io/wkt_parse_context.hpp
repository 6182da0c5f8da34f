#pragma once
#include "wkt/common.hpp"
#include "wkt/core/geometry/geometry_factory.hpp"
#include "wkt/core/io/wkt_reader_options.hpp"
#include "wkt/core/io/wkt_tokenizer.hpp"

namespace wkt {

namespace core {

//------------------------------------------------------------------------------
// WKTParseContext
//------------------------------------------------------------------------------
// Everything that lives for the duration of a single parse: the token stream,
// the Z/M expectations and the factory negotiated for the input. Once the Z/M
// expectations or the factory have been settled they stay fixed until the
// context is destroyed.
class WKTParseContext {
private:
	const WKTReaderOptions &options;
	string text;
	WKTTokenizer tokenizer;

	bool has_srid;
	int32_t srid;

	shared_ptr<GeometryFactory> factory;
	FactoryCapabilities capabilities;

	DimensionFlag expect_z;
	DimensionFlag expect_m;

public:
	WKTParseContext(const WKTReaderOptions &options, string text, bool has_srid, int32_t srid);

	// Not copyable, the tokenizer points into our own text
	WKTParseContext(const WKTParseContext &) = delete;
	WKTParseContext &operator=(const WKTParseContext &) = delete;

public:
	//--------------------------------------------------------------------------
	// Tokens
	//--------------------------------------------------------------------------
	const WKTToken &Current() const {
		return tokenizer.Current();
	}
	const WKTToken &Next() {
		return tokenizer.Next();
	}
	bool CurrentIs(WKTTokenType type) const {
		return tokenizer.Current().type == type;
	}
	bool CurrentIsWord(const char *word) const {
		return tokenizer.Current().IsWord(word);
	}

	// Throws unless the current token is of the given type
	void Expect(WKTTokenType type) const;
	// Consumes a number token and returns its value
	double ConsumeNumber();

	string GetErrorContext() const {
		return tokenizer.GetErrorContext();
	}

	//--------------------------------------------------------------------------
	// Dimensions and factory
	//--------------------------------------------------------------------------
	DimensionFlag ExpectZ() const {
		return expect_z;
	}
	DimensionFlag ExpectM() const {
		return expect_m;
	}
	bool DimensionsKnown() const {
		return expect_z != DimensionFlag::UNKNOWN;
	}

	// Only meaningful once the factory has been resolved
	const FactoryCapabilities &GetCapabilities() const {
		return capabilities;
	}

	// Picks the factory on first use and keeps it for the rest of the parse
	const GeometryFactory &ResolveFactory();

	// Fails if the factory cannot represent the expected Z or M
	void CheckCapabilities() const;

	// A tag declared its dimensions explicitly. The first declaration fixes
	// them, later ones have to agree.
	void DeclareDimensions(bool has_z, bool has_m, bool nested);

	// The first coordinate tuple of an undeclared parse had this many values
	// beyond x and y.
	void InferDimensions(idx_t extra_count);
};

} // namespace core

} // namespace wkt
