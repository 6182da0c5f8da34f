#include "wkt/common.hpp"
#include "wkt/core/io/wkt_exception.hpp"
#include "wkt/core/io/wkt_parse_context.hpp"

namespace wkt {

namespace core {

static string DimensionsToString(bool has_z, bool has_m) {
	string result = "XY";
	if (has_z) {
		result += "Z";
	}
	if (has_m) {
		result += "M";
	}
	return result;
}

WKTParseContext::WKTParseContext(const WKTReaderOptions &options, string text_p, bool has_srid, int32_t srid)
    : options(options), text(std::move(text_p)), tokenizer(text.c_str(), text.size()), has_srid(has_srid),
      srid(srid), expect_z(DimensionFlag::UNKNOWN), expect_m(DimensionFlag::UNKNOWN) {
	// Without a generator there is nothing to negotiate, use the default right away
	if (!options.factory_generator) {
		factory = options.default_factory;
		if (factory) {
			capabilities = factory->GetCapabilities();
		}
	}
}

//------------------------------------------------------------------------------
// Tokens
//------------------------------------------------------------------------------
void WKTParseContext::Expect(WKTTokenType type) const {
	const auto &token = tokenizer.Current();
	if (token.type != type) {
		throw WKTParseException("Expected %s but found %s %s", WKTToken::TypeToString(type), token.ToString(),
		                        GetErrorContext());
	}
}

double WKTParseContext::ConsumeNumber() {
	Expect(WKTTokenType::NUMBER);
	const auto value = tokenizer.Current().number;
	tokenizer.Next();
	return value;
}

//------------------------------------------------------------------------------
// Dimensions and factory
//------------------------------------------------------------------------------
const GeometryFactory &WKTParseContext::ResolveFactory() {
	if (factory) {
		return *factory;
	}
	if (options.factory_generator) {
		FactoryRequest request;
		request.has_srid = has_srid;
		request.srid = srid;
		request.z = expect_z;
		request.m = expect_m;
		factory = options.factory_generator(request);
	}
	if (!factory) {
		factory = options.default_factory;
	}
	if (!factory) {
		throw InternalException("WKT reader has neither a factory generator result nor a default factory");
	}
	capabilities = factory->GetCapabilities();
	if (DimensionsKnown()) {
		CheckCapabilities();
	}
	return *factory;
}

void WKTParseContext::CheckCapabilities() const {
	if (expect_z == DimensionFlag::PRESENT && !capabilities.has_z) {
		throw WKTParseException("Geometry calls for Z coordinate but factory doesn't support it %s",
		                        GetErrorContext());
	}
	if (expect_m == DimensionFlag::PRESENT && !capabilities.has_m) {
		throw WKTParseException("Geometry calls for M coordinate but factory doesn't support it %s",
		                        GetErrorContext());
	}
}

void WKTParseContext::DeclareDimensions(bool has_z, bool has_m, bool nested) {
	if (!DimensionsKnown()) {
		expect_z = DimensionFlags::FromBool(has_z);
		expect_m = DimensionFlags::FromBool(has_m);
		if (factory) {
			CheckCapabilities();
		} else {
			ResolveFactory();
		}
		return;
	}

	const bool known_z = expect_z == DimensionFlag::PRESENT;
	const bool known_m = expect_m == DimensionFlag::PRESENT;
	if (known_z == has_z && known_m == has_m) {
		return;
	}
	if (nested) {
		throw WKTParseException("Dimension mismatch: contained geometry is %s but the surrounding geometry is %s %s",
		                        DimensionsToString(has_z, has_m), DimensionsToString(known_z, known_m),
		                        GetErrorContext());
	}
	throw WKTParseException("Dimension mismatch: geometry declares %s but %s was already established %s",
	                        DimensionsToString(has_z, has_m), DimensionsToString(known_z, known_m),
	                        GetErrorContext());
}

void WKTParseContext::InferDimensions(idx_t extra_count) {
	D_ASSERT(!DimensionsKnown());
	auto remaining = extra_count;

	// A factory that is already fixed decides which axes the extra values go to
	const bool has_z = remaining > 0 && (!factory || capabilities.has_z);
	if (has_z) {
		remaining--;
	}
	const bool has_m = remaining > 0 && (!factory || capabilities.has_m);
	if (has_m) {
		remaining--;
	}
	if (remaining > 0) {
		throw WKTParseException("Found %d coordinates, which is too many for this factory %s", extra_count + 2,
		                        GetErrorContext());
	}

	expect_z = DimensionFlags::FromBool(has_z);
	expect_m = DimensionFlags::FromBool(has_m);
	ResolveFactory();
}

} // namespace core

} // namespace wkt
