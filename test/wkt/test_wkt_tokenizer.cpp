#include <catch2/catch.hpp>

#include "wkt/common.hpp"
#include "wkt/core/io/wkt_exception.hpp"
#include "wkt/core/io/wkt_tokenizer.hpp"

#include "duckdb/common/error_data.hpp"

#include <limits>

using namespace wkt::core;
using duckdb::ErrorData;

static duckdb::vector<WKTToken> Tokenize(const std::string &text) {
	WKTTokenizer tokenizer(text.c_str(), text.size());
	duckdb::vector<WKTToken> tokens;
	while (tokenizer.Current().type != WKTTokenType::END_OF_INPUT) {
		tokens.push_back(tokenizer.Current());
		tokenizer.Next();
	}
	return tokens;
}

static std::string TokenizeError(const std::string &text) {
	try {
		Tokenize(text);
	} catch (WKTParseException &ex) {
		return ErrorData(ex).RawMessage();
	}
	return "";
}

TEST_CASE("Tokenizer splits words, numbers and punctuation", "[wkt][tokenizer]") {
	auto tokens = Tokenize("point (1 2)");
	REQUIRE(tokens.size() == 5);
	CHECK(tokens[0].type == WKTTokenType::WORD);
	CHECK(tokens[0].text == "point");
	CHECK(tokens[1].type == WKTTokenType::BEGIN);
	CHECK(tokens[2].type == WKTTokenType::NUMBER);
	CHECK(tokens[2].number == 1);
	CHECK(tokens[3].type == WKTTokenType::NUMBER);
	CHECK(tokens[3].number == 2);
	CHECK(tokens[4].type == WKTTokenType::END);

	SECTION("positions are byte offsets") {
		CHECK(tokens[0].position == 0);
		CHECK(tokens[1].position == 6);
		CHECK(tokens[2].position == 7);
		CHECK(tokens[3].position == 9);
		CHECK(tokens[4].position == 10);
	}
}

TEST_CASE("Tokenizer treats brackets like parentheses", "[wkt][tokenizer]") {
	auto tokens = Tokenize("[1,2]");
	REQUIRE(tokens.size() == 5);
	CHECK(tokens[0].type == WKTTokenType::BEGIN);
	CHECK(tokens[1].type == WKTTokenType::NUMBER);
	CHECK(tokens[2].type == WKTTokenType::COMMA);
	CHECK(tokens[3].type == WKTTokenType::NUMBER);
	CHECK(tokens[4].type == WKTTokenType::END);
}

TEST_CASE("Tokenizer number formats", "[wkt][tokenizer]") {
	auto tokens = Tokenize("-1.5 +2 .5 1e3 1.e-2 -.25e+1 7.");
	REQUIRE(tokens.size() == 7);
	for (auto &token : tokens) {
		CHECK(token.type == WKTTokenType::NUMBER);
	}
	CHECK(tokens[0].number == -1.5);
	CHECK(tokens[1].number == 2);
	CHECK(tokens[2].number == 0.5);
	CHECK(tokens[3].number == 1000);
	CHECK(tokens[4].number == Approx(0.01));
	CHECK(tokens[5].number == -2.5);
	CHECK(tokens[6].number == 7);
}

TEST_CASE("Tokenizer saturates out of range numbers", "[wkt][tokenizer]") {
	auto tokens = Tokenize("1e400 -1e400 1e-400");
	REQUIRE(tokens.size() == 3);
	for (auto &token : tokens) {
		CHECK(token.type == WKTTokenType::NUMBER);
	}
	CHECK(tokens[0].number == std::numeric_limits<double>::infinity());
	CHECK(tokens[1].number == -std::numeric_limits<double>::infinity());
	CHECK(tokens[2].number == 0);
}

TEST_CASE("Tokenizer skips all kinds of whitespace", "[wkt][tokenizer]") {
	auto tokens = Tokenize("  point\t\n(\r1   2 )  ");
	REQUIRE(tokens.size() == 5);
	CHECK(tokens[0].IsWord("point"));
	CHECK(tokens[4].type == WKTTokenType::END);
}

TEST_CASE("Tokenizer on empty input", "[wkt][tokenizer]") {
	std::string text = "   ";
	WKTTokenizer tokenizer(text.c_str(), text.size());
	CHECK(tokenizer.Current().type == WKTTokenType::END_OF_INPUT);
	// Stays at the end
	CHECK(tokenizer.Next().type == WKTTokenType::END_OF_INPUT);
}

TEST_CASE("Tokenizer rejects unclassifiable runs", "[wkt][tokenizer]") {
	CHECK_THAT(TokenizeError("point (1.2.3 4)"), Catch::Contains("Bad token: '1.2.3'"));
	CHECK_THAT(TokenizeError("abc1"), Catch::Contains("Bad token: 'abc1'"));
	CHECK_THAT(TokenizeError("1e"), Catch::Contains("Bad token: '1e'"));
	CHECK_THAT(TokenizeError("srid=4326;point(1 2)"), Catch::Contains("Bad token: 'srid=4326;point'"));
	CHECK_THAT(TokenizeError("point (1 2) ;"), Catch::StartsWith("WKT Parser: Bad token: ';'"));
}

TEST_CASE("Tokenizer errors point at the offending token", "[wkt][tokenizer]") {
	auto error = TokenizeError("point (1 2 x3)");
	CHECK_THAT(error, Catch::Contains("at position 11 near: 'point (1 2 x3'|<---"));

	// Long inputs are cut off on the left
	auto long_error = TokenizeError("linestring (0 0, 1 1, 2 2, 3 3, 4 4, 5 5, $)");
	CHECK_THAT(long_error, Catch::Contains("near: '..."));
	CHECK_THAT(long_error, Catch::EndsWith("$'|<---"));
}

TEST_CASE("Tokenizer error context at the end of input", "[wkt][tokenizer]") {
	std::string text = "point (";
	WKTTokenizer tokenizer(text.c_str(), text.size());
	while (tokenizer.Current().type != WKTTokenType::END_OF_INPUT) {
		tokenizer.Next();
	}
	CHECK(tokenizer.Current().position == 7);
	CHECK(tokenizer.GetErrorContext() == "at position 7 near: 'point ('|<---");
}
