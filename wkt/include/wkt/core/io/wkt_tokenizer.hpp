#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

enum class WKTTokenType : uint8_t { NUMBER, WORD, BEGIN, END, COMMA, END_OF_INPUT };

struct WKTToken {
	WKTTokenType type = WKTTokenType::END_OF_INPUT;
	// Raw text the token was scanned from, empty at the end of input
	string text;
	double number = 0;
	// Byte offset of the token in the scanned text
	idx_t position = 0;

	bool IsWord(const char *word) const {
		return type == WKTTokenType::WORD && text == word;
	}

	static string TypeToString(WKTTokenType type);
	string ToString() const;
};

//------------------------------------------------------------------------------
// WKTTokenizer
//------------------------------------------------------------------------------
// Single lookahead scanner over lower-cased WKT. Whitespace separates tokens,
// "(" "[" and ")" "]" are interchangeable, and any other run of characters is
// classified as a number or a word, in that order. Anything else is an error.
class WKTTokenizer {
private:
	const char *start;
	const char *cursor;
	const char *end;
	WKTToken current;

	static bool IsPunctuation(char c);
	static bool IsNumber(const char *pos, const char *last);
	static bool IsWord(const char *pos, const char *last);

public:
	// The text must outlive the tokenizer
	WKTTokenizer(const char *text, idx_t length);

	const WKTToken &Current() const {
		return current;
	}

	const WKTToken &Next();

	// The input around the current token, for error messages
	string GetErrorContext() const;
};

} // namespace core

} // namespace wkt
