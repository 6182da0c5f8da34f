#include "wkt/common.hpp"
#include "wkt/core/io/wkt_exception.hpp"
#include "wkt/core/io/wkt_tokenizer.hpp"

#include <fast_float/fast_float.h>

namespace wkt {

namespace core {

//------------------------------------------------------------------------------
// WKTToken
//------------------------------------------------------------------------------
string WKTToken::TypeToString(WKTTokenType type) {
	switch (type) {
	case WKTTokenType::NUMBER:
		return "number";
	case WKTTokenType::WORD:
		return "word";
	case WKTTokenType::BEGIN:
		return "begin";
	case WKTTokenType::END:
		return "end";
	case WKTTokenType::COMMA:
		return "comma";
	case WKTTokenType::END_OF_INPUT:
		return "end of input";
	default:
		return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
	}
}

string WKTToken::ToString() const {
	if (type == WKTTokenType::END_OF_INPUT) {
		return TypeToString(type);
	}
	return TypeToString(type) + " '" + text + "'";
}

//------------------------------------------------------------------------------
// WKTTokenizer
//------------------------------------------------------------------------------
WKTTokenizer::WKTTokenizer(const char *text, idx_t length) : start(text), cursor(text), end(text + length) {
	Next();
}

bool WKTTokenizer::IsPunctuation(char c) {
	return c == '(' || c == ')' || c == '[' || c == ']' || c == ',';
}

// [-+]?(\d+(\.\d*)?|\.\d+)(e[-+]?\d+)?
bool WKTTokenizer::IsNumber(const char *pos, const char *last) {
	if (pos < last && (*pos == '-' || *pos == '+')) {
		pos++;
	}
	idx_t int_digits = 0;
	while (pos < last && StringUtil::CharacterIsDigit(*pos)) {
		pos++;
		int_digits++;
	}
	idx_t frac_digits = 0;
	if (pos < last && *pos == '.') {
		pos++;
		while (pos < last && StringUtil::CharacterIsDigit(*pos)) {
			pos++;
			frac_digits++;
		}
	}
	if (int_digits == 0 && frac_digits == 0) {
		return false;
	}
	if (pos < last && *pos == 'e') {
		pos++;
		if (pos < last && (*pos == '-' || *pos == '+')) {
			pos++;
		}
		idx_t exp_digits = 0;
		while (pos < last && StringUtil::CharacterIsDigit(*pos)) {
			pos++;
			exp_digits++;
		}
		if (exp_digits == 0) {
			return false;
		}
	}
	return pos == last;
}

// [a-z]+
bool WKTTokenizer::IsWord(const char *pos, const char *last) {
	if (pos == last) {
		return false;
	}
	for (; pos < last; pos++) {
		if (*pos < 'a' || *pos > 'z') {
			return false;
		}
	}
	return true;
}

const WKTToken &WKTTokenizer::Next() {
	while (cursor < end && StringUtil::CharacterIsSpace(*cursor)) {
		cursor++;
	}

	current.position = static_cast<idx_t>(cursor - start);
	current.number = 0;

	if (cursor == end) {
		current.type = WKTTokenType::END_OF_INPUT;
		current.text.clear();
		return current;
	}

	if (IsPunctuation(*cursor)) {
		const auto c = *cursor++;
		current.text = string(1, c);
		switch (c) {
		case '(':
		case '[':
			current.type = WKTTokenType::BEGIN;
			break;
		case ')':
		case ']':
			current.type = WKTTokenType::END;
			break;
		default:
			current.type = WKTTokenType::COMMA;
			break;
		}
		return current;
	}

	// Everything up to the next whitespace or punctuation is one token
	const auto token_start = cursor;
	while (cursor < end && !StringUtil::CharacterIsSpace(*cursor) && !IsPunctuation(*cursor)) {
		cursor++;
	}
	current.text = string(token_start, cursor);

	if (IsNumber(token_start, cursor)) {
		// fast_float does not take a leading '+'
		const auto number_start = *token_start == '+' ? token_start + 1 : token_start;
		double value;
		auto result = fast_float::from_chars(number_start, cursor, value);
		// Overflow and underflow keep the infinity or zero fast_float hands back
		const auto converted = result.ec == std::errc() || result.ec == std::errc::result_out_of_range;
		if (!converted || result.ptr != cursor) {
			throw WKTParseException("Bad token: '%s' is not a representable number %s", current.text,
			                        GetErrorContext());
		}
		current.type = WKTTokenType::NUMBER;
		current.number = value;
		return current;
	}

	if (IsWord(token_start, cursor)) {
		current.type = WKTTokenType::WORD;
		return current;
	}

	throw WKTParseException("Bad token: '%s' %s", current.text, GetErrorContext());
}

string WKTTokenizer::GetErrorContext() const {
	// Return a string of the input leading up to the current token
	const idx_t len = 32;
	const auto token_pos = start + current.position;
	const auto token_len = std::min<idx_t>(std::max<idx_t>(current.text.size(), 1), end - token_pos);
	const auto token_end = token_pos + token_len;
	const auto msg_start = start + (current.position > len ? current.position - len : 0);
	auto msg = string(msg_start, token_end);
	if (msg_start != start) {
		msg = "..." + msg;
	}
	// Add an arrow to indicate the position
	msg = "at position " + std::to_string(current.position) + " near: '" + msg + "'|<---";
	return msg;
}

} // namespace core

} // namespace wkt
