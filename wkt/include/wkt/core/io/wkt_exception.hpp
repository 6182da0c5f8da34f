#pragma once
#include "wkt/common.hpp"

namespace wkt {

namespace core {

// The one error the WKT reader raises. Being an InvalidInputException it
// surfaces as a regular "Invalid Input Error" when thrown inside a query.
class WKTParseException : public InvalidInputException {
public:
	explicit WKTParseException(const string &msg) : InvalidInputException("WKT Parser: " + msg) {
	}

	template <typename... ARGS>
	explicit WKTParseException(const string &msg, ARGS... params)
	    : WKTParseException(ConstructMessage(msg, params...)) {
	}
};

} // namespace core

} // namespace wkt
