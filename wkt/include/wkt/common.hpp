#pragma once

#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/string_type.hpp"
#include "duckdb/common/exception.hpp"

namespace wkt {

using namespace duckdb;

namespace core {

using namespace duckdb;

} // namespace core

} // namespace wkt
