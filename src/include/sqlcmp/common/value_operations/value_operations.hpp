//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/value_operations/value_operations.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/types/value.hpp"

namespace sqlcmp {

struct ValueOperations {
	//===--------------------------------------------------------------------===//
	// Structural Equality
	//===--------------------------------------------------------------------===//
	//! Deep equality where NULL equals NULL. Values of different representations are never equal:
	//! ARRAY compares element-wise in order, MAP compares as an unordered set of entries, STRUCT compares
	//! field names and values in declaration order.
	static bool NotDistinctFrom(const Value &left, const Value &right);
	static bool DistinctFrom(const Value &left, const Value &right);
};

} // namespace sqlcmp
