//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/enums/ternary_bool.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/constants.hpp"

namespace sqlcmp {

//! A boolean that may not have been determined yet
enum class TernaryBool : uint8_t { TERNARY_FALSE = 0, TERNARY_TRUE = 1, TERNARY_UNSET = 2 };

inline TernaryBool ToTernaryBool(bool value) {
	return value ? TernaryBool::TERNARY_TRUE : TernaryBool::TERNARY_FALSE;
}

} // namespace sqlcmp
