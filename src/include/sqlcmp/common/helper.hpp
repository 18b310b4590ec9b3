//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/constants.hpp"

namespace sqlcmp {

template <class T, class... ARGS>
unique_ptr<T> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<T>(new T(std::forward<ARGS>(args)...));
}

template <class T, class... ARGS>
shared_ptr<T> make_shared_ptr(ARGS &&...args) { // NOLINT: mimic std style
	return std::make_shared<T>(std::forward<ARGS>(args)...);
}

template <class T>
T MaxValue(T a, T b) {
	return a > b ? a : b;
}

} // namespace sqlcmp
