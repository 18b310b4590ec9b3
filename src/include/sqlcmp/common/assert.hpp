//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#if !defined(DEBUG) && !defined(SQLCMP_FORCE_ASSERT)

#include <assert.h>
#define D_ASSERT assert

#else

namespace sqlcmp {
void SqlcmpAssertInternal(bool condition, const char *condition_name, const char *file, int linenr);
}

#define D_ASSERT(condition) sqlcmp::SqlcmpAssertInternal(bool(condition), #condition, __FILE__, __LINE__)

#endif
