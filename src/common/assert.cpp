#include "sqlcmp/common/assert.hpp"
#include "sqlcmp/common/exception.hpp"

namespace sqlcmp {

#if defined(DEBUG) || defined(SQLCMP_FORCE_ASSERT)
void SqlcmpAssertInternal(bool condition, const char *condition_name, const char *file, int linenr) {
	if (condition) {
		return;
	}
	throw InternalException("Assertion triggered in file \"%s\" on line %d: %s", file, linenr, condition_name);
}
#endif

} // namespace sqlcmp
