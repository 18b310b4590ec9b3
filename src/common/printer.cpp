#include "sqlcmp/common/printer.hpp"

#include "fmt/format.h"

#include <stdio.h>

namespace sqlcmp {

static FILE *GetStream(OutputStream stream) {
	return stream == OutputStream::STREAM_STDERR ? stderr : stdout;
}

void Printer::RawPrint(OutputStream stream, const string &str) {
#ifndef SQLCMP_DISABLE_PRINT
	fmt::print(GetStream(stream), "{}", str);
#endif
}

void Printer::Flush(OutputStream stream) {
#ifndef SQLCMP_DISABLE_PRINT
	fflush(GetStream(stream));
#endif
}

} // namespace sqlcmp
