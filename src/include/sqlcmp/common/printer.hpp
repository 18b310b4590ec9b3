//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/printer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

namespace sqlcmp {

enum class OutputStream : uint8_t { STREAM_STDOUT = 1, STREAM_STDERR = 2 };

//! Printer is a static class that allows printing to logs or stdout/stderr
class Printer {
public:
	//! Directly prints the string to stdout without a newline
	static void RawPrint(OutputStream stream, const string &str);
	//! Flush an output stream
	static void Flush(OutputStream stream);
};

} // namespace sqlcmp
