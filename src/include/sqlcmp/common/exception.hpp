//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

#include <stdexcept>

namespace sqlcmp {
struct LogicalType;
enum class ExpressionType : uint8_t;
enum class LogicalTypeId : uint8_t;

//===--------------------------------------------------------------------===//
// Exception Formatting
//===--------------------------------------------------------------------===//
enum class ExceptionFormatValueType : uint8_t {
	FORMAT_VALUE_TYPE_DOUBLE,
	FORMAT_VALUE_TYPE_INTEGER,
	FORMAT_VALUE_TYPE_STRING
};

struct ExceptionFormatValue {
	ExceptionFormatValue(double dbl_val);  // NOLINT
	ExceptionFormatValue(int64_t int_val); // NOLINT
	ExceptionFormatValue(string str_val);  // NOLINT

	ExceptionFormatValueType type;

	double dbl_val = 0;
	int64_t int_val = 0;
	string str_val;

public:
	template <class T>
	static ExceptionFormatValue CreateFormatValue(T value) {
		return int64_t(value);
	}
	static string Format(const string &msg, std::vector<ExceptionFormatValue> &values);
};

template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(LogicalType value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(LogicalTypeId value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(ExpressionType value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(float value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(double value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(string value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const char *value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(char *value);

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,                // invalid type
	OUT_OF_RANGE = 1,           // value out of range error
	CONVERSION = 2,             // conversion/casting error
	UNSUPPORTED_COMPARISON = 3, // no comparison exists between two types
	INVALID_INPUT = 4,          // invalid input (e.g. a configuration value)
	NOT_IMPLEMENTED = 5,        // method not implemented
	INTERNAL = 6                // internal error
};

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;
	string raw_message;

public:
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		const std::size_t num_args = sizeof...(ARGS);
		if (num_args == 0) {
			return msg;
		}
		std::vector<ExceptionFormatValue> values;
		return ConstructMessageRecursive(msg, values, params...);
	}

	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values);

	template <class T, typename... ARGS>
	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values, T param,
	                                        ARGS... params) {
		values.push_back(ExceptionFormatValue::CreateFormatValue<T>(param));
		return ConstructMessageRecursive(msg, values, params...);
	}

private:
	static string FormatMessage(ExceptionType type, const string &message);
};

//===--------------------------------------------------------------------===//
// Exception Classes
//===--------------------------------------------------------------------===//

class ConversionException : public Exception {
public:
	explicit ConversionException(const string &msg);

	template <typename... ARGS>
	explicit ConversionException(const string &msg, ARGS... params)
	    : ConversionException(ConstructMessage(msg, params...)) {
	}
};

class UnsupportedComparisonException : public Exception {
public:
	explicit UnsupportedComparisonException(const string &msg);

	template <typename... ARGS>
	explicit UnsupportedComparisonException(const string &msg, ARGS... params)
	    : UnsupportedComparisonException(ConstructMessage(msg, params...)) {
	}
};

class OutOfRangeException : public Exception {
public:
	explicit OutOfRangeException(const string &msg);

	template <typename... ARGS>
	explicit OutOfRangeException(const string &msg, ARGS... params)
	    : OutOfRangeException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

} // namespace sqlcmp
