//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/constants.hpp"
#include "sqlcmp/common/exception.hpp"

namespace sqlcmp {

/**
 * String Utility Functions
 * Note that these are not the most efficient implementations (i.e., they copy
 * memory) and therefore they should only be used for debug messages and other
 * such things.
 */
class StringUtil {
public:
	static bool CharacterIsSpace(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}
	static bool CharacterIsDigit(char c) {
		return c >= '0' && c <= '9';
	}
	static char CharacterToLower(char c) {
		if (c >= 'A' && c <= 'Z') {
			return c - ('A' - 'a');
		}
		return c;
	}
	static char CharacterToUpper(char c) {
		if (c >= 'a' && c <= 'z') {
			return c - ('a' - 'A');
		}
		return c;
	}

	//! Returns true if the needle string exists in the haystack
	static bool Contains(const string &haystack, const string &needle);

	//! Returns true if the target string starts with the given prefix
	static bool StartsWith(const string &str, const string &prefix);

	//! Split the input string based on newline char
	static vector<string> Split(const string &str, char delimiter);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	static string Join(const vector<string> &input, const string &separator);

	//! Convert a string to lowercase
	static string Lower(const string &str);

	//! Convert a string to uppercase
	static string Upper(const string &str);

	//! Case insensitive equals
	static bool CIEquals(const string &l1, const string &l2);

	//! Remove leading and trailing whitespace
	static void Trim(string &str);
	static void LTrim(string &str);
	static void RTrim(string &str);

	template <typename... ARGS>
	static string Format(const string fmt_str, ARGS... params) {
		return Exception::ConstructMessage(fmt_str, params...);
	}
};

} // namespace sqlcmp
