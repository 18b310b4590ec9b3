//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// test_helpers.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp.hpp"

namespace sqlcmp {

//! A constant operand, declared with the type of the value
unique_ptr<Term> Constant(Value value);
//! A NULL operand declared with the given type
unique_ptr<Term> NullOf(LogicalType type);
//! An operand that reads a column of the evaluation context
unique_ptr<Term> Column(idx_t index, LogicalType type);

//! Compile "left <type> right" over two constants and evaluate the result once
Value CompileAndEvaluate(const ComparisonCompiler &compiler, ExpressionType type, Value left, Value right);
Value CompileAndEvaluate(ExpressionType type, Value left, Value right);

//! A comparator that returns a fixed ordering and counts how often it runs
comparator_function_t CountingComparator(shared_ptr<idx_t> counter, int32_t result);
//! An equality function that returns a fixed answer and counts how often it runs
equals_function_t CountingEquals(shared_ptr<idx_t> counter, bool result);

//! A compiler configuration that records every log entry in memory
CompilerConfig GetLoggingTestConfig(LogLevel level = LogLevel::LOG_DEBUG);

} // namespace sqlcmp
