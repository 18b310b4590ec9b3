//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison_compiler.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/enums/expression_type.hpp"
#include "sqlcmp/execution/comparison/comparison_term.hpp"
#include "sqlcmp/logging/log_manager.hpp"
#include "sqlcmp/main/config.hpp"

namespace sqlcmp {

//! The ComparisonCompiler turns a comparison operator and two operand terms into an evaluable BOOLEAN term.
//! The decision of how to compare is made once per call, from the declared types of the operands; the resulting
//! term is immutable and can be reused across evaluation contexts. The compiler keeps no cache.
class ComparisonCompiler {
public:
	explicit ComparisonCompiler(CompilerConfig config = CompilerConfig());
	~ComparisonCompiler();

	//! Compile "left <type> right". Equality of nested and BOOLEAN operands is tried first, then an ordering
	//! comparator. Throws an UnsupportedComparisonException when neither applies or the operator is not a
	//! comparison.
	unique_ptr<ComparisonTerm> Compile(ExpressionType type, unique_ptr<Term> left, unique_ptr<Term> right) const;

	const CompilerConfig &GetConfig() const {
		return config;
	}
	//! Set a configuration option by name and apply the new logging configuration
	void SetOptionByName(const string &name, const Value &value);
	void ResetOption(const string &name);

	LogManager &GetLogManager() const {
		return *log_manager;
	}
	Logger &GetLogger() const {
		return *logger;
	}

private:
	//! Switch to a new configuration; the current one stays in place if the new one cannot be applied
	void ApplyConfig(CompilerConfig new_config);

private:
	CompilerConfig config;
	unique_ptr<LogManager> log_manager;
	unique_ptr<Logger> logger;
};

} // namespace sqlcmp
