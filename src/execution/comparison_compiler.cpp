#include "sqlcmp/execution/comparison_compiler.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/execution/comparison/comparison_null_check.hpp"
#include "sqlcmp/execution/comparison/comparison_resolver.hpp"

namespace sqlcmp {

static constexpr const char *COMPARISON_RESOLUTION_LOG_TYPE = "comparison_resolution";

//! The operators that structural equality can answer
static bool IsEqualityComparison(ExpressionType type) {
	switch (type) {
	case ExpressionType::COMPARE_EQUAL:
	case ExpressionType::COMPARE_NOTEQUAL:
	case ExpressionType::COMPARE_DISTINCT_FROM:
		return true;
	default:
		return false;
	}
}

ComparisonCompiler::ComparisonCompiler(CompilerConfig config_p) : config(std::move(config_p)) {
	log_manager = make_uniq<LogManager>(config.options.log_config);
	logger = log_manager->CreateLogger();
}

ComparisonCompiler::~ComparisonCompiler() {
}

void ComparisonCompiler::ApplyConfig(CompilerConfig new_config) {
	log_manager->SetConfig(new_config.options.log_config);
	config = std::move(new_config);
	logger = log_manager->CreateLogger();
}

void ComparisonCompiler::SetOptionByName(const string &name, const Value &value) {
	auto new_config = config;
	new_config.SetOptionByName(name, value);
	ApplyConfig(std::move(new_config));
}

void ComparisonCompiler::ResetOption(const string &name) {
	auto new_config = config;
	new_config.ResetOption(name);
	ApplyConfig(std::move(new_config));
}

unique_ptr<ComparisonTerm> ComparisonCompiler::Compile(ExpressionType type, unique_ptr<Term> left,
                                                       unique_ptr<Term> right) const {
	if (!left || !right) {
		throw InternalException("ComparisonCompiler::Compile requires both operands");
	}
	auto left_type = left->ReturnType();
	auto right_type = right->ReturnType();
	if (!IsResolvableComparison(type)) {
		SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE, "rejected operator %s between %s and %s", type,
		                 left_type, right_type);
		throw UnsupportedComparisonException("Unsupported comparison between %s and %s: %s", left_type, right_type,
		                                     type);
	}
	auto null_check = ComparisonNullCheck::Select(type);

	auto equals = ComparisonResolver::ResolveEquals(left_type, right_type);
	if (equals) {
		if (!IsEqualityComparison(type)) {
			SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE,
			                 "rejected %s between %s and %s: only equality is defined", type, left_type, right_type);
			throw UnsupportedComparisonException("Unsupported comparison between %s and %s: %s", left_type,
			                                     right_type, type);
		}
		if (config.options.comparison_require_same_equality_types && left_type.id() != right_type.id()) {
			SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE,
			                 "rejected equality %s between mismatched types %s and %s", type, left_type, right_type);
			throw UnsupportedComparisonException("Unsupported comparison between %s and %s: %s", left_type,
			                                     right_type, type);
		}
		auto result = ComparisonTermBuilder::BuildEqualsTerm(type, std::move(left), std::move(right),
		                                                     std::move(null_check), std::move(equals));
		SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE, "resolved %s between %s and %s as structural equality",
		                 type, left_type, right_type);
		return result;
	}

	auto comparator = ComparisonResolver::ResolveComparator(left_type, right_type);
	if (comparator) {
		auto result = ComparisonTermBuilder::BuildComparisonTerm(type, std::move(left), std::move(right),
		                                                         std::move(null_check), std::move(comparator));
		SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE, "resolved %s between %s and %s as ordering", type,
		                 left_type, right_type);
		return result;
	}

	SQLCMP_LOG_DEBUG(*this, COMPARISON_RESOLUTION_LOG_TYPE, "no comparison exists between %s and %s for %s", left_type,
	                 right_type, type);
	throw UnsupportedComparisonException("Unsupported comparison between %s and %s: %s", left_type, right_type, type);
}

} // namespace sqlcmp
