//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types/value.hpp"
#include "sqlcmp/execution/comparison/comparison_coercion.hpp"
#include "sqlcmp/execution/comparison/comparison_null_check.hpp"
#include "sqlcmp/execution/comparison/comparison_resolver.hpp"
#include "sqlcmp/execution/comparison/comparison_term.hpp"
#include "sqlcmp/execution/comparison_compiler.hpp"
#include "sqlcmp/main/config.hpp"
