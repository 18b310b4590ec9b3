//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/common.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/constants.hpp"
#include "sqlcmp/common/helper.hpp"
#include "sqlcmp/common/assert.hpp"
