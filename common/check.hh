#pragma once

#include "assert/assert.hpp"

// Throws keyrelay::check_failure with the stringified expression and any extra values
#define KEYRELAY_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "KEYRELAY_CHECK", verification, , __VA_ARGS__)

namespace keyrelay {
using check_failure = libassert::verification_failure;
}
