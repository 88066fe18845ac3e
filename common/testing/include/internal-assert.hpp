#pragma once

#include <catch2/catch_test_macros.hpp>

// Failure of the test harness itself, not of the code under test
#define INTERNAL_ASSERT(cond)                                                  \
    do {                                                                       \
        INFO("This is an internal assert. Report if it fails");                \
        REQUIRE(cond);                                                         \
    } while (false)
