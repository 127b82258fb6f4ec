#ifndef __OX_TEST_HEADERS__
#define __OX_TEST_HEADERS__

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "Headers.hpp"

#endif  // __OX_TEST_HEADERS__
