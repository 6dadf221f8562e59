#ifndef __ST_TEST_HEADERS__
#define __ST_TEST_HEADERS__

#include <catch2/catch_all.hpp>

#include "Headers.hpp"

using Catch::Matchers::ContainsSubstring;

#endif  // __ST_TEST_HEADERS__
