#ifndef __SB_TEST_HEADERS__
#define __SB_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"
#include "nlohmann/json.hpp"

using json = nlohmann::json;

#endif  // __SB_TEST_HEADERS__
