#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <f1mc/fuel.hpp>

using namespace f1mc;
using Catch::Approx;

TEST_CASE("fuel_penalty") {
  SECTION("burns from the start of the race") {
    REQUIRE(fuel_penalty(1, 110.0) == Approx((110.0 - 2.1) * 0.03));
  }

  SECTION("decreases lap by lap") {
    REQUIRE(fuel_penalty(20, 110.0) < fuel_penalty(10, 110.0));
  }

  SECTION("never negative once the tank is empty") {
    REQUIRE(fuel_penalty(60, 110.0) == Approx(0.0));
  }

  SECTION("zero load means zero penalty") {
    REQUIRE(fuel_penalty(1, 0.0) == Approx(0.0));
  }

  SECTION("custom burn rate") {
    REQUIRE(fuel_penalty(10, 50.0, 1.0) == Approx(40.0 * 0.03));
  }
}
