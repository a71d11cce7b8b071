#include <doctest/doctest.h>

#include <faceid/core/core.hpp>

#include <string_view>

namespace {

constexpr std::string_view kStringified = FACEID_STRINGIFY(faceid_token);

}  // namespace

TEST_SUITE("faceid::Core") {
  TEST_CASE("FACEID_STRINGIFY: Produces the token text") {
    CHECK_EQ(kStringified, "faceid_token");
  }

  TEST_CASE("FACEID_CONCAT: Joins tokens") {
    const int FACEID_CONCAT(joined_, name) = 7;
    CHECK_EQ(joined_name, 7);
  }

  TEST_CASE("FACEID_EXPECT_TRUE: Preserves the value") {
    CHECK(FACEID_EXPECT_TRUE(3 > 2));
    CHECK_FALSE(FACEID_EXPECT_FALSE(3 < 2));
  }
}
