#include <verdict/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using verdict::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::out_of_range) == 9004u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_operator_for_type) == 10001u);
  REQUIRE(static_cast<unsigned>(error_code::missing_attribute) == 10003u);
}

TEST_CASE("error code names", "[errors]") {
  using verdict::core::error_code;
  using verdict::core::to_string;
  REQUIRE(to_string(error_code::type_mismatch) == "type_mismatch");
  REQUIRE(to_string(error_code::missing_attribute) == "missing_attribute");
  REQUIRE(to_string(error_code::resource_exhausted) == "resource_exhausted");
  REQUIRE(to_string(static_cast<error_code>(12345)) == "unknown");
}
