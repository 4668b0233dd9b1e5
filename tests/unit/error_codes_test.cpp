#include <tessera/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using tessera::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
}

TEST_CASE("error code names", "[errors]") {
  using tessera::core::error_code;
  using tessera::core::to_string;
  REQUIRE(to_string(error_code::ok) == "ok");
  REQUIRE(to_string(error_code::not_found) == "not_found");
  REQUIRE(to_string(static_cast<error_code>(9001)) == "unknown");
}

TEST_CASE("default error payload is a lookup miss", "[errors]") {
  const tessera::core::error e{};
  REQUIRE(e.code == tessera::core::error_code::not_found);
  REQUIRE(e.message.empty());
  REQUIRE(e.component.empty());
}
