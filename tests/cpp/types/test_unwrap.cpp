#include <catch2/catch_test_macros.hpp>
#include <propmap/types/type_api.h>
#include <propmap/types/unwrap.h>
#include <propmap/util/errors.h>

using namespace propmap;

TEST_CASE("is_optional_type", "[unwrap]") {
    REQUIRE(is_optional_type(type_of<Absent>()));
    REQUIRE(is_optional_type(type_of<Optional<std::string>>()));
    REQUIRE(is_optional_type(type_of<Union<std::string, int64_t, Absent>>()));
    REQUIRE_FALSE(is_optional_type(type_of<std::string>()));
    REQUIRE_FALSE(is_optional_type(type_of<Union<std::string, int64_t>>()));
    REQUIRE_FALSE(is_optional_type(type_of<Deferred<Optional<std::string>>>()));
}

TEST_CASE("unwrap_optional_type - unwraps the two alternative form", "[unwrap]") {
    auto str = type_of<std::string>();

    REQUIRE(unwrap_optional_type(type_of<Optional<std::string>>()) == str);
    REQUIRE(unwrap_optional_type(type_of<Union<Absent, std::string>>()) == str);
    REQUIRE(unwrap_optional_type(str) == str);
}

TEST_CASE("unwrap_optional_type - wider unions are unchanged", "[unwrap]") {
    auto wide = type_of<Union<std::string, int64_t, Absent>>();
    auto plain_union = type_of<Union<std::string, int64_t>>();

    REQUIRE(unwrap_optional_type(wide) == wide);
    REQUIRE(unwrap_optional_type(plain_union) == plain_union);
    REQUIRE(unwrap_optional_type(type_of<Absent>()) == type_of<Absent>());
}

TEST_CASE("unwrap_type - strips Deferred then Optional once each", "[unwrap]") {
    auto str = type_of<std::string>();

    REQUIRE(unwrap_type(str) == str);
    REQUIRE(unwrap_type(type_of<Deferred<std::string>>()) == str);
    REQUIRE(unwrap_type(type_of<Optional<std::string>>()) == str);
    REQUIRE(unwrap_type(type_of<Deferred<Optional<std::string>>>()) == str);

    REQUIRE(unwrap_type(type_of<Deferred<Deferred<std::string>>>()) == type_of<Deferred<std::string>>());
    REQUIRE(unwrap_type(type_of<Optional<Deferred<std::string>>>()) == type_of<Deferred<std::string>>());
    REQUIRE(unwrap_type(type_of<Deferred<Optional<Optional<std::string>>>>()) == str);
    REQUIRE(unwrap_type(type_of<List<Optional<std::string>>>()) == type_of<List<Optional<std::string>>>());
}

TEST_CASE("unwrap - null types are rejected", "[unwrap]") {
    REQUIRE_THROWS_AS(unwrap_type(nullptr), invalid_argument_error);
    REQUIRE_THROWS_AS(unwrap_optional_type(nullptr), invalid_argument_error);
    REQUIRE_THROWS_AS(is_optional_type(nullptr), invalid_argument_error);
}
