#include <cstdint>
#include <filesystem>
#include <limits>
#include <herald/types/value.hpp>
#include <snitch/snitch.hpp>

using herald::types::list_t;
using herald::types::map_t;
using herald::types::value_c;
using herald::types::value_type_e;

TEST_CASE("value kinds", "[unit][types][value]") {
  CHECK(value_c().type() == value_type_e::NONE);
  CHECK(value_c(true).type() == value_type_e::BOOLEAN);
  CHECK(value_c(42).type() == value_type_e::INTEGER);
  CHECK(value_c(42u).type() == value_type_e::INTEGER);
  CHECK(value_c(2.5).type() == value_type_e::REAL);
  CHECK(value_c("ice").type() == value_type_e::STRING);
  CHECK(value_c('x').type() == value_type_e::STRING);
  CHECK(value_c(std::filesystem::path("a/b")).type() == value_type_e::STRING);
  CHECK(value_c::list({1, "two"}).type() == value_type_e::LIST);
  CHECK(value_c(map_t{{"k", value_c(1)}}).type() == value_type_e::MAP);
}

TEST_CASE("value rendering", "[unit][types][value]") {
  SECTION("scalars") {
    CHECK(value_c().to_string() == "");
    CHECK(value_c(true).to_string() == "true");
    CHECK(value_c(9).to_string() == "9");
    CHECK(value_c(-3).to_string() == "-3");
    CHECK(value_c(2.5).to_string() == "2.5");
    CHECK(value_c("ice").to_string() == "ice");
  }

  SECTION("wide unsigned integers keep their digits") {
    CHECK(value_c(std::numeric_limits<std::uint64_t>::max()).to_string() ==
          "18446744073709551615");
    CHECK(value_c(std::uint64_t{9}).type() == value_type_e::INTEGER);
    CHECK(value_c(std::numeric_limits<std::int64_t>::min()).to_string() ==
          "-9223372036854775808");
  }

  SECTION("containers use repr for their elements") {
    CHECK(value_c::list({1, "two"}).to_string() == "[1, 'two']");
    CHECK(value_c(map_t{{"a", value_c(1)}, {"b", value_c("x")}}).to_string() ==
          "{'a': 1, 'b': 'x'}");
  }

  SECTION("repr quotes strings") {
    CHECK(value_c("it's").repr() == "'it\\'s'");
    CHECK(value_c().repr() == "none");
    CHECK(value_c(7).repr() == "7");
  }
}

TEST_CASE("value format specs", "[unit][types][value]") {
  CHECK(value_c(7).format(">3") == "  7");
  CHECK(value_c(3.14159).format(".2f") == "3.14");
  CHECK(value_c("ab").format("<4") == "ab  ");
  CHECK(value_c(7).format("") == "7");
  CHECK_THROWS_AS(value_c("ab").format("d"), fmt::format_error);
}

TEST_CASE("value truthiness", "[unit][types][value]") {
  CHECK_FALSE(value_c().truthy());
  CHECK_FALSE(value_c(false).truthy());
  CHECK_FALSE(value_c(0).truthy());
  CHECK_FALSE(value_c(0.0).truthy());
  CHECK_FALSE(value_c("").truthy());
  CHECK_FALSE(value_c(list_t{}).truthy());
  CHECK(value_c(1).truthy());
  CHECK(value_c("x").truthy());
  CHECK(value_c::list({0}).truthy());
}

TEST_CASE("value lookup", "[unit][types][value]") {
  auto list = value_c::list({"a", "b"});
  REQUIRE(list.element(1) != nullptr);
  CHECK(list.element(1)->as_string() == "b");
  CHECK(list.element(2) == nullptr);
  CHECK(list.member("a") == nullptr);

  value_c map(map_t{{"name", value_c("ice")}});
  REQUIRE(map.member("name") != nullptr);
  CHECK(map.member("name")->as_string() == "ice");
  CHECK(map.member("other") == nullptr);
  CHECK(map.element(0) == nullptr);
}

TEST_CASE("value equality", "[unit][types][value]") {
  CHECK(value_c(1) == value_c(1.0));
  CHECK(value_c("a") == value_c(std::string("a")));
  CHECK(value_c() == herald::types::none());
  CHECK(value_c(1) != value_c("1"));
  CHECK(value_c::list({1, 2}) == value_c::list({1, 2}));
  CHECK(value_c::list({1, 2}) != value_c::list({2, 1}));
}

TEST_CASE("value accessors reject the wrong kind", "[unit][types][value]") {
  CHECK(value_c(4).as_int() == 4);
  CHECK(value_c(4).as_real() == 4.0);
  CHECK_THROWS_AS(value_c("x").as_int(), std::runtime_error);
  CHECK_THROWS_AS(value_c(1).as_string(), std::runtime_error);
  CHECK_THROWS_AS(value_c(1).as_list(), std::runtime_error);
}
