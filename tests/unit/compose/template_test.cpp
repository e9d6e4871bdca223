#include <herald/compose/template.hpp>
#include <snitch/snitch.hpp>

using herald::compose::remove_policy_c;
using herald::compose::template_c;
using herald::compose::template_error_c;
using herald::types::list_t;
using herald::types::map_t;
using herald::types::value_c;

TEST_CASE("template parsing", "[unit][compose][template]") {
  SECTION("automatic positional fields") {
    template_c t("{} and {}");
    REQUIRE(t.fields().size() == 2);
    CHECK(t.fields()[0].index == 0u);
    CHECK(t.fields()[1].index == 1u);
  }

  SECTION("named fields with accessors, conversion and spec") {
    template_c t("{v.name[0]!r:>8}");
    REQUIRE(t.fields().size() == 1);
    const auto &field = t.fields()[0];
    CHECK(field.name == "v");
    REQUIRE(field.accessors.size() == 2);
    CHECK(field.accessors[0].key == "name");
    CHECK(field.accessors[1].key == "0");
    CHECK(field.conversion == 'r');
    CHECK(field.spec == ">8");
  }

  SECTION("escaped braces are literal") {
    template_c t("{{literal}}");
    CHECK(t.fields().empty());
    CHECK(t.fill({}, {}) == "{literal}");
  }

  SECTION("malformed templates") {
    CHECK_THROWS_AS(template_c("{"), template_error_c);
    CHECK_THROWS_AS(template_c("}"), template_error_c);
    CHECK_THROWS_AS(template_c("{a{b}}"), template_error_c);
    CHECK_THROWS_AS(template_c("{} {0}"), template_error_c);
    CHECK_THROWS_AS(template_c("{0} {}"), template_error_c);
    CHECK_THROWS_AS(template_c("{a!x}"), template_error_c);
    CHECK_THROWS_AS(template_c("{a[}"), template_error_c);
    CHECK_THROWS_AS(template_c("{99999999999999999999}"), template_error_c);
  }
}

TEST_CASE("template filling", "[unit][compose][template]") {
  list_t args = {value_c("ice"), value_c(9)};
  map_t kwargs = {{"name", value_c("fox")},
                  {"count", value_c(3)},
                  {"items", value_c::list({"a", "b"})},
                  {"info", value_c(map_t{{"size", value_c(12)}})}};

  CHECK(template_c("{} {}").fill(args, kwargs) == "ice 9");
  CHECK(template_c("{1} {0}").fill(args, kwargs) == "9 ice");
  CHECK(template_c("{name} x{count}").fill(args, kwargs) == "fox x3");
  CHECK(template_c("{items[1]}").fill(args, kwargs) == "b");
  CHECK(template_c("{info.size}").fill(args, kwargs) == "12");
  CHECK(template_c("{info[size]}").fill(args, kwargs) == "12");
  CHECK(template_c("{count:>3}").fill(args, kwargs) == "  3");
  CHECK(template_c("{name!r}").fill(args, kwargs) == "'fox'");
  CHECK(template_c("[{missing}]").fill(args, kwargs) == "[]");
  CHECK_THROWS_AS(template_c("{name:d}").fill(args, kwargs), template_error_c);
}

TEST_CASE("template usability", "[unit][compose][template]") {
  list_t args = {value_c("ice")};
  map_t kwargs = {{"name", value_c("fox")},
                  {"count", value_c(0)},
                  {"items", value_c::list({"a"})}};
  remove_policy_c falsy;

  CHECK(template_c("{} {name}").is_usable(args, kwargs, falsy));
  CHECK_FALSE(template_c("{1}").is_usable(args, kwargs, falsy));
  CHECK_FALSE(template_c("{other}").is_usable(args, kwargs, falsy));
  CHECK_FALSE(template_c("{count}").is_usable(args, kwargs, falsy));
  CHECK_FALSE(template_c("{items[3]}").is_usable(args, kwargs, falsy));

  SECTION("literal removal") {
    remove_policy_c only_none(std::vector<value_c>{value_c()});
    CHECK(template_c("{count}").is_usable(args, kwargs, only_none));
    remove_policy_c foxes(value_c("fox"));
    CHECK_FALSE(template_c("{name}").is_usable(args, kwargs, foxes));
  }

  SECTION("predicate removal") {
    remove_policy_c negative(
        [](const value_c &v) { return v.as_int() < 0; });
    CHECK(template_c("{count}").is_usable(args, {{"count", value_c(0)}},
                                          negative));
    CHECK_FALSE(template_c("{count}").is_usable(args, {{"count", value_c(-1)}},
                                                negative));
  }
}
