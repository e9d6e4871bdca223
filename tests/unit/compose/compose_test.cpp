#include <herald/compose/compose.hpp>
#include <snitch/snitch.hpp>

namespace opt = herald::compose::opt;
using herald::compose::make_message;
using herald::types::list_t;
using herald::types::value_c;

TEST_CASE("message construction", "[unit][compose][message]") {
  auto msg = make_message("ice", 9, herald::compose::kw("name", "fox"),
                          opt::sep(", "), opt::end("!"), opt::wrap(true),
                          opt::culprit({"data.in", 12}),
                          opt::codicil({"one", "two"}), opt::urgency("low"));

  REQUIRE(msg.args.size() == 2);
  CHECK(msg.args[0] == value_c("ice"));
  CHECK(msg.args[1] == value_c(9));
  CHECK(msg.kwargs.at("name") == value_c("fox"));
  CHECK(msg.sep == std::string(", "));
  CHECK(msg.end == std::string("!"));
  CHECK(msg.wrap == std::size_t{70});
  REQUIRE(msg.culprit.has_value());
  CHECK(*msg.culprit == list_t{value_c("data.in"), value_c(12)});
  CHECK(msg.codicil == std::vector<std::string>{"one", "two"});
  CHECK(msg.urgency == std::string("low"));
  CHECK(msg.file == nullptr);
}

TEST_CASE("joining without templates", "[unit][compose][join]") {
  CHECK(herald::compose::join(make_message("ice", 9)) == "ice 9");
  CHECK(herald::compose::join(make_message("a", "b", opt::sep("-"))) == "a-b");
  CHECK(herald::compose::join(make_message()) == "");
  CHECK(herald::compose::join(make_message(1.5, true)) == "1.5 true");
}

TEST_CASE("template candidate selection", "[unit][compose][join]") {
  auto candidates = opt::tmpl({"{name} has {count} items.", "{name} is empty.",
                               "nothing to report."});

  SECTION("first usable candidate wins") {
    CHECK(herald::compose::join(make_message(herald::compose::kw("name", "box"),
                                             herald::compose::kw("count", 3),
                                             candidates)) ==
          "box has 3 items.");
  }

  SECTION("falsy values make a candidate unusable") {
    CHECK(herald::compose::join(make_message(herald::compose::kw("name", "box"),
                                             herald::compose::kw("count", 0),
                                             candidates)) == "box is empty.");
  }

  SECTION("missing values make a candidate unusable") {
    CHECK(herald::compose::join(make_message(candidates)) ==
          "nothing to report.");
  }

  SECTION("unusable candidates in front do not change the choice") {
    auto msg = make_message(herald::compose::kw("name", "box"),
                            herald::compose::kw("count", 0));
    auto reordered = msg;
    msg.templates = {"{name} has {count} items.", "{name} is empty."};
    reordered.templates = {"{missing}", "{name} has {count} items.",
                           "{name} is empty."};
    CHECK(herald::compose::join(msg) == herald::compose::join(reordered));
  }

  SECTION("a remove policy replaces falsiness") {
    CHECK(herald::compose::join(make_message(
              herald::compose::kw("name", "box"),
              herald::compose::kw("count", 0), candidates,
              opt::remove(std::vector<value_c>{value_c()}))) ==
          "box has 0 items.");
  }

  SECTION("no usable candidate falls back to the last, leniently") {
    CHECK(herald::compose::join(make_message(opt::tmpl({"{a}", "[{b}]"}))) ==
          "[]");
  }

  SECTION("positional references") {
    CHECK(herald::compose::join(make_message("x", "y", opt::tmpl("{1}{0}"))) ==
          "yx");
    CHECK(herald::compose::join(
              make_message("x", opt::tmpl({"{0} {1}", "{0} alone"}))) ==
          "x alone");
  }

  SECTION("malformed templates raise") {
    CHECK_THROWS_AS(herald::compose::join(make_message(opt::tmpl("{"))),
                    herald::compose::template_error_c);
  }
}

TEST_CASE("cull", "[unit][compose][cull]") {
  list_t values = {value_c("a"), value_c(0), value_c(), value_c("")};
  CHECK(herald::compose::cull(values) == list_t{value_c("a")});
  CHECK(herald::compose::cull(values, value_c(0)) ==
        list_t{value_c("a"), value_c(), value_c("")});
}

TEST_CASE("wrapping", "[unit][compose][wrap]") {
  auto msg = make_message("the quick brown fox", opt::wrap(10));
  CHECK(herald::compose::join(msg) == "the quick\nbrown fox");

  auto unwrapped = make_message("the quick brown fox", opt::wrap(false));
  CHECK(herald::compose::join(unwrapped) == "the quick brown fox");
}

TEST_CASE("layout", "[unit][compose][layout]") {
  using herald::compose::assembly_s;
  using herald::compose::layout;

  SECTION("culprit joins the body") {
    auto out = layout(assembly_s{.culprit = "data.in", .body = "missing."});
    CHECK(out.text() == "data.in: missing.");
  }

  SECTION("culprit with a multi-line body stands alone") {
    auto out = layout(assembly_s{.culprit = "data.in", .body = "a\nb"});
    CHECK(out.text() == "data.in:\n    a\n    b");
  }

  SECTION("culprit without a body") {
    auto out = layout(assembly_s{.culprit = "data.in"});
    CHECK(out.text() == "data.in:");
  }

  SECTION("header with a multi-line body") {
    auto out = layout(assembly_s{.header = "prog error: ", .body = "a\nb"});
    CHECK(out.header == "prog error:");
    CHECK(out.body == "\n    a\n    b");
  }

  SECTION("header with culprit") {
    auto out = layout(
        assembly_s{.header = "prog error: ", .culprit = "x", .body = "bad."});
    CHECK(out.text() == "prog error: x: bad.");
  }

  SECTION("header without a body") {
    auto out = layout(assembly_s{.header = "prog error: "});
    CHECK(out.text() == "prog error:");
  }

  SECTION("codicil lines under a header are indented") {
    auto out = layout(assembly_s{
        .header = "warning: ", .body = "odd.", .codicil = {"one", "two"}});
    CHECK(out.text() == "warning: odd.\n    one\n    two");
  }

  SECTION("codicil lines without a header are not") {
    auto out = layout(assembly_s{.body = "odd.", .codicil = {"one"}});
    CHECK(out.text() == "odd.\none");
  }

  SECTION("continuations drop the header and indent") {
    auto out = layout(assembly_s{.header = "warning: ",
                                 .body = "skipping",
                                 .continuation = true,
                                 .stops = 1});
    CHECK(out.header == "");
    CHECK(out.text() == "    skipping");
  }
}

TEST_CASE("compose", "[unit][compose]") {
  SECTION("arguments joined and terminated") {
    CHECK(herald::compose::compose(make_message("ice", 9)) == "ice 9\n");
    CHECK(herald::compose::compose(make_message("ice", opt::end(""))) ==
          "ice");
  }

  SECTION("stacked culprit") {
    CHECK(herald::compose::compose(make_message("file not found."),
                                   {value_c("data.in"), value_c(4)}) ==
          "data.in, 4: file not found.\n");
  }

  SECTION("explicit culprit replaces the stacked one") {
    CHECK(herald::compose::compose(
              make_message("bad.", opt::culprit("mine")),
              {value_c("stacked")}) == "mine: bad.\n");
  }

  SECTION("none entries are skipped") {
    CHECK(herald::compose::compose(
              make_message("bad.", opt::culprit({"a", value_c(), "b"})), {},
              "/") == "a/b: bad.\n");
  }

  SECTION("codicil lines are wrapped like the body") {
    CHECK(herald::compose::compose(make_message(
              "aa bb", opt::wrap(5), opt::codicil("cc dd ee"))) ==
          "aa bb\ncc dd\nee\n");
  }
}

TEST_CASE("merging overrides", "[unit][compose][merge]") {
  auto base = make_message("a", herald::compose::kw("k", 1),
                           opt::culprit("inner"), opt::codicil("first"));
  auto overrides =
      make_message("b", herald::compose::kw("k", 2), opt::culprit("outer"),
                   opt::codicil("second"), opt::sep("+"));
  herald::compose::merge(base, overrides);

  CHECK(base.args == list_t{value_c("a"), value_c("b")});
  CHECK(base.kwargs.at("k") == value_c(2));
  CHECK(*base.culprit == list_t{value_c("outer"), value_c("inner")});
  CHECK(base.codicil == std::vector<std::string>{"first", "second"});
  CHECK(base.sep == std::string("+"));
}
