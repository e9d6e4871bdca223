#include <cerrno>
#include <herald/text/text.hpp>
#include <snitch/snitch.hpp>

TEST_CASE("indent", "[unit][text]") {
  SECTION("every line by one stop") {
    CHECK(herald::text::indent("a\nb") == "    a\n    b");
  }

  SECTION("hanging first line") {
    CHECK(herald::text::indent("And the answer is ...\n42!", "    ", -1) ==
          "And the answer is ...\n    42!");
  }

  SECTION("blank lines stay empty") {
    CHECK(herald::text::indent("a\n\nb", "  ") == "  a\n\n  b");
  }

  SECTION("custom leader and stops") {
    CHECK(herald::text::indent("x", "..", 0, 2) == "....x");
  }
}

TEST_CASE("split and strip", "[unit][text]") {
  auto lines = herald::text::split_lines("a\nb\n");
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "a");
  CHECK(lines[2] == "");
  CHECK(herald::text::split_lines("").size() == 1);
  CHECK(herald::text::rstrip("abc  \n") == "abc");
  CHECK(herald::text::rstrip("   ") == "");
}

TEST_CASE("wrap", "[unit][text]") {
  SECTION("greedy fill") {
    CHECK(herald::text::wrap("the quick brown fox", 10) ==
          "the quick\nbrown fox");
  }

  SECTION("newlines are hard breaks") {
    CHECK(herald::text::wrap("aa bb\ncc dd", 5) == "aa bb\ncc dd");
    CHECK(herald::text::wrap("aa bb cc\ndd", 5) == "aa bb\ncc\ndd");
  }

  SECTION("long words stand alone") {
    CHECK(herald::text::wrap("a verylongword b", 4) == "a\nverylongword\nb");
  }

  SECTION("leading indentation is kept") {
    CHECK(herald::text::wrap("  aa bb", 5) == "  aa\nbb");
  }
}

TEST_CASE("full stop", "[unit][text]") {
  CHECK(herald::text::full_stop("done") == "done.");
  CHECK(herald::text::full_stop("done.") == "done.");
  CHECK(herald::text::full_stop("really?") == "really?");
  CHECK(herald::text::full_stop("wow!") == "wow!");
  CHECK(herald::text::full_stop("") == "");
  CHECK(herald::text::full_stop("x", ";", ";") == "x;");
}

TEST_CASE("os error descriptions", "[unit][text]") {
  std::error_code missing(ENOENT, std::generic_category());

  CHECK(herald::text::os_error(missing, "data.in") ==
        "data.in: no such file or directory.");
  CHECK(herald::text::os_error(missing, "a", "b") ==
        "a -> b: no such file or directory.");
  CHECK(herald::text::os_error(missing) == "no such file or directory.");

  std::filesystem::filesystem_error error("rename", "a", "b", missing);
  CHECK(herald::text::os_error(error) == "a -> b: no such file or directory.");
}
