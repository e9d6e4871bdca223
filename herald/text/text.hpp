#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace herald::text {

constexpr std::size_t DEFAULT_WRAP_WIDTH = 70;

// Splits on '\n'. An empty text yields a single empty line.
std::vector<std::string> split_lines(std::string_view text);

std::string rstrip(std::string_view text);

/*
    Indents every line of text by `stops` copies of leader; the first line
    gets `first + stops` copies (first may be negative). Trailing white space
    is removed from every resulting line so blank lines stay empty.
*/
std::string indent(std::string_view text, std::string_view leader = "    ",
                   int first = 0, int stops = 1);

// Greedy word wrap of each physical line. Embedded newlines are kept as hard
// breaks; a word longer than width is left on a line of its own.
std::string wrap(std::string_view text,
                 std::size_t width = DEFAULT_WRAP_WIDTH);

// Adds end unless the text already finishes with one of the allowed marks
std::string full_stop(std::string_view sentence, std::string_view end = ".",
                      std::string_view allow = ".?!");

/*
    Turns an operating system error into "path -> path2: description."
    with the description lower cased.
*/
std::string os_error(const std::error_code &code,
                     const std::filesystem::path &path1 = {},
                     const std::filesystem::path &path2 = {});
std::string os_error(const std::filesystem::filesystem_error &error);

} // namespace herald::text
