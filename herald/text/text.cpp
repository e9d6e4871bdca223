#include "herald/text/text.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace herald::text {

namespace {

std::string repeat(std::string_view leader, int count) {
  std::string result;
  for (int i = 0; i < count; i++) {
    result += leader;
  }
  return result;
}

std::vector<std::string> split_words(std::string_view line) {
  std::vector<std::string> words;
  std::istringstream stream{std::string(line)};
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

std::string wrap_line(std::string_view line, std::size_t width) {
  auto lead_end = line.find_first_not_of(" \t");
  if (lead_end == std::string_view::npos) {
    return "";
  }
  std::string current(line.substr(0, lead_end));
  bool current_has_word = false;
  std::string result;

  for (const auto &word : split_words(line.substr(lead_end))) {
    if (!current_has_word) {
      current += word;
      current_has_word = true;
      continue;
    }
    if (current.size() + 1 + word.size() > width) {
      result += current + "\n";
      current = word;
      continue;
    }
    current += " " + word;
  }
  return result + current;
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    auto pos = text.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string rstrip(std::string_view text) {
  auto end = text.find_last_not_of(" \t\r\n\f\v");
  if (end == std::string_view::npos) {
    return "";
  }
  return std::string(text.substr(0, end + 1));
}

std::string indent(std::string_view text, std::string_view leader, int first,
                   int stops) {
  auto lines = split_lines(text);
  std::string result;
  for (std::size_t i = 0; i < lines.size(); i++) {
    if (i) {
      result += "\n";
    }
    auto prefix = repeat(leader, i == 0 ? first + stops : stops);
    result += rstrip(prefix + lines[i]);
  }
  return result;
}

std::string wrap(std::string_view text, std::size_t width) {
  if (width == 0) {
    width = DEFAULT_WRAP_WIDTH;
  }
  auto lines = split_lines(text);
  std::string result;
  for (std::size_t i = 0; i < lines.size(); i++) {
    if (i) {
      result += "\n";
    }
    result += wrap_line(lines[i], width);
  }
  return result;
}

std::string full_stop(std::string_view sentence, std::string_view end,
                      std::string_view allow) {
  if (sentence.empty()) {
    return std::string(sentence);
  }
  if (allow.find(sentence.back()) != std::string_view::npos) {
    return std::string(sentence);
  }
  return std::string(sentence) + std::string(end);
}

std::string os_error(const std::error_code &code,
                     const std::filesystem::path &path1,
                     const std::filesystem::path &path2) {
  std::string filenames = path1.string();
  if (!path2.empty()) {
    filenames += filenames.empty() ? path2.string() : " -> " + path2.string();
  }

  auto description = code.message();
  std::transform(description.begin(), description.end(), description.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (filenames.empty()) {
    return full_stop(description);
  }
  if (description.empty()) {
    return full_stop(filenames);
  }
  return full_stop(filenames + ": " + description);
}

std::string os_error(const std::filesystem::filesystem_error &error) {
  return os_error(error.code(), error.path1(), error.path2());
}

} // namespace herald::text
