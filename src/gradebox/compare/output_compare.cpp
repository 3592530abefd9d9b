#include "gradebox/compare/output_compare.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace gradebox::compare {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
// Trailing whitespace within a line; \n is the separator and never reaches here
constexpr std::string_view kLineWhitespace = " \t\r\f\v";

auto Strip(std::string_view sv) -> std::string_view {
  auto first = sv.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = sv.find_last_not_of(kWhitespace);
  return sv.substr(first, last - first + 1);
}

auto RightTrimLine(std::string_view line) -> std::string_view {
  auto last = line.find_last_not_of(kLineWhitespace);
  if (last == std::string_view::npos) {
    return {};
  }
  return line.substr(0, last + 1);
}

}  // namespace

auto NormalizeNewlines(std::string_view input) -> std::string {
  std::string result;
  result.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (c == '\r') {
      result += '\n';
      if (i + 1 < input.size() && input[i + 1] == '\n') {
        ++i;
      }
    } else {
      result += c;
    }
  }
  return result;
}

auto NormalizeOutput(std::string_view output) -> std::string {
  std::string unified = NormalizeNewlines(Strip(output));
  std::string_view text = unified;

  std::string result;
  result.reserve(text.size());
  std::size_t begin = 0;
  while (true) {
    auto end = text.find('\n', begin);
    auto line = text.substr(
        begin, end == std::string_view::npos ? std::string_view::npos
                                             : end - begin);
    result += RightTrimLine(line);
    if (end == std::string_view::npos) {
      break;
    }
    result += '\n';
    begin = end + 1;
  }
  return result;
}

auto Matches(std::string_view actual, std::string_view expected) -> bool {
  if (expected.empty()) {
    return true;
  }
  return NormalizeOutput(actual) == NormalizeOutput(expected);
}

}  // namespace gradebox::compare
