#ifndef GRADEBOX_COMPARE_OUTPUT_COMPARE_HPP
#define GRADEBOX_COMPARE_OUTPUT_COMPARE_HPP

#include <string>
#include <string_view>

namespace gradebox::compare {

// Normalize line endings (\r\n and lone \r) to \n
auto NormalizeNewlines(std::string_view input) -> std::string;

// Canonical form used for grading: whitespace stripped from both ends of the
// whole text, line endings unified, trailing whitespace removed from every
// line. Leading indentation of inner lines is kept.
auto NormalizeOutput(std::string_view output) -> std::string;

// Output check for one test case. An empty `expected` accepts any output
// (the run itself must still have exited cleanly, which the caller checks);
// otherwise the normalized forms must be equal.
auto Matches(std::string_view actual, std::string_view expected) -> bool;

}  // namespace gradebox::compare

#endif  // GRADEBOX_COMPARE_OUTPUT_COMPARE_HPP
