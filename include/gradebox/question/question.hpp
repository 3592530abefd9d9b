#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::question {

struct MultipleChoiceQuestion {
  std::string prompt;
  std::vector<std::string> options;
  std::string correct_answer;
};

struct FillInBlankQuestion {
  std::string prompt;
  std::string correct_answer;
};

// Graded by running the submission through the engine. The reference
// solution is only consulted by the text fallback.
struct CodingExerciseQuestion {
  std::string prompt;
  std::vector<testcase::TestCase> test_cases;
  std::string reference_solution;
};

using Question = std::variant<
    MultipleChoiceQuestion, FillInBlankQuestion, CodingExerciseQuestion>;

struct Verdict {
  bool correct = false;
  // True when the engine was unusable and the text comparison decided
  bool used_fallback = false;
  // Engine outcome; set only for coding exercises
  std::optional<Result<evaluator::EvaluationReport>> engine_result;
};

// Case-insensitive comparison of answers trimmed at both ends
auto AnswersMatch(std::string_view submitted, std::string_view expected)
    -> bool;

auto EvaluateAnswer(
    const Question& question, std::string_view submission,
    evaluator::Evaluator& engine) -> Verdict;

}  // namespace gradebox::question
