#include "gradebox/question/question.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "gradebox/common/overloaded.hpp"
#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/evaluator/report.hpp"

namespace gradebox::question {

namespace {

auto Trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\n\r\f\v";
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

auto EvaluateCoding(
    const CodingExerciseQuestion& question, std::string_view submission,
    evaluator::Evaluator& engine) -> Verdict {
  auto result = engine.Evaluate(submission, question.test_cases);
  if (evaluator::Classify(result) == evaluator::OutcomeKind::kInternalError) {
    spdlog::warn(
        "question: engine unavailable ({}), using text comparison",
        result.error().message);
    return Verdict{
        .correct = AnswersMatch(submission, question.reference_solution),
        .used_fallback = true,
        .engine_result = std::move(result),
    };
  }
  bool correct = result->overall_correct;
  return Verdict{
      .correct = correct,
      .used_fallback = false,
      .engine_result = std::move(result),
  };
}

}  // namespace

auto AnswersMatch(std::string_view submitted, std::string_view expected)
    -> bool {
  return ToLower(Trim(submitted)) == ToLower(Trim(expected));
}

auto EvaluateAnswer(
    const Question& question, std::string_view submission,
    evaluator::Evaluator& engine) -> Verdict {
  return std::visit(
      Overloaded{
          [&](const MultipleChoiceQuestion& q) {
            return Verdict{.correct = AnswersMatch(submission, q.correct_answer)};
          },
          [&](const FillInBlankQuestion& q) {
            return Verdict{.correct = AnswersMatch(submission, q.correct_answer)};
          },
          [&](const CodingExerciseQuestion& q) {
            return EvaluateCoding(q, submission, engine);
          },
      },
      question);
}

}  // namespace gradebox::question
