#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/question/question.hpp"
#include "tests/common/fake_engine.hpp"
#include "tests/common/test_support.hpp"

namespace gradebox::question {
namespace {

class QuestionTest : public ::testing::Test {
 protected:
  test::TempRoot root_{"question"};
  test::FakeCompiler compiler_{root_.Path()};
  test::FakeRunner runner_{test::EchoBehavior()};
  evaluator::Evaluator engine_{compiler_, runner_};
};

TEST_F(QuestionTest, AnswersMatchIgnoresCaseAndMargins) {
  EXPECT_TRUE(AnswersMatch("  Paris\n", "paris"));
  EXPECT_TRUE(AnswersMatch("B", "b"));
  EXPECT_FALSE(AnswersMatch("Par is", "paris"));
  EXPECT_TRUE(AnswersMatch("", "  "));
}

TEST_F(QuestionTest, MultipleChoice) {
  Question question = MultipleChoiceQuestion{
      .prompt = "Which header declares printf?",
      .options = {"stdio.h", "stdlib.h"},
      .correct_answer = "stdio.h",
  };

  EXPECT_TRUE(EvaluateAnswer(question, "STDIO.H ", engine_).correct);
  EXPECT_FALSE(EvaluateAnswer(question, "stdlib.h", engine_).correct);
  EXPECT_EQ(compiler_.CompileCount(), 0U);
}

TEST_F(QuestionTest, FillInBlank) {
  Question question = FillInBlankQuestion{
      .prompt = "The entry point of a C program is ____.",
      .correct_answer = "main",
  };

  auto verdict = EvaluateAnswer(question, "Main", engine_);

  EXPECT_TRUE(verdict.correct);
  EXPECT_FALSE(verdict.used_fallback);
  EXPECT_FALSE(verdict.engine_result.has_value());
}

TEST_F(QuestionTest, CodingExerciseRunsEngine) {
  Question question = CodingExerciseQuestion{
      .prompt = "Echo the input",
      .test_cases = {{.input = "hi", .expected_output = "hi", .description = "echo"}},
      .reference_solution = "reference",
  };

  auto verdict = EvaluateAnswer(question, "submission", engine_);

  EXPECT_TRUE(verdict.correct);
  EXPECT_FALSE(verdict.used_fallback);
  ASSERT_TRUE(verdict.engine_result.has_value());
  ASSERT_TRUE(verdict.engine_result->has_value());
  EXPECT_EQ((*verdict.engine_result)->passed_count, 1U);
}

TEST_F(QuestionTest, CodingExerciseCompileFailureIsIncorrect) {
  compiler_.FailWith("error: expected ';'");
  Question question = CodingExerciseQuestion{
      .prompt = "p",
      .test_cases = {},
      .reference_solution = "int main(void) { return 0; }",
  };

  // Matches the reference text, but a compile failure is not an engine fault
  auto verdict =
      EvaluateAnswer(question, "int main(void) { return 0; }", engine_);

  EXPECT_FALSE(verdict.correct);
  EXPECT_FALSE(verdict.used_fallback);
}

TEST_F(QuestionTest, CodingExerciseFallsBackWhenEngineUnusable) {
  compiler_.BreakWith("toolchain unavailable");
  Question question = CodingExerciseQuestion{
      .prompt = "p",
      .test_cases = {},
      .reference_solution = "int main(void) { return 0; }",
  };

  auto matching =
      EvaluateAnswer(question, "  INT MAIN(void) { return 0; }\n", engine_);
  auto different = EvaluateAnswer(question, "int main() {}", engine_);

  EXPECT_TRUE(matching.used_fallback);
  EXPECT_TRUE(matching.correct);
  ASSERT_TRUE(matching.engine_result.has_value());
  EXPECT_FALSE(matching.engine_result->has_value());
  EXPECT_TRUE(different.used_fallback);
  EXPECT_FALSE(different.correct);
}

}  // namespace
}  // namespace gradebox::question
