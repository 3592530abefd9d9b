#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gradebox/common/error.hpp"

namespace gradebox::evaluator {

// Result of grading one test case. Immutable once recorded.
struct TestOutcome {
  std::size_t index = 0;  // 1-based position in the test-case list
  std::string description;
  std::string input;
  std::string expected_output;
  std::string actual_output;
  bool passed = false;
  std::optional<std::string> error;
  std::optional<ErrorKind> failure_kind;

  auto operator==(const TestOutcome&) const -> bool = default;
};

struct CompilationFailure {
  std::string diagnostics;
  bool timed_out = false;

  auto operator==(const CompilationFailure&) const -> bool = default;
};

// Terminal value of one evaluation. Carries no timing data, so identical
// inputs produce identical reports.
struct EvaluationReport {
  bool overall_correct = false;
  std::size_t passed_count = 0;
  std::size_t total_count = 0;
  std::vector<TestOutcome> outcomes;
  // Set iff the submission did not compile; outcomes is then empty
  std::optional<CompilationFailure> compilation_failure;

  auto operator==(const EvaluationReport&) const -> bool = default;

  [[nodiscard]] auto CompileFailed() const -> bool {
    return compilation_failure.has_value();
  }

  // Partial-credit ratio, informational only
  [[nodiscard]] auto SuccessRate() const -> double {
    return total_count == 0 ? 0.0
                            : static_cast<double>(passed_count) /
                                  static_cast<double>(total_count);
  }
};

// The outcome shapes a caller must distinguish
enum class OutcomeKind : uint8_t {
  kAccepted,            // Every test case passed
  kCompilationFailure,  // Rejected by the toolchain; nothing was run
  kEvaluationFailure,   // Ran; at least one test case failed
  kInternalError,       // Engine unusable; caller should fall back
};

auto Classify(const Result<EvaluationReport>& result) -> OutcomeKind;

auto ToString(OutcomeKind kind) -> const char*;

}  // namespace gradebox::evaluator
