#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::test {

// Checks on one outcome, matched by position
struct ExpectedOutcome {
  std::optional<bool> passed;
  std::optional<std::string> error;         // exact match
  std::optional<std::string> error_prefix;  // starts_with
  std::optional<std::string> actual_contains;
  std::optional<std::string> actual_ends_with;
};

struct ScenarioExpectation {
  std::string outcome;  // accepted | compilation_failure | evaluation_failure
  std::optional<std::size_t> passed;
  std::optional<std::size_t> total;
  std::optional<std::string> diagnostics_contains;
  std::vector<ExpectedOutcome> outcomes;
};

// One end-to-end grading scenario loaded from tests/e2e/scenarios
struct Scenario {
  std::string name;
  std::string feature;
  std::string source;
  // Absent: grade against the implicit smoke test
  std::vector<testcase::TestCase> test_cases;
  std::optional<int64_t> execution_timeout_ms;
  std::optional<std::size_t> max_output_chars;
  ScenarioExpectation expect;
};

// GTest printer for readable parameter names
inline void PrintTo(const Scenario& scenario, std::ostream* os) {
  *os << scenario.feature << "/" << scenario.name;
}

// Compare a grading result against the scenario's expectations; returns one
// message per mismatch, empty when everything holds.
auto CheckScenario(
    const Scenario& scenario, const Result<evaluator::EvaluationReport>& result)
    -> std::vector<std::string>;

}  // namespace gradebox::test
