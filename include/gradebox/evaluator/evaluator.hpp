#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "gradebox/common/error.hpp"
#include "gradebox/compiler/compiler.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/sandbox/process_runner.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::evaluator {

enum class EvaluationPhase : uint8_t {
  kParseTests,
  kCompile,
  kCompileFailed,  // Terminal
  kRunTests,
  kAggregate,
  kDone,  // Terminal
};

auto ToString(EvaluationPhase phase) -> const char*;

struct EvaluatorOptions {
  // Invoked on every state transition, on the evaluating thread
  std::function<void(EvaluationPhase)> on_phase;
};

// Drives one evaluation: parse test cases, compile, run every test case in
// order, compare, aggregate. Compiler and runner are borrowed and must
// outlive the evaluator. Evaluate() is blocking and keeps no state between
// calls, so one Evaluator may serve concurrent callers as long as the
// injected compiler and runner are themselves thread-safe (GccCompiler and
// SubprocessRunner are).
class Evaluator {
 public:
  Evaluator(
      compiler::Compiler& compiler, sandbox::ProcessRunner& runner,
      EvaluatorOptions options = {});

  // Grade `source` against a JSON test-case specification (array, single
  // object, or empty for the implicit smoke test).
  auto Evaluate(std::string_view source, std::string_view test_case_spec)
      -> Result<EvaluationReport>;

  // Grade `source` against already parsed test cases. An empty list is
  // graded against the implicit smoke test.
  auto Evaluate(std::string_view source, std::vector<testcase::TestCase> cases)
      -> Result<EvaluationReport>;

 private:
  auto RunSession(
      std::string_view source, std::vector<testcase::TestCase> supplied)
      -> Result<EvaluationReport>;

  auto GradeTestCase(
      const compiler::Artifact& artifact, const testcase::TestCase& test_case,
      std::size_t index) -> TestOutcome;

  void EnterPhase(EvaluationPhase phase) const;

  compiler::Compiler& compiler_;
  sandbox::ProcessRunner& runner_;
  EvaluatorOptions options_;
};

}  // namespace gradebox::evaluator
