#include "gradebox/evaluator/evaluator.hpp"

#include <csignal>
#include <cstddef>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "gradebox/common/error.hpp"
#include "gradebox/compare/output_compare.hpp"
#include "gradebox/compiler/artifact.hpp"
#include "gradebox/compiler/compiler.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/sandbox/process_runner.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::evaluator {

namespace {

constexpr std::string_view kExecutionTimeoutMessage = "Execution timeout";
constexpr std::string_view kOutputMismatchMessage = "Output mismatch";

auto SignalName(int sig) -> std::string_view {
  switch (sig) {
    case SIGSEGV:
      return "SIGSEGV";
    case SIGABRT:
      return "SIGABRT";
    case SIGFPE:
      return "SIGFPE";
    case SIGILL:
      return "SIGILL";
    case SIGBUS:
      return "SIGBUS";
    case SIGKILL:
      return "SIGKILL";
    case SIGTERM:
      return "SIGTERM";
    case SIGPIPE:
      return "SIGPIPE";
    case SIGXCPU:
      return "SIGXCPU";
    case SIGXFSZ:
      return "SIGXFSZ";
    default:
      return "unknown signal";
  }
}

auto FirstLine(std::string_view text) -> std::string_view {
  auto end = text.find_first_of("\r\n");
  return end == std::string_view::npos ? text : text.substr(0, end);
}

auto DescribeRuntimeError(const sandbox::ExecutionResult& run) -> std::string {
  std::string message =
      run.term_signal != 0
          ? std::format(
                "Runtime error (terminated by signal {}: {})", run.term_signal,
                SignalName(run.term_signal))
          : std::format("Runtime error (exit code {})", run.exit_code);
  auto detail = FirstLine(run.stderr_text);
  if (!detail.empty()) {
    message += ": ";
    message += detail;
  }
  return message;
}

}  // namespace

auto ToString(EvaluationPhase phase) -> const char* {
  switch (phase) {
    case EvaluationPhase::kParseTests:
      return "parse_tests";
    case EvaluationPhase::kCompile:
      return "compile";
    case EvaluationPhase::kCompileFailed:
      return "compile_failed";
    case EvaluationPhase::kRunTests:
      return "run_tests";
    case EvaluationPhase::kAggregate:
      return "aggregate";
    case EvaluationPhase::kDone:
      return "done";
  }
  return "unknown";
}

Evaluator::Evaluator(
    compiler::Compiler& compiler, sandbox::ProcessRunner& runner,
    EvaluatorOptions options)
    : compiler_(compiler), runner_(runner), options_(std::move(options)) {
}

auto Evaluator::Evaluate(std::string_view source, std::string_view test_case_spec)
    -> Result<EvaluationReport> {
  return Evaluate(source, testcase::ParseTestCases(test_case_spec));
}

auto Evaluator::Evaluate(
    std::string_view source, std::vector<testcase::TestCase> cases)
    -> Result<EvaluationReport> {
  return RunSession(source, std::move(cases));
}

void Evaluator::EnterPhase(EvaluationPhase phase) const {
  spdlog::trace("evaluator: -> {}", ToString(phase));
  if (options_.on_phase) {
    options_.on_phase(phase);
  }
}

auto Evaluator::RunSession(
    std::string_view source, std::vector<testcase::TestCase> supplied)
    -> Result<EvaluationReport> {
  // Anything thrown below unwinds through the artifact's owner, so the
  // scratch directory is released before the error reaches the caller.
  try {
    EnterPhase(EvaluationPhase::kParseTests);
    const auto cases = testcase::ResolveTestCases(std::move(supplied));

    EnterPhase(EvaluationPhase::kCompile);
    auto compiled = compiler_.Compile(source);
    if (!compiled) {
      spdlog::error("evaluator: compiler unusable: {}", compiled.error().message);
      return std::unexpected(compiled.error());
    }

    if (!compiled->success) {
      EnterPhase(EvaluationPhase::kCompileFailed);
      spdlog::info(
          "evaluator: compilation failed{} ({} test cases skipped)",
          compiled->timed_out ? " (timeout)" : "", cases.size());
      return EvaluationReport{
          .overall_correct = false,
          .passed_count = 0,
          .total_count = cases.size(),
          .outcomes = {},
          .compilation_failure =
              CompilationFailure{
                  .diagnostics = std::move(compiled->diagnostics),
                  .timed_out = compiled->timed_out,
              },
      };
    }
    if (!compiled->artifact) {
      return std::unexpected(
          EngineError::Internal("compiler reported success without an artifact"));
    }

    // Sole owner of the artifact for the rest of the session
    const compiler::Artifact artifact = std::move(*compiled->artifact);
    compiled->artifact.reset();

    EnterPhase(EvaluationPhase::kRunTests);
    EvaluationReport report;
    report.total_count = cases.size();
    report.outcomes.reserve(cases.size());
    for (std::size_t i = 0; i < cases.size(); ++i) {
      auto outcome = GradeTestCase(artifact, cases[i], i + 1);
      if (outcome.failure_kind == ErrorKind::kInternalError) {
        return std::unexpected(EngineError::Internal(*outcome.error));
      }
      report.outcomes.push_back(std::move(outcome));
    }

    EnterPhase(EvaluationPhase::kAggregate);
    for (const auto& outcome : report.outcomes) {
      if (outcome.passed) {
        ++report.passed_count;
      }
    }
    report.overall_correct =
        report.total_count > 0 && report.passed_count == report.total_count;

    spdlog::info(
        "evaluator: {}/{} passed{}", report.passed_count, report.total_count,
        report.overall_correct ? "" : " (rejected)");
    EnterPhase(EvaluationPhase::kDone);
    return report;
  } catch (const EngineException& e) {
    spdlog::error("evaluator: {}", e.what());
    return std::unexpected(EngineError::Internal(e.GetError().message));
  } catch (const std::exception& e) {
    spdlog::error("evaluator: unexpected exception: {}", e.what());
    return std::unexpected(EngineError::Internal(e.what()));
  }
}

auto Evaluator::GradeTestCase(
    const compiler::Artifact& artifact, const testcase::TestCase& test_case,
    std::size_t index) -> TestOutcome {
  TestOutcome outcome{
      .index = index,
      .description = test_case.description,
      .input = test_case.input,
      .expected_output = test_case.expected_output,
      .actual_output = {},
      .passed = false,
      .error = std::nullopt,
      .failure_kind = std::nullopt,
  };

  auto run = runner_.Run(artifact, test_case.input);
  if (!run) {
    if (run.error().kind == ErrorKind::kInternalError) {
      // Sandbox unusable; RunSession turns this into a session error
      outcome.error = run.error().message;
      outcome.failure_kind = ErrorKind::kInternalError;
      return outcome;
    }
    spdlog::warn("evaluator: test {} could not run: {}", index, run.error().message);
    outcome.error = std::format("Execution error: {}", run.error().message);
    outcome.failure_kind = ErrorKind::kExecutionRuntimeError;
    return outcome;
  }

  outcome.actual_output = run->stdout_text;
  if (run->timed_out) {
    outcome.error = std::string(kExecutionTimeoutMessage);
    outcome.failure_kind = ErrorKind::kExecutionTimeout;
  } else if (!run->exited_normally) {
    outcome.error = DescribeRuntimeError(*run);
    outcome.failure_kind = ErrorKind::kExecutionRuntimeError;
  } else if (!compare::Matches(run->stdout_text, test_case.expected_output)) {
    outcome.error = std::string(kOutputMismatchMessage);
    outcome.failure_kind = ErrorKind::kOutputMismatch;
  } else {
    outcome.passed = true;
  }

  spdlog::debug(
      "evaluator: test {} ({}): {}", index, test_case.description,
      outcome.passed ? "passed" : *outcome.error);
  return outcome;
}

}  // namespace gradebox::evaluator
