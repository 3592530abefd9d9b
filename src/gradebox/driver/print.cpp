#include "print.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/toolchain/toolchain.hpp"

namespace gradebox::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kPassStyle =
    fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
constexpr auto kFailStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
constexpr auto kDetailStyle = fmt::fg(fmt::terminal_color::white);

// Show a captured text block on one line, escaping line breaks
auto Inline(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  return out;
}

void PrintOutcome(const evaluator::TestOutcome& outcome) {
  if (outcome.passed) {
    fmt::print(
        "  {} #{} {}\n", fmt::styled("PASS", kPassStyle), outcome.index,
        outcome.description);
    return;
  }
  fmt::print(
      "  {} #{} {}: {}\n", fmt::styled("FAIL", kFailStyle), outcome.index,
      outcome.description, outcome.error.value_or("failed"));
  if (outcome.failure_kind == ErrorKind::kOutputMismatch) {
    fmt::print(
        "       {} {}\n", fmt::styled("expected:", kDetailStyle),
        Inline(outcome.expected_output));
    fmt::print(
        "       {} {}\n", fmt::styled("actual:  ", kDetailStyle),
        Inline(outcome.actual_output));
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("gradebox", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("gradebox", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintReport(const Result<evaluator::EvaluationReport>& result) {
  if (!result) {
    PrintError("internal error: " + result.error().message);
    return;
  }

  const auto& report = *result;
  if (report.compilation_failure) {
    fmt::print("{}\n", fmt::styled("Compilation failed", kFailStyle));
    if (!report.compilation_failure->diagnostics.empty()) {
      fmt::print("{}", report.compilation_failure->diagnostics);
      if (report.compilation_failure->diagnostics.back() != '\n') {
        fmt::print("\n");
      }
    }
    fmt::print("0/{} passed\n", report.total_count);
    return;
  }

  for (const auto& outcome : report.outcomes) {
    PrintOutcome(outcome);
  }
  std::string_view verdict = report.overall_correct ? "accepted" : "rejected";
  fmt::print(
      "{}/{} passed, {}\n", report.passed_count, report.total_count,
      fmt::styled(verdict, report.overall_correct ? kPassStyle : kFailStyle));
}

void PrintToolchainStatus(const toolchain::ToolchainStatus& status) {
  if (status.compiler) {
    fmt::print(
        "compiler: {} ({})\n", status.compiler->path, status.compiler->version);
  }
  for (const auto& error : status.errors) {
    PrintError(error);
  }
  std::string_view summary = status.ok ? "toolchain ok" : "toolchain unusable";
  fmt::print(
      "{}\n", fmt::styled(summary, status.ok ? kPassStyle : kFailStyle));
}

}  // namespace gradebox::driver
