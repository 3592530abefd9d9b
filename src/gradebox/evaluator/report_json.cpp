#include "gradebox/evaluator/report_json.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::evaluator {

namespace {

constexpr const char* kCompilationFailedMessage = "Compilation failed";
constexpr const char* kInternalErrorMessage = "Internal error";

}  // namespace

auto ToJson(const TestOutcome& outcome) -> nlohmann::json {
  return nlohmann::json{
      {"index", outcome.index},
      {"description", outcome.description},
      {"input", outcome.input},
      {"expectedOutput", outcome.expected_output},
      {"actualOutput", outcome.actual_output},
      {"passed", outcome.passed},
      {"error", outcome.error ? nlohmann::json(*outcome.error)
                             : nlohmann::json(nullptr)},
  };
}

auto ToJson(const EvaluationReport& report) -> nlohmann::json {
  if (report.compilation_failure) {
    return nlohmann::json{
        {"overallCorrect", false},
        {"error", kCompilationFailedMessage},
        {"compilationError", report.compilation_failure->diagnostics},
        {"passedCount", 0},
        {"totalCount", report.total_count},
    };
  }

  auto outcomes = nlohmann::json::array();
  for (const auto& outcome : report.outcomes) {
    outcomes.push_back(ToJson(outcome));
  }
  return nlohmann::json{
      {"overallCorrect", report.overall_correct},
      {"passedCount", report.passed_count},
      {"totalCount", report.total_count},
      {"successRate", report.SuccessRate()},
      {"outcomes", std::move(outcomes)},
  };
}

auto ToJson(const EngineError& error) -> nlohmann::json {
  return nlohmann::json{
      {"overallCorrect", false},
      {"error", kInternalErrorMessage},
      {"internalError", true},
      {"message", error.message},
      {"passedCount", 0},
      {"totalCount", 0},
  };
}

auto ToJson(const Result<EvaluationReport>& result) -> nlohmann::json {
  return result ? ToJson(*result) : ToJson(result.error());
}

auto ParseGradingRequest(const nlohmann::json& node, std::size_t position)
    -> std::expected<GradingRequest, std::string> {
  if (!node.is_object()) {
    return std::unexpected(std::format(
        "request {}: expected an object, got {}", position, node.type_name()));
  }

  GradingRequest request;
  if (auto it = node.find("id"); it != node.end() && !it->is_null()) {
    if (it->is_string()) {
      request.id = it->get<std::string>();
    } else if (it->is_number_integer()) {
      request.id = std::to_string(it->get<long long>());
    } else {
      return std::unexpected(std::format(
          "request {}: 'id' must be a string or integer", position));
    }
  } else {
    request.id = std::to_string(position);
  }

  auto source = node.find("source");
  if (source == node.end() || !source->is_string()) {
    return std::unexpected(
        std::format("request {}: 'source' must be a string", position));
  }
  request.source = source->get<std::string>();

  if (auto it = node.find("test_cases"); it != node.end()) {
    request.test_cases =
        it->is_string()
            ? testcase::ParseTestCases(it->get_ref<const std::string&>())
            : testcase::ParseTestCasesFromJson(*it);
  }
  return request;
}

auto ParseGradingRequests(const std::string& text)
    -> std::expected<std::vector<GradingRequest>, std::string> {
  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    return std::unexpected("batch file is not valid JSON");
  }
  if (!json.is_array()) {
    return std::unexpected(std::format(
        "batch file must hold a JSON array, got {}", json.type_name()));
  }

  std::vector<GradingRequest> requests;
  requests.reserve(json.size());
  for (std::size_t i = 0; i < json.size(); ++i) {
    auto request = ParseGradingRequest(json[i], i + 1);
    if (!request) {
      return std::unexpected(request.error());
    }
    requests.push_back(std::move(*request));
  }
  return requests;
}

}  // namespace gradebox::evaluator
