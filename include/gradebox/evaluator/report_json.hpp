#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/testcase/test_case.hpp"

namespace gradebox::evaluator {

// Serialized shapes, camelCase keys:
//   evaluated:  {overallCorrect, passedCount, totalCount, successRate,
//                outcomes: [{index, description, input, expectedOutput,
//                            actualOutput, passed, error}]}
//   compile:    {overallCorrect: false, error: "Compilation failed",
//                compilationError, passedCount: 0, totalCount}
//   internal:   {overallCorrect: false, error: "Internal error",
//                internalError: true, message, passedCount: 0, totalCount: 0}
auto ToJson(const TestOutcome& outcome) -> nlohmann::json;
auto ToJson(const EvaluationReport& report) -> nlohmann::json;
auto ToJson(const EngineError& error) -> nlohmann::json;
auto ToJson(const Result<EvaluationReport>& result) -> nlohmann::json;

// One submission in a batch file: {id?, source, test_cases?}
struct GradingRequest {
  std::string id;
  std::string source;
  std::vector<testcase::TestCase> test_cases;
};

// Parse one request object. `test_cases` may be an array, a single object,
// or a string holding JSON text. Returns a message on structural errors.
auto ParseGradingRequest(const nlohmann::json& node, std::size_t position)
    -> std::expected<GradingRequest, std::string>;

// Parse a batch document: a JSON array of request objects
auto ParseGradingRequests(const std::string& text)
    -> std::expected<std::vector<GradingRequest>, std::string>;

}  // namespace gradebox::evaluator
