#include "gradebox/evaluator/report.hpp"

#include "gradebox/common/error.hpp"

namespace gradebox::evaluator {

auto Classify(const Result<EvaluationReport>& result) -> OutcomeKind {
  if (!result) {
    return OutcomeKind::kInternalError;
  }
  if (result->CompileFailed()) {
    return OutcomeKind::kCompilationFailure;
  }
  return result->overall_correct ? OutcomeKind::kAccepted
                                 : OutcomeKind::kEvaluationFailure;
}

auto ToString(OutcomeKind kind) -> const char* {
  switch (kind) {
    case OutcomeKind::kAccepted:
      return "accepted";
    case OutcomeKind::kCompilationFailure:
      return "compilation_failure";
    case OutcomeKind::kEvaluationFailure:
      return "evaluation_failure";
    case OutcomeKind::kInternalError:
      return "internal_error";
  }
  return "unknown";
}

}  // namespace gradebox::evaluator
