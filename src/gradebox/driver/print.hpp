#pragma once

#include <string>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/toolchain/toolchain.hpp"

namespace gradebox::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Human-readable summary of one evaluation on stdout
void PrintReport(const Result<evaluator::EvaluationReport>& result);

void PrintToolchainStatus(const toolchain::ToolchainStatus& status);

}  // namespace gradebox::driver
