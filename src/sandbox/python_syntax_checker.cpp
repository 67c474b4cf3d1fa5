#include "sandbox/python_syntax_checker.h"
#include "core/errors.h"
#include "core/logger.h"
#include "sandbox/sandbox_process.h"
#include <algorithm>

namespace {
constexpr int MAX_CHECK_SECONDS = 30;
}

PythonSyntaxChecker::PythonSyntaxChecker(const ExecutionSettings &settings)
    : settings_(settings) {}

std::optional<std::string>
PythonSyntaxChecker::check(const std::string &code) {
  SandboxRequest request;
  request.code = code;
  request.compile_only = true;
  request.timeout =
      std::chrono::seconds(std::min(settings_.timeout_seconds, MAX_CHECK_SECONDS));

  SandboxProcess sandbox(settings_, nullptr);
  SandboxOutcome outcome = sandbox.run(request);
  if (outcome.kind != SandboxOutcomeKind::COMPLETED) {
    throw SandboxError("Syntax check did not complete: " +
                       (outcome.error.empty() ? std::string("no result")
                                              : outcome.error));
  }
  if (outcome.value.empty()) {
    return std::nullopt;
  }
  Logger::debug(LogCategory::VALIDATION, "PythonSyntaxChecker",
                "Interpreter rejected code: " + outcome.value);
  return outcome.value;
}
