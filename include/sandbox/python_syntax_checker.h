#ifndef PYTHON_SYNTAX_CHECKER_H
#define PYTHON_SYNTAX_CHECKER_H

#include "core/app_config.h"
#include "workflow/syntax_checker.h"

// Runs compile() on generated code inside a fresh isolate with no capability
// broker. The code is never executed.
class PythonSyntaxChecker : public ISyntaxChecker {
  ExecutionSettings settings_;

public:
  explicit PythonSyntaxChecker(const ExecutionSettings &settings);

  std::optional<std::string> check(const std::string &code) override;
};

#endif
