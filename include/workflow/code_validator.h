#ifndef CODE_VALIDATOR_H
#define CODE_VALIDATOR_H

#include <optional>
#include <string>
#include <vector>

struct ValidationResult {
  bool valid = false;
  std::optional<std::string> reason;

  static ValidationResult ok() { return ValidationResult{true, std::nullopt}; }
  static ValidationResult rejected(const std::string &why) {
    return ValidationResult{false, why};
  }
};

// Structural conformance check for generated programs. Pure: no state, no
// I/O, never throws for bad input. Checks run in a fixed order and stop at the
// first failure:
//   1. the source scans cleanly and, when the caller compiled it with the
//      interpreter, compiled cleanly     -> "syntax error: <detail>"
//   2. a top-level execute_workflow taking exactly one argument exists
//                                         -> "missing execute_workflow function"
//   3. that definition is `async def`    -> "execute_workflow must be asynchronous"
//   4. every required module is imported -> "missing required import: <name>"
class CodeValidator {
public:
  static const std::vector<std::string> &requiredImports();

  // `compileError` is the interpreter's verdict from an ISyntaxChecker, if
  // the caller ran one.
  static ValidationResult
  validate(const std::string &code,
           const std::optional<std::string> &compileError = std::nullopt);
};

#endif
