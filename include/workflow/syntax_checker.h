#ifndef SYNTAX_CHECKER_H
#define SYNTAX_CHECKER_H

#include <optional>
#include <string>

// Compiles a program with the real interpreter without running it.
class ISyntaxChecker {
public:
  virtual ~ISyntaxChecker() = default;

  // nullopt when the code compiles, otherwise "line N: <message>". Throws
  // SandboxError when the check itself cannot run.
  virtual std::optional<std::string> check(const std::string &code) = 0;
};

#endif
