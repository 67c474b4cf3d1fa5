#include "core/errors.h"
#include "sandbox/python_syntax_checker.h"
#include "workflow/code_validator.h"
#include <cassert>
#include <iostream>

// Starts real python3 isolates in compile-only mode.
namespace {
ExecutionSettings checkerSettings() {
  ExecutionSettings settings;
  settings.timeout_seconds = 20;
  settings.network_isolation = IsolationMode::OFF;
  settings.filesystem_isolation = IsolationMode::OFF;
  return settings;
}

const std::string ENTRY_HEADER =
    "import asyncio\nimport aiohttp\n\nasync def execute_workflow(x):\n";

bool startsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

void testAcceptsValidCode() {
  std::cout << "Testing PythonSyntaxChecker - valid code...\n";

  PythonSyntaxChecker checker(checkerSettings());
  assert(!checker.check(ENTRY_HEADER + "    return await asyncio.sleep(0, x)\n")
              .has_value());

  // Compiled only: the call below would end the isolate if it ran.
  assert(!checker.check("import os\nos._exit(3)\n").has_value());

  std::cout << "✓ PythonSyntaxChecker valid code test passed\n";
}

void testReportsInterpreterErrors() {
  std::cout << "Testing PythonSyntaxChecker - interpreter errors...\n";

  PythonSyntaxChecker checker(checkerSettings());

  auto doubleAssign = checker.check(ENTRY_HEADER + "    x = = 1\n");
  assert(doubleAssign.has_value());
  assert(startsWith(*doubleAssign, "line 5: "));

  auto topLevelReturn =
      checker.check(ENTRY_HEADER + "    return x\nreturn 1\n");
  assert(topLevelReturn == std::optional<std::string>(
                               "line 6: 'return' outside function"));

  auto nullByte = checker.check(std::string("x = 1\0", 6));
  assert(nullByte.has_value());

  std::cout << "✓ PythonSyntaxChecker interpreter errors test passed\n";
}

void testCatchesWhatTheScannerAccepts() {
  std::cout << "Testing PythonSyntaxChecker - errors past the scanner...\n";

  const std::string code =
      ENTRY_HEADER + "    return helper(x, x)\n\n\ndef helper(a, a):\n"
                     "    return a\n";
  assert(CodeValidator::validate(code).valid);

  PythonSyntaxChecker checker(checkerSettings());
  auto verdict = checker.check(code);
  assert(verdict.has_value());
  assert(startsWith(*verdict, "line 8: "));

  ValidationResult result = CodeValidator::validate(code, verdict);
  assert(!result.valid);
  assert(*result.reason == "syntax error: " + *verdict);

  std::cout << "✓ PythonSyntaxChecker errors past the scanner test passed\n";
}

void testUnavailableInterpreter() {
  std::cout << "Testing PythonSyntaxChecker - missing interpreter...\n";

  ExecutionSettings settings = checkerSettings();
  settings.python_executable = "/nonexistent/python3";
  PythonSyntaxChecker checker(settings);

  bool threw = false;
  try {
    checker.check("x = 1\n");
  } catch (const SandboxError &e) {
    threw = true;
    assert(std::string(e.what()).find("Python interpreter not found") !=
           std::string::npos);
  }
  assert(threw);

  std::cout << "✓ PythonSyntaxChecker missing interpreter test passed\n";
}

int main() {
  try {
    testAcceptsValidCode();
    testReportsInterpreterErrors();
    testCatchesWhatTheScannerAccepts();
    testUnavailableInterpreter();
    std::cout << "\n✅ All PythonSyntaxChecker tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
