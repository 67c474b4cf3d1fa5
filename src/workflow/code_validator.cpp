#include "workflow/code_validator.h"
#include "utils/string_utils.h"
#include "workflow/python_source_scanner.h"

namespace {
constexpr const char *ENTRY_POINT = "execute_workflow";

bool importsModule(const std::vector<PythonImport> &imports,
                   const std::string &module) {
  for (const auto &entry : imports) {
    if (entry.module == module ||
        StringUtils::startsWith(entry.module, module + ".")) {
      return true;
    }
  }
  return false;
}

bool takesSingleArgument(const PythonFunctionDef &def) {
  return def.parameters.size() == 1 && !def.parameters[0].empty() &&
         def.parameters[0][0] != '*' && def.parameters[0] != "/";
}
} // namespace

const std::vector<std::string> &CodeValidator::requiredImports() {
  static const std::vector<std::string> modules = {"asyncio", "aiohttp"};
  return modules;
}

ValidationResult
CodeValidator::validate(const std::string &code,
                        const std::optional<std::string> &compileError) {
  if (StringUtils::trim(code).empty()) {
    return ValidationResult::rejected("missing execute_workflow function");
  }

  ScanResult scan = PythonSourceScanner(code).scan();
  if (!scan.ok) {
    return ValidationResult::rejected("syntax error: " + scan.error);
  }
  if (compileError) {
    return ValidationResult::rejected("syntax error: " + *compileError);
  }

  // The last top-level definition wins, as it would at runtime.
  const PythonFunctionDef *entry = nullptr;
  for (const auto &def : scan.functions) {
    if (def.indent == 0 && def.name == ENTRY_POINT) {
      entry = &def;
    }
  }
  if (!entry || !takesSingleArgument(*entry)) {
    return ValidationResult::rejected("missing execute_workflow function");
  }
  if (!entry->isAsync) {
    return ValidationResult::rejected("execute_workflow must be asynchronous");
  }

  for (const auto &module : requiredImports()) {
    if (!importsModule(scan.imports, module)) {
      return ValidationResult::rejected("missing required import: " + module);
    }
  }

  return ValidationResult::ok();
}
