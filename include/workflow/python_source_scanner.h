#ifndef PYTHON_SOURCE_SCANNER_H
#define PYTHON_SOURCE_SCANNER_H

#include <cstddef>
#include <string>
#include <vector>

struct PythonFunctionDef {
  std::string name;
  bool isAsync = false;
  std::vector<std::string> parameters;
  size_t indent = 0;
  size_t line = 0;
};

struct PythonImport {
  std::string module;
  bool fromImport = false;
  size_t line = 0;
};

struct ScanResult {
  bool ok = true;
  std::string error;
  std::vector<PythonFunctionDef> functions;
  std::vector<PythonImport> imports;
};

// Structural scanner for Python source. It does not build a syntax tree; it
// tokenizes strings, comments and brackets, assembles logical lines and checks
// the block structure, which is enough to reject the malformed output a code
// model typically produces. Errors are reported as "line N: <message>".
class PythonSourceScanner {
public:
  explicit PythonSourceScanner(const std::string &source);

  ScanResult scan();

private:
  struct LogicalLine {
    size_t line = 0;
    size_t indent = 0;
    std::string text;
  };

  bool tokenize(std::vector<LogicalLine> &lines);
  bool scanString(char quote);
  bool checkStructure(const std::vector<LogicalLine> &lines,
                      ScanResult &result);
  bool parseDefinition(const LogicalLine &line, size_t defPos, bool isAsync,
                       ScanResult &result);
  void collectImports(const std::string &statement, size_t line,
                      ScanResult &result);

  bool fail(size_t line, const std::string &message);

  std::string source_;
  size_t pos_ = 0;
  size_t line_ = 1;
  std::string error_;
};

#endif
