#include "workflow/python_source_scanner.h"
#include "utils/string_utils.h"
#include <cctype>
#include <unordered_set>
#include <utility>

namespace {

const std::unordered_set<std::string> kCompoundKeywords = {
    "if",   "elif",   "else",    "for", "while", "try",
    "except", "finally", "with", "def", "class"};

bool isIdentStart(unsigned char c) {
  return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isIdentChar(unsigned char c) { return isIdentStart(c) || std::isdigit(c); }

bool isStringPrefix(const std::string &word) {
  static const std::unordered_set<std::string> prefixes = {
      "r", "u", "b", "f", "br", "rb", "fr", "rf"};
  return word.size() <= 2 && prefixes.count(StringUtils::toLower(word)) > 0;
}

size_t skipSpaces(const std::string &text, size_t pos) {
  while (pos < text.size() && text[pos] == ' ') {
    pos++;
  }
  return pos;
}

std::string wordAt(const std::string &text, size_t from, size_t &end) {
  size_t start = skipSpaces(text, from);
  end = start;
  while (end < text.size() &&
         isIdentChar(static_cast<unsigned char>(text[end]))) {
    end++;
  }
  return text.substr(start, end - start);
}

// Leading dots (relative imports) followed by name(.name)*.
std::string dottedNameAt(const std::string &text, size_t from, size_t &end) {
  size_t pos = skipSpaces(text, from);
  std::string name;
  while (pos < text.size() && text[pos] == '.') {
    name += '.';
    pos++;
  }
  while (true) {
    size_t wordEnd = pos;
    std::string part = wordAt(text, pos, wordEnd);
    if (part.empty()) {
      break;
    }
    name += part;
    pos = wordEnd;
    if (pos < text.size() && text[pos] == '.') {
      name += '.';
      pos++;
      continue;
    }
    break;
  }
  end = pos;
  return name;
}

bool isOpenBracket(char c) { return c == '(' || c == '[' || c == '{'; }
bool isCloseBracket(char c) { return c == ')' || c == ']' || c == '}'; }

// String literals have already been reduced to "" so a plain depth count is
// enough here.
std::vector<std::string> splitTopLevel(const std::string &text, char separator) {
  std::vector<std::string> parts;
  int depth = 0;
  std::string current;
  for (char c : text) {
    if (isOpenBracket(c)) {
      depth++;
    } else if (isCloseBracket(c)) {
      depth--;
    } else if (c == separator && depth == 0) {
      parts.push_back(StringUtils::trim(current));
      current.clear();
      continue;
    }
    current += c;
  }
  parts.push_back(StringUtils::trim(current));
  return parts;
}

size_t findTopLevel(const std::string &text, size_t from,
                    const std::string &chars) {
  int depth = 0;
  for (size_t i = from; i < text.size(); ++i) {
    char c = text[i];
    if (isOpenBracket(c)) {
      depth++;
    } else if (isCloseBracket(c)) {
      depth--;
    } else if (depth == 0 && chars.find(c) != std::string::npos) {
      if (c == ':' && i + 1 < text.size() && text[i + 1] == '=') {
        i++;
        continue;
      }
      return i;
    }
  }
  return std::string::npos;
}

size_t findMatching(const std::string &text, size_t openPos) {
  int depth = 0;
  for (size_t i = openPos; i < text.size(); ++i) {
    if (isOpenBracket(text[i])) {
      depth++;
    } else if (isCloseBracket(text[i])) {
      depth--;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

char openerFor(char close) {
  switch (close) {
  case ')':
    return '(';
  case ']':
    return '[';
  default:
    return '{';
  }
}

enum class BlockKind { MODULE, FUNCTION, ASYNC_FUNCTION, CLASS, LOOP, OTHER };

BlockKind enclosingScope(const std::vector<BlockKind> &blocks) {
  for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
    if (*it != BlockKind::LOOP && *it != BlockKind::OTHER) {
      return *it;
    }
  }
  return BlockKind::MODULE;
}

bool insideLoop(const std::vector<BlockKind> &blocks) {
  for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
    if (*it == BlockKind::LOOP) {
      return true;
    }
    if (*it != BlockKind::OTHER) {
      return false;
    }
  }
  return false;
}

bool containsWord(const std::string &text, const std::string &word) {
  size_t i = 0;
  while (i < text.size()) {
    if (!isIdentStart(static_cast<unsigned char>(text[i]))) {
      // Skip whole number literals so "1e5" never reads as a word.
      if (std::isdigit(static_cast<unsigned char>(text[i]))) {
        while (i < text.size() &&
               isIdentChar(static_cast<unsigned char>(text[i]))) {
          i++;
        }
      } else {
        i++;
      }
      continue;
    }
    size_t start = i;
    while (i < text.size() && isIdentChar(static_cast<unsigned char>(text[i]))) {
      i++;
    }
    if (text.compare(start, i - start, word) == 0 && i - start == word.size()) {
      return true;
    }
  }
  return false;
}

// Statements that are only legal inside a function or a loop. Returns the
// interpreter's message, or "" when the statement may appear here.
std::string contextError(const std::string &statement,
                         const std::vector<BlockKind> &blocks) {
  if (statement.empty()) {
    return "";
  }
  size_t end = 0;
  const std::string keyword = wordAt(statement, 0, end);
  const BlockKind scope = enclosingScope(blocks);
  const bool inFunction =
      scope == BlockKind::FUNCTION || scope == BlockKind::ASYNC_FUNCTION;

  if (keyword == "return" && !inFunction) {
    return "'return' outside function";
  }
  if (!inFunction && containsWord(statement, "yield")) {
    return "'yield' outside function";
  }
  if (scope != BlockKind::ASYNC_FUNCTION && containsWord(statement, "await")) {
    return inFunction ? "'await' outside async function"
                      : "'await' outside function";
  }
  if (keyword == "break" && !insideLoop(blocks)) {
    return "'break' outside loop";
  }
  if (keyword == "continue" && !insideLoop(blocks)) {
    return "'continue' not properly in loop";
  }
  return "";
}

enum class TokenKind { OPERAND, WORD, BINARY, UNARY, OPEN, CLOSE, COMMA, COLON };

struct Token {
  TokenKind kind;
  std::string text;
};

// Longest first.
const std::vector<std::string> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", ">>", "<<",
    "<=",  ">=",  "==",  "!=",  "+=",  "-=", "*=", "/=", "%=", "&=", "|=",
    "^=",  "@=",  "+",   "-",   "*",   "/",  "%",  "@",  "&",  "|",  "^",
    "~",   "<",   ">",   "=",   "."};

// Operators that need an operand on both sides.
bool isBinaryOnly(const std::string &op) {
  static const std::unordered_set<std::string> binary = {
      "=",   "==",  "!=",  "<",   ">",   "<=",  ">=",  "/",  "//",  "%",
      "|",   "&",   "^",   "<<",  ">>",  "+=",  "-=",  "*=", "/=",  "//=",
      "%=",  "**=", "&=",  "|=",  "^=",  ">>=", "<<=", "@=", ".",   "->",
      ":=",  "and", "or"};
  return binary.count(op) > 0;
}

size_t numberEnd(const std::string &text, size_t pos) {
  bool hex = text.compare(pos, 2, "0x") == 0 || text.compare(pos, 2, "0X") == 0;
  while (pos < text.size()) {
    char c = text[pos];
    if ((c == 'e' || c == 'E') && !hex && pos + 1 < text.size() &&
        (text[pos + 1] == '+' || text[pos + 1] == '-')) {
      pos += 2;
      continue;
    }
    if (isIdentChar(static_cast<unsigned char>(c)) || c == '.') {
      pos++;
      continue;
    }
    break;
  }
  return pos;
}

// Returns false for characters no Python token starts with.
bool tokenizeStatement(const std::string &text, std::vector<Token> &tokens) {
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    unsigned char uc = static_cast<unsigned char>(c);
    if (c == ' ') {
      i++;
    } else if (c == '"') {
      // Literals were reduced to "" by the tokenizer.
      tokens.push_back(Token{TokenKind::OPERAND, "\"\""});
      i += 2;
    } else if (std::isdigit(uc) ||
               (c == '.' && i + 1 < text.size() &&
                std::isdigit(static_cast<unsigned char>(text[i + 1])))) {
      size_t end = numberEnd(text, i);
      tokens.push_back(Token{TokenKind::OPERAND, text.substr(i, end - i)});
      i = end;
    } else if (isIdentStart(uc)) {
      size_t end = i;
      while (end < text.size() &&
             isIdentChar(static_cast<unsigned char>(text[end]))) {
        end++;
      }
      std::string word = text.substr(i, end - i);
      tokens.push_back(Token{isBinaryOnly(word) ? TokenKind::BINARY
                                                : TokenKind::WORD,
                             word});
      i = end;
    } else if (isOpenBracket(c)) {
      tokens.push_back(Token{TokenKind::OPEN, std::string(1, c)});
      i++;
    } else if (isCloseBracket(c)) {
      tokens.push_back(Token{TokenKind::CLOSE, std::string(1, c)});
      i++;
    } else if (c == ',') {
      tokens.push_back(Token{TokenKind::COMMA, ","});
      i++;
    } else if (c == ':' && text.compare(i, 2, ":=") != 0) {
      tokens.push_back(Token{TokenKind::COLON, ":"});
      i++;
    } else {
      bool matched = false;
      for (const auto &op : kOperators) {
        if (text.compare(i, op.size(), op) == 0) {
          TokenKind kind = op == "..." ? TokenKind::OPERAND
                           : isBinaryOnly(op) ? TokenKind::BINARY
                                              : TokenKind::UNARY;
          tokens.push_back(Token{kind, op});
          i += op.size();
          matched = true;
          break;
        }
      }
      if (!matched) {
        return false;
      }
    }
  }
  return true;
}

// Rejects binary operators with a missing operand, as in "x = = 1" or
// "f(a ==)".
bool operatorsValid(const std::string &statement) {
  std::vector<Token> tokens;
  if (!tokenizeStatement(statement, tokens)) {
    return false;
  }
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].kind != TokenKind::BINARY) {
      continue;
    }
    // Positional-only marker: "def f(a, /)" and "lambda a, /: a".
    if (tokens[i].text == "/" && i > 0 &&
        (tokens[i - 1].kind == TokenKind::COMMA ||
         tokens[i - 1].kind == TokenKind::OPEN)) {
      continue;
    }
    if (i == 0 || i + 1 == tokens.size()) {
      return false;
    }
    TokenKind next = tokens[i + 1].kind;
    if (next == TokenKind::BINARY || next == TokenKind::CLOSE ||
        next == TokenKind::COMMA || next == TokenKind::COLON) {
      return false;
    }
  }
  return true;
}

} // namespace

PythonSourceScanner::PythonSourceScanner(const std::string &source)
    : source_(source) {}

bool PythonSourceScanner::fail(size_t line, const std::string &message) {
  error_ = "line " + std::to_string(line) + ": " + message;
  return false;
}

ScanResult PythonSourceScanner::scan() {
  ScanResult result;
  pos_ = 0;
  line_ = 1;
  error_.clear();

  if (StringUtils::startsWith(source_, "\xEF\xBB\xBF")) {
    pos_ = 3;
  }

  std::vector<LogicalLine> lines;
  if (!tokenize(lines) || !checkStructure(lines, result)) {
    result.ok = false;
    result.error = error_;
    result.functions.clear();
    result.imports.clear();
  }
  return result;
}

/// Splits the source into logical lines. Comments are dropped, every string
/// literal is replaced by an empty "" token, runs of whitespace collapse to a
/// single space, and physical lines joined by open brackets or a trailing
/// backslash become one logical line that keeps the indentation and line
/// number of its first physical line. Blank and comment-only lines produce
/// nothing. Tabs advance to the next multiple of eight columns.
bool PythonSourceScanner::tokenize(std::vector<LogicalLine> &lines) {
  const size_t n = source_.size();
  std::vector<std::pair<char, size_t>> brackets;
  LogicalLine current;
  bool atLineStart = true;

  auto appendSpace = [&current]() {
    if (!current.text.empty() && current.text.back() != ' ') {
      current.text += ' ';
    }
  };

  while (pos_ < n) {
    if (atLineStart) {
      size_t column = 0;
      while (pos_ < n) {
        char c = source_[pos_];
        if (c == ' ') {
          column++;
        } else if (c == '\t') {
          column = (column / 8 + 1) * 8;
        } else if (c == '\f') {
          column = 0;
        } else {
          break;
        }
        pos_++;
      }
      if (pos_ >= n) {
        break;
      }

      char c = source_[pos_];
      if (c == '\r') {
        pos_++;
        continue;
      }
      if (c == '\n') {
        pos_++;
        line_++;
        continue;
      }
      if (c == '#') {
        while (pos_ < n && source_[pos_] != '\n') {
          pos_++;
        }
        continue;
      }

      current = LogicalLine{line_, column, ""};
      atLineStart = false;
      continue;
    }

    char c = source_[pos_];
    unsigned char uc = static_cast<unsigned char>(c);

    if (c == '\n') {
      pos_++;
      line_++;
      if (!brackets.empty()) {
        appendSpace();
        continue;
      }
      lines.push_back(current);
      atLineStart = true;
      continue;
    }

    if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
      appendSpace();
      pos_++;
      continue;
    }

    if (c == '#') {
      while (pos_ < n && source_[pos_] != '\n') {
        pos_++;
      }
      continue;
    }

    if (c == '\\') {
      size_t next = pos_ + 1;
      if (next < n && source_[next] == '\r') {
        next++;
      }
      if (next < n && source_[next] == '\n') {
        pos_ = next + 1;
        line_++;
        appendSpace();
        continue;
      }
      if (next >= n) {
        return fail(line_, "unexpected EOF while parsing");
      }
      return fail(line_,
                  "unexpected character after line continuation character");
    }

    if (c == '"' || c == '\'') {
      if (!scanString(c)) {
        return false;
      }
      current.text += "\"\"";
      continue;
    }

    if (isIdentStart(uc)) {
      size_t start = pos_;
      while (pos_ < n && isIdentChar(static_cast<unsigned char>(source_[pos_]))) {
        pos_++;
      }
      std::string word = source_.substr(start, pos_ - start);
      if (pos_ < n && (source_[pos_] == '"' || source_[pos_] == '\'') &&
          isStringPrefix(word)) {
        if (!scanString(source_[pos_])) {
          return false;
        }
        current.text += "\"\"";
        continue;
      }
      current.text += word;
      continue;
    }

    if (isOpenBracket(c)) {
      brackets.emplace_back(c, line_);
      current.text += c;
      pos_++;
      continue;
    }

    if (isCloseBracket(c)) {
      if (brackets.empty()) {
        return fail(line_, std::string("unmatched '") + c + "'");
      }
      if (brackets.back().first != openerFor(c)) {
        return fail(line_, std::string("closing parenthesis '") + c +
                               "' does not match opening parenthesis '" +
                               brackets.back().first + "'");
      }
      brackets.pop_back();
      current.text += c;
      pos_++;
      continue;
    }

    if (c == '$' || c == '?' || c == '`') {
      return fail(line_, std::string("invalid character '") + c + "'");
    }
    if (uc < 0x20 || uc == 0x7F) {
      return fail(line_, "invalid non-printable character");
    }

    current.text += c;
    pos_++;
  }

  if (!brackets.empty()) {
    return fail(brackets.back().second,
                std::string("'") + brackets.back().first + "' was never closed");
  }
  if (!atLineStart) {
    lines.push_back(current);
  }
  return true;
}

bool PythonSourceScanner::scanString(char quote) {
  const size_t n = source_.size();
  const size_t startLine = line_;
  bool triple = pos_ + 2 < n && source_[pos_ + 1] == quote &&
                source_[pos_ + 2] == quote;

  if (triple) {
    pos_ += 3;
    while (pos_ < n) {
      char c = source_[pos_];
      if (c == '\\') {
        if (pos_ + 1 < n && source_[pos_ + 1] == '\n') {
          line_++;
        }
        pos_ += 2;
        continue;
      }
      if (c == '\n') {
        line_++;
      }
      if (c == quote && pos_ + 2 < n && source_[pos_ + 1] == quote &&
          source_[pos_ + 2] == quote) {
        pos_ += 3;
        return true;
      }
      pos_++;
    }
    return fail(startLine, "unterminated triple-quoted string literal");
  }

  pos_++;
  while (pos_ < n) {
    char c = source_[pos_];
    if (c == '\\') {
      size_t next = pos_ + 1;
      if (next < n && source_[next] == '\r') {
        next++;
      }
      if (next < n && source_[next] == '\n') {
        line_++;
        pos_ = next + 1;
        continue;
      }
      pos_ += 2;
      continue;
    }
    if (c == '\n') {
      break;
    }
    if (c == quote) {
      pos_++;
      return true;
    }
    pos_++;
  }
  return fail(startLine, "unterminated string literal");
}

bool PythonSourceScanner::checkStructure(const std::vector<LogicalLine> &lines,
                                         ScanResult &result) {
  std::vector<size_t> indents{0};
  // Kind of the block each indentation level belongs to.
  std::vector<BlockKind> blocks{BlockKind::MODULE};
  const LogicalLine *pendingHeader = nullptr;
  BlockKind pendingKind = BlockKind::OTHER;

  for (const auto &logical : lines) {
    if (pendingHeader) {
      if (logical.indent <= indents.back()) {
        return fail(logical.line, "expected an indented block after line " +
                                      std::to_string(pendingHeader->line));
      }
      indents.push_back(logical.indent);
      blocks.push_back(pendingKind);
      pendingHeader = nullptr;
    } else if (logical.indent > indents.back()) {
      return fail(logical.line, "unexpected indent");
    } else {
      while (logical.indent < indents.back()) {
        indents.pop_back();
        blocks.pop_back();
      }
      if (logical.indent != indents.back()) {
        return fail(logical.line,
                    "unindent does not match any outer indentation level");
      }
    }

    const std::string text = StringUtils::trim(logical.text);
    if (text.empty()) {
      continue;
    }

    auto statements = splitTopLevel(text, ';');
    const std::string &first = statements.front();

    size_t keywordEnd = 0;
    std::string keyword = wordAt(first, 0, keywordEnd);
    bool isAsync = false;
    if (keyword == "async") {
      keyword = wordAt(first, keywordEnd, keywordEnd);
      if (keyword != "def" && keyword != "for" && keyword != "with") {
        return fail(logical.line, "invalid syntax");
      }
      isAsync = true;
    }

    const bool endsWithColon = text.back() == ':';
    const bool compound = kCompoundKeywords.count(keyword) > 0;
    BlockKind headerKind = BlockKind::OTHER;
    if (keyword == "def") {
      headerKind = isAsync ? BlockKind::ASYNC_FUNCTION : BlockKind::FUNCTION;
    } else if (keyword == "class") {
      headerKind = BlockKind::CLASS;
    } else if (keyword == "for" || keyword == "while") {
      headerKind = BlockKind::LOOP;
    }

    std::vector<std::string> body;
    if (compound) {
      size_t colon = findTopLevel(first, keywordEnd, ":");
      if (colon == std::string::npos) {
        return fail(logical.line, "expected ':'");
      }
      if (keyword == "def" &&
          !parseDefinition(logical, keywordEnd, isAsync, result)) {
        return false;
      }
      if (isAsync && keyword != "def" &&
          enclosingScope(blocks) != BlockKind::ASYNC_FUNCTION) {
        return fail(logical.line,
                    "'async " + keyword + "' outside async function");
      }
      if (keyword != "def" && keyword != "class") {
        std::string header = first.substr(0, colon);
        std::string error = contextError(header, blocks);
        if (!error.empty()) {
          return fail(logical.line, error);
        }
        if (!operatorsValid(header)) {
          return fail(logical.line, "invalid syntax");
        }
      }
      body.push_back(StringUtils::trim(first.substr(colon + 1)));
    } else if (endsWithColon && keyword != "match" && keyword != "case") {
      return fail(logical.line, "invalid syntax");
    } else if (endsWithColon) {
      if (!operatorsValid(first.substr(0, first.size() - 1))) {
        return fail(logical.line, "invalid syntax");
      }
    } else {
      body.push_back(first);
    }
    body.insert(body.end(), statements.begin() + 1, statements.end());

    // Statements after a header's colon run inside that header's block.
    std::vector<BlockKind> context = blocks;
    if (compound) {
      context.push_back(headerKind);
    }
    for (const auto &statement : body) {
      std::string error = contextError(statement, context);
      if (!error.empty()) {
        return fail(logical.line, error);
      }
      size_t end = 0;
      if (!statement.empty() && wordAt(statement, 0, end) != "from" &&
          !operatorsValid(statement)) {
        return fail(logical.line, "invalid syntax");
      }
    }

    if (endsWithColon) {
      pendingHeader = &logical;
      pendingKind = headerKind;
    }

    for (const auto &statement : statements) {
      collectImports(statement, logical.line, result);
    }
  }

  if (pendingHeader) {
    return fail(pendingHeader->line,
                "expected an indented block after line " +
                    std::to_string(pendingHeader->line));
  }
  return true;
}

bool PythonSourceScanner::parseDefinition(const LogicalLine &line,
                                          size_t defPos, bool isAsync,
                                          ScanResult &result) {
  const std::string text = StringUtils::trim(line.text);

  size_t nameEnd = 0;
  std::string name = wordAt(text, defPos, nameEnd);
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
    return fail(line.line, "invalid syntax in function definition");
  }

  size_t pos = skipSpaces(text, nameEnd);
  if (pos >= text.size() || text[pos] != '(') {
    return fail(line.line, "expected '(' after function name");
  }
  size_t close = findMatching(text, pos);
  if (close == std::string::npos) {
    return fail(line.line, "invalid syntax in function definition");
  }
  std::string parameterText = text.substr(pos + 1, close - pos - 1);

  pos = skipSpaces(text, close + 1);
  if (text.compare(pos, 2, "->") == 0) {
    pos = findTopLevel(text, pos + 2, ":");
  }
  if (pos == std::string::npos || pos >= text.size() || text[pos] != ':') {
    return fail(line.line, "expected ':'");
  }

  PythonFunctionDef def;
  def.name = name;
  def.isAsync = isAsync;
  def.indent = line.indent;
  def.line = line.line;

  auto parameters = splitTopLevel(parameterText, ',');
  for (size_t i = 0; i < parameters.size(); ++i) {
    const std::string &parameter = parameters[i];
    if (parameter.empty()) {
      // A single trailing comma is allowed, and so is "()".
      if (i + 1 == parameters.size()) {
        continue;
      }
      return fail(line.line, "invalid syntax in parameter list");
    }
    size_t stop = findTopLevel(parameter, 0, ":=");
    def.parameters.push_back(StringUtils::trim(parameter.substr(0, stop)));
  }

  result.functions.push_back(std::move(def));
  return true;
}

void PythonSourceScanner::collectImports(const std::string &statement,
                                         size_t line, ScanResult &result) {
  size_t end = 0;
  std::string keyword = wordAt(statement, 0, end);

  if (keyword == "import") {
    for (const auto &item : splitTopLevel(statement.substr(end), ',')) {
      size_t moduleEnd = 0;
      std::string module = dottedNameAt(item, 0, moduleEnd);
      if (!module.empty()) {
        result.imports.push_back(PythonImport{module, false, line});
      }
    }
  } else if (keyword == "from") {
    size_t moduleEnd = 0;
    std::string module = dottedNameAt(statement, end, moduleEnd);
    size_t importEnd = 0;
    if (!module.empty() && wordAt(statement, moduleEnd, importEnd) == "import") {
      result.imports.push_back(PythonImport{module, true, line});
    }
  }
}
