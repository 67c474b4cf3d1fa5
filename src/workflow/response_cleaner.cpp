#include "workflow/response_cleaner.h"
#include "utils/string_utils.h"

namespace {
constexpr const char *FENCE = "```";
constexpr size_t FENCE_LENGTH = 3;

bool isPythonTag(const std::string &info) {
  return info == "python" || info == "py" || info == "python3";
}

// An info string is a single word on the fence line. Anything else on that
// line is treated as the start of the body.
bool looksLikeInfoString(const std::string &info) {
  return !info.empty() && info.find_first_of(" \t`") == std::string::npos;
}
} // namespace

std::vector<FencedBlock>
ResponseCleaner::findFencedBlocks(const std::string &response) {
  std::vector<FencedBlock> blocks;
  size_t pos = 0;

  while (pos < response.size()) {
    size_t open = response.find(FENCE, pos);
    if (open == std::string::npos) {
      break;
    }

    size_t infoStart = open + FENCE_LENGTH;

    // A fence with nothing after it closes a block that was never opened,
    // e.g. "code```".
    if (StringUtils::trim(response.substr(infoStart)).empty()) {
      if (blocks.empty()) {
        FencedBlock block;
        block.body = response.substr(0, open);
        block.closed = true;
        blocks.push_back(std::move(block));
      }
      break;
    }

    size_t lineEnd = response.find('\n', infoStart);
    std::string infoLine = response.substr(
        infoStart,
        lineEnd == std::string::npos ? std::string::npos : lineEnd - infoStart);
    std::string info = StringUtils::trim(infoLine);

    FencedBlock block;
    size_t bodyStart = infoStart;
    if (looksLikeInfoString(info)) {
      block.info = StringUtils::toLower(info);
      bodyStart = lineEnd == std::string::npos ? response.size() : lineEnd + 1;
    }

    size_t close = response.find(FENCE, bodyStart);
    if (close == std::string::npos) {
      block.body = response.substr(bodyStart);
      blocks.push_back(std::move(block));
      break;
    }

    block.body = response.substr(bodyStart, close - bodyStart);
    block.closed = true;
    blocks.push_back(std::move(block));
    pos = close + FENCE_LENGTH;
  }

  return blocks;
}

std::string ResponseCleaner::extractCode(const std::string &response) {
  auto blocks = findFencedBlocks(response);
  if (blocks.empty()) {
    return StringUtils::trim(response);
  }

  for (const auto &block : blocks) {
    if (isPythonTag(block.info)) {
      return StringUtils::trim(block.body);
    }
  }
  return StringUtils::trim(blocks.front().body);
}

std::string ResponseCleaner::ensureAsyncEntryPoint(const std::string &code) {
  static const std::string plain = "def execute_workflow(";
  static const std::string asyncDef = "async " + plain;

  auto lines = StringUtils::splitLines(code);
  for (const auto &line : lines) {
    if (StringUtils::startsWith(line, asyncDef)) {
      return code;
    }
  }

  std::string result;
  result.reserve(code.size() + 6);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result += '\n';
    }
    if (StringUtils::startsWith(lines[i], plain)) {
      result += "async ";
    }
    result += lines[i];
  }
  return result;
}

std::string ResponseCleaner::clean(const std::string &response) {
  return ensureAsyncEntryPoint(extractCode(response));
}
