#ifndef RESPONSE_CLEANER_H
#define RESPONSE_CLEANER_H

#include <string>
#include <vector>

struct FencedBlock {
  std::string info;
  std::string body;
  bool closed = false;
};

// Turns a model response into raw program text.
//   response := text* [ "```" info? NL body ( "```" | EOF ) ] text*
// The first block tagged python/py/python3 is used, else the first block,
// else the whole response. The result is trimmed.
class ResponseCleaner {
public:
  static std::vector<FencedBlock> findFencedBlocks(const std::string &response);

  static std::string extractCode(const std::string &response);

  // Rewrites a top-level `def execute_workflow(` to `async def ...` unless
  // the code already has a top-level `async def execute_workflow(`. Line
  // endings are normalised to '\n' when a rewrite happens.
  static std::string ensureAsyncEntryPoint(const std::string &code);

  static std::string clean(const std::string &response);
};

#endif
