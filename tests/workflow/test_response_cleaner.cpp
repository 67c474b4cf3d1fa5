#include "workflow/response_cleaner.h"
#include <cassert>
#include <iostream>

void testPlainResponse() {
  std::cout << "Testing ResponseCleaner - unfenced response...\n";

  std::string code = ResponseCleaner::clean(
      "\n\nimport asyncio\nasync def execute_workflow(x):\n    return x\n\n");
  assert(code == "import asyncio\nasync def execute_workflow(x):\n    return x");

  assert(ResponseCleaner::findFencedBlocks("no fences here").empty());
  assert(ResponseCleaner::clean("").empty());

  std::cout << "✓ ResponseCleaner unfenced response test passed\n";
}

void testFencedBlocks() {
  std::cout << "Testing ResponseCleaner - fenced blocks...\n";

  std::string response = "Here is the workflow:\n```python\nimport asyncio\n"
                         "x = 1\n```\nIt searches documents.";
  assert(ResponseCleaner::clean(response) == "import asyncio\nx = 1");

  auto blocks = ResponseCleaner::findFencedBlocks(response);
  assert(blocks.size() == 1);
  assert(blocks[0].info == "python");
  assert(blocks[0].closed);

  // The python block wins over an earlier untagged one.
  std::string mixed = "```\npip install aiohttp\n```\n\n```Python\nprint(1)\n```";
  assert(ResponseCleaner::clean(mixed) == "print(1)");

  // Without a python tag the first block is used.
  std::string untagged = "```bash\nls\n```\n```text\nhello\n```";
  assert(ResponseCleaner::clean(untagged) == "ls");

  std::cout << "✓ ResponseCleaner fenced blocks test passed\n";
}

void testMalformedFences() {
  std::cout << "Testing ResponseCleaner - malformed fences...\n";

  // Unclosed fence runs to the end of the response.
  assert(ResponseCleaner::clean("```python\nx = 1\ny = 2\n") ==
         "x = 1\ny = 2");

  // Only a closing fence: everything before it is the code.
  assert(ResponseCleaner::clean("x = 1\n```") == "x = 1");

  // Code on the fence line itself is not mistaken for an info string.
  auto blocks = ResponseCleaner::findFencedBlocks("```x = 1\n```");
  assert(blocks.size() == 1);
  assert(blocks[0].info.empty());
  assert(ResponseCleaner::extractCode("```x = 1\n```") == "x = 1");

  std::cout << "✓ ResponseCleaner malformed fences test passed\n";
}

void testAsyncEntryPoint() {
  std::cout << "Testing ResponseCleaner - async entry point...\n";

  assert(ResponseCleaner::ensureAsyncEntryPoint(
             "import asyncio\ndef execute_workflow(user_input):\n    pass") ==
         "import asyncio\nasync def execute_workflow(user_input):\n    pass");

  // Already async, nested or differently named definitions are untouched.
  const std::string untouched =
      "async def execute_workflow(x):\n    def execute_workflow(y):\n"
      "        pass\ndef execute_workflows(x):\n    pass";
  assert(ResponseCleaner::ensureAsyncEntryPoint(untouched) == untouched);

  // Code that already has an async entry point is left as is.
  const std::string both =
      "import asyncio\nasync def execute_workflow(x):\n    return x\n"
      "def execute_workflow(x):\n    return x";
  assert(ResponseCleaner::ensureAsyncEntryPoint(both) == both);
  const std::string syncFirst =
      "def execute_workflow(x):\n    return x\n"
      "async def execute_workflow(x):\n    return x";
  assert(ResponseCleaner::ensureAsyncEntryPoint(syncFirst) == syncFirst);

  assert(ResponseCleaner::ensureAsyncEntryPoint(
             "def execute_workflow(x):\r\n    return x\r\n\r\nx = 1") ==
         "async def execute_workflow(x):\n    return x\n\nx = 1");
  assert(ResponseCleaner::ensureAsyncEntryPoint("").empty());

  std::string cleaned = ResponseCleaner::clean(
      "```py\ndef execute_workflow(text):\n    return text\n```");
  assert(cleaned == "async def execute_workflow(text):\n    return text");

  std::cout << "✓ ResponseCleaner async entry point test passed\n";
}

int main() {
  try {
    testPlainResponse();
    testFencedBlocks();
    testMalformedFences();
    testAsyncEntryPoint();
    std::cout << "\n✅ All ResponseCleaner tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
