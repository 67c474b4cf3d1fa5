#include "workflow/code_validator.h"
#include "workflow/python_source_scanner.h"
#include <cassert>
#include <iostream>

namespace {
const std::string VALID_PROGRAM = R"(import asyncio
import aiohttp
from typing import Optional


async def execute_workflow(user_input: str) -> str:
    """Summarise the request."""
    results = await paradigm_client.document_search(
        user_input,
        file_ids=attached_file_ids,
    )
    if not results:
        return "nothing found"
    text = '''multi
line'''
    return f"{text}: {results}"
)";

bool startsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

void testAcceptsConformingProgram() {
  std::cout << "Testing CodeValidator - conforming program...\n";

  ValidationResult result = CodeValidator::validate(VALID_PROGRAM);
  assert(result.valid && "valid program should pass");
  assert(!result.reason.has_value());

  std::cout << "✓ CodeValidator conforming program test passed\n";
}

void testSyntaxErrors() {
  std::cout << "Testing CodeValidator - syntax errors...\n";

  ValidationResult unclosed = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nasync def execute_workflow(x):\n"
      "    return foo(x\n");
  assert(!unclosed.valid);
  assert(startsWith(*unclosed.reason, "syntax error: "));

  ValidationResult noColon = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nasync def execute_workflow(x)\n"
      "    return x\n");
  assert(!noColon.valid);
  assert(*noColon.reason == "syntax error: line 3: expected ':'");

  ValidationResult badIndent = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n  x = 1\n");
  assert(*badIndent.reason == "syntax error: line 3: unexpected indent");

  ValidationResult emptyBody = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nasync def execute_workflow(x):\n");
  assert(startsWith(*emptyBody.reason, "syntax error: "));

  ValidationResult openString = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nx = 'abc\n");
  assert(*openString.reason ==
         "syntax error: line 3: unterminated string literal");

  std::cout << "✓ CodeValidator syntax error test passed\n";
}

void testMalformedStatements() {
  std::cout << "Testing CodeValidator - malformed statements...\n";

  const std::string header =
      "import asyncio\nimport aiohttp\n\nasync def execute_workflow(x):\n";

  ValidationResult doubleAssign =
      CodeValidator::validate(header + "    x = = 1\n    return x\n");
  assert(!doubleAssign.valid);
  assert(*doubleAssign.reason == "syntax error: line 5: invalid syntax");

  ValidationResult missingOperand =
      CodeValidator::validate(header + "    return f(x ==)\n");
  assert(*missingOperand.reason == "syntax error: line 5: invalid syntax");

  ValidationResult leadingOperator =
      CodeValidator::validate(header + "    . x\n    return x\n");
  assert(*leadingOperator.reason == "syntax error: line 5: invalid syntax");

  ValidationResult topLevelReturn = CodeValidator::validate(
      header + "    return x\nreturn 1\n");
  assert(*topLevelReturn.reason ==
         "syntax error: line 6: 'return' outside function");

  ValidationResult classReturn = CodeValidator::validate(
      header + "    return x\nclass A:\n    return 1\n");
  assert(*classReturn.reason ==
         "syntax error: line 7: 'return' outside function");

  ValidationResult inlineReturn =
      CodeValidator::validate(header + "    return x\nif x: return 1\n");
  assert(*inlineReturn.reason ==
         "syntax error: line 6: 'return' outside function");

  ValidationResult moduleAwait = CodeValidator::validate(
      header + "    return x\nawait asyncio.sleep(1)\n");
  assert(*moduleAwait.reason ==
         "syntax error: line 6: 'await' outside function");

  ValidationResult syncAwait = CodeValidator::validate(
      header + "    return x\ndef helper():\n    await asyncio.sleep(1)\n");
  assert(*syncAwait.reason ==
         "syntax error: line 7: 'await' outside async function");

  ValidationResult asyncFor = CodeValidator::validate(
      header + "    return x\ndef helper(s):\n    async for i in s:\n"
               "        pass\n");
  assert(*asyncFor.reason ==
         "syntax error: line 7: 'async for' outside async function");

  ValidationResult strayBreak =
      CodeValidator::validate(header + "    if x:\n        break\n");
  assert(*strayBreak.reason == "syntax error: line 6: 'break' outside loop");

  ValidationResult loopInFunction = CodeValidator::validate(
      header + "    for i in x:\n        def inner():\n"
               "            continue\n");
  assert(*loopInFunction.reason ==
         "syntax error: line 7: 'continue' not properly in loop");

  std::cout << "✓ CodeValidator malformed statement test passed\n";
}

void testAcceptsCommonConstructs() {
  std::cout << "Testing CodeValidator - common constructs...\n";

  const std::string program = R"(import asyncio
import aiohttp
from . import helpers


@decorator.with_args(level=-1)
def helper(a, /, b=.5, *, c=1e-3, **rest) -> dict:
    data = {**rest, "a": a, "b": [b, *range(3)][::-1]}
    if (n := len(data)) > 2 and not a or b <= c:
        data["n"] = n
    return data


class Worker:
    async def run(self):
        async for item in stream():
            if item is None:
                continue
            yield item
        return


async def execute_workflow(user_input):
    total = 0
    while True:
        total += 1
        if total >= 3: break
    for i in range(3):
        pass
    else:
        total -= 1
    values = [await asyncio.sleep(0, x) for x in (1, 2, ...)]
    f = lambda x=0, *a: x @ x if a else -x
    try:
        return str(total) + "".join(map(str, values))
    except* ValueError:
        raise
)";
  ValidationResult result = CodeValidator::validate(program);
  assert(result.valid);

  std::cout << "✓ CodeValidator common constructs test passed\n";
}

void testInterpreterVerdict() {
  std::cout << "Testing CodeValidator - interpreter verdict...\n";

  ValidationResult rejected = CodeValidator::validate(
      VALID_PROGRAM, std::string("line 9: invalid syntax"));
  assert(!rejected.valid);
  assert(*rejected.reason == "syntax error: line 9: invalid syntax");

  ValidationResult accepted =
      CodeValidator::validate(VALID_PROGRAM, std::nullopt);
  assert(accepted.valid);

  // Scanner errors come first.
  ValidationResult both = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n  x = 1\n",
      std::string("line 3: unexpected indent"));
  assert(*both.reason == "syntax error: line 3: unexpected indent");

  std::cout << "✓ CodeValidator interpreter verdict test passed\n";
}

void testEntryPointChecks() {
  std::cout << "Testing CodeValidator - entry point...\n";

  ValidationResult missing = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nasync def run(x):\n    return x\n");
  assert(*missing.reason == "missing execute_workflow function");

  ValidationResult nested = CodeValidator::validate(
      "import asyncio\nimport aiohttp\nclass A:\n"
      "    async def execute_workflow(self, x):\n        return x\n");
  assert(*nested.reason == "missing execute_workflow function");

  ValidationResult twoArgs = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n"
      "async def execute_workflow(a, b):\n    return a\n");
  assert(*twoArgs.reason == "missing execute_workflow function");

  ValidationResult varargs = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n"
      "async def execute_workflow(*args):\n    return ''\n");
  assert(*varargs.reason == "missing execute_workflow function");

  ValidationResult sync = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n"
      "def execute_workflow(user_input):\n    return user_input\n");
  assert(*sync.reason == "execute_workflow must be asynchronous");

  // The later definition replaces the earlier one.
  ValidationResult redefined = CodeValidator::validate(
      "import asyncio\nimport aiohttp\n"
      "async def execute_workflow(x):\n    return x\n"
      "def execute_workflow(x):\n    return x\n");
  assert(*redefined.reason == "execute_workflow must be asynchronous");

  ValidationResult empty = CodeValidator::validate("   \n");
  assert(*empty.reason == "missing execute_workflow function");

  std::cout << "✓ CodeValidator entry point test passed\n";
}

void testRequiredImports() {
  std::cout << "Testing CodeValidator - required imports...\n";

  const std::string body = "async def execute_workflow(x):\n    return x\n";

  ValidationResult noAsyncio =
      CodeValidator::validate("import aiohttp\n" + body);
  assert(*noAsyncio.reason == "missing required import: asyncio");

  ValidationResult noAiohttp =
      CodeValidator::validate("import asyncio\n" + body);
  assert(*noAiohttp.reason == "missing required import: aiohttp");

  ValidationResult fromImports = CodeValidator::validate(
      "from asyncio import gather\nfrom aiohttp.client import ClientSession\n" +
      body);
  assert(fromImports.valid);

  ValidationResult combined =
      CodeValidator::validate("import json, asyncio; import aiohttp as h\n" +
                              body);
  assert(combined.valid);

  // A module whose name merely starts with the required one does not count.
  ValidationResult lookalike =
      CodeValidator::validate("import asyncio\nimport aiohttpx\n" + body);
  assert(*lookalike.reason == "missing required import: aiohttp");

  // Import text inside a string literal is not an import.
  ValidationResult inString = CodeValidator::validate(
      "import asyncio\nx = \"import aiohttp\"\n" + body);
  assert(*inString.reason == "missing required import: aiohttp");

  std::cout << "✓ CodeValidator required imports test passed\n";
}

void testScannerDetails() {
  std::cout << "Testing PythonSourceScanner - details...\n";

  ScanResult scan = PythonSourceScanner(VALID_PROGRAM).scan();
  assert(scan.ok);
  assert(scan.functions.size() == 1);
  assert(scan.functions[0].name == "execute_workflow");
  assert(scan.functions[0].isAsync);
  assert(scan.functions[0].parameters.size() == 1);
  assert(scan.functions[0].parameters[0] == "user_input");
  assert(scan.functions[0].line == 6);
  assert(scan.imports.size() == 3);
  assert(scan.imports[2].module == "typing" && scan.imports[2].fromImport);

  ScanResult mismatched = PythonSourceScanner("x = [1, 2)\n").scan();
  assert(!mismatched.ok);
  assert(mismatched.error.find("does not match") != std::string::npos);

  ScanResult continuation =
      PythonSourceScanner("x = 1 + \\\n    2\ny = x\n").scan();
  assert(continuation.ok);

  ScanResult comment =
      PythonSourceScanner("# def broken(\nx = 1  # (\n").scan();
  assert(comment.ok);
  assert(comment.functions.empty());

  std::cout << "✓ PythonSourceScanner details test passed\n";
}

int main() {
  try {
    testAcceptsConformingProgram();
    testSyntaxErrors();
    testMalformedStatements();
    testAcceptsCommonConstructs();
    testInterpreterVerdict();
    testEntryPointChecks();
    testRequiredImports();
    testScannerDetails();
    std::cout << "\n✅ All CodeValidator tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
