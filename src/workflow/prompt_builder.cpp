#include "workflow/prompt_builder.h"
#include <sstream>

namespace {

const char *const SYSTEM_INSTRUCTION = R"PROMPT(You are a Python code generator for workflow automation systems.

CRITICAL INSTRUCTIONS:
1. Generate ONLY executable Python code - no markdown, no explanations
2. The code must define: async def execute_workflow(user_input: str) -> str
3. The code must contain both `import asyncio` and `import aiohttp`
4. Only use the Python standard library (asyncio, json, logging, typing, re, ...) plus aiohttp
5. DO NOT import external libraries like nltk, requests, pandas or numpy
6. The program runs in an isolated process without API keys and without network access

PLATFORM CLIENT:
A ready-to-use object named `paradigm_client` is injected into the program's globals.
Do not define your own client class, do not read API keys, do not open HTTP sessions yourself.
Every method is a coroutine and must be awaited:

1. await paradigm_client.document_search(query: str, workspace_ids=None, file_ids=None, company_scope=True, private_scope=True, tool="DocumentSearch", private=False) -> dict
2. await paradigm_client.analyze_documents_with_polling(query: str, document_ids: List[str], model=None, private=False) -> str
3. await paradigm_client.chat_completion(prompt: str, model=None) -> str
4. await paradigm_client.analyze_image(query: str, document_ids: List[str], model=None, private=False) -> str

ATTACHED FILES:
- The global `attached_file_ids` is always defined: a list of file ids, or None when no files are attached
- Pass it as `file_ids` to document_search only when it is non-empty (omit the argument otherwise)
- For direct document analysis the attached file ids ARE the document ids; convert them to strings

CORRECT FILE_IDS USAGE:
search_kwargs = {"query": query, "company_scope": True, "private_scope": True}
if attached_file_ids:
    search_kwargs["file_ids"] = attached_file_ids
search_results = await paradigm_client.document_search(**search_kwargs)

CORRECT DOCUMENT_IDS EXTRACTION FOR ANALYSIS:
document_ids = [str(doc["id"]) for doc in search_results.get("documents", [])]
# or, for attached files: document_ids = [str(file_id) for file_id in attached_file_ids]

CORRECT SEARCH RESULT USAGE:
answer = search_results.get("answer", "No answer provided")

CORRECT TEXT PROCESSING:
import re
def split_sentences(text):
    return [s.strip() for s in re.split(r'[.!?]+', text) if s.strip()]

EXAMPLE:
import asyncio
import aiohttp
import json

async def execute_workflow(user_input: str) -> str:
    search_kwargs = {"query": user_input}
    if attached_file_ids:
        search_kwargs["file_ids"] = attached_file_ids
    results = await paradigm_client.document_search(**search_kwargs)
    answer = results.get("answer", "No answer provided")
    summary = await paradigm_client.chat_completion(f"Summarize: {answer}")
    return summary

INCORRECT (DON'T DO THIS):
file_ids=attached_file_ids if attached_file_ids else None  # the API does not accept None
document_ids = [doc["id"] for doc in search_results.get("documents", [])]  # ids must be strings
import nltk  # external library not available
answer = search_results["documents"][0].get("content", "")  # raw content extraction
API_KEY = "..."  # credentials are never available to the program
def execute_workflow(user_input):  # the entry point must be async

Generate the complete workflow code that implements the exact logic described.)PROMPT";

} // namespace

const std::string &PromptBuilder::systemInstruction() {
  static const std::string instruction = SYSTEM_INSTRUCTION;
  return instruction;
}

std::string PromptBuilder::userPrompt(const std::string &description,
                                      const json &context) {
  std::ostringstream oss;
  oss << "\nWorkflow Description: " << description << "\n";
  oss << "Additional Context: "
      << ((context.is_null() || context.empty()) ? std::string("None")
                                                  : context.dump())
      << "\n";

  if (context.is_object() && context.contains("uploaded_file_ids") &&
      context["uploaded_file_ids"].is_array() &&
      !context["uploaded_file_ids"].empty()) {
    oss << "\nFiles were uploaded with this workflow (ids "
        << context["uploaded_file_ids"].dump()
        << "). They are provided at run time through attached_file_ids; "
           "use them instead of searching the whole document base.\n";
  }

  oss << "\nGenerate a complete workflow that:\n"
         "1. Includes all necessary imports\n"
         "2. Implements the execute_workflow function with the exact logic "
         "described\n"
         "3. Uses only paradigm_client for platform calls\n"
         "4. Handles the workflow requirements exactly as specified\n";
  return oss.str();
}

std::string PromptBuilder::feedbackPrompt(const Workflow &workflow,
                                          const std::string &executionResult,
                                          const std::string &userFeedback) {
  std::ostringstream oss;
  oss << "\nORIGINAL WORKFLOW DESCRIPTION:\n"
      << workflow.description << "\n\n"
      << "ORIGINAL GENERATED CODE:\n"
      << (workflow.hasCode() ? *workflow.generated_code : std::string("(none)"))
      << "\n\n"
      << "EXECUTION RESULT:\n"
      << executionResult << "\n\n"
      << "USER FEEDBACK:\n"
      << userFeedback << "\n\n"
      << "INSTRUCTIONS:\n"
         "Based on the original description, the code that was generated, "
         "the actual execution result, and the user's feedback, generate an "
         "improved version of the complete workflow code that addresses the "
         "issues identified. Include all imports and the execute_workflow "
         "function. Only return the improved code, no explanations.\n";
  return oss.str();
}

GenerationRequest PromptBuilder::forGeneration(const std::string &description,
                                               const json &context) {
  return GenerationRequest{systemInstruction(),
                           userPrompt(description, context)};
}

GenerationRequest PromptBuilder::forFeedback(const Workflow &workflow,
                                             const std::string &executionResult,
                                             const std::string &userFeedback) {
  return GenerationRequest{
      systemInstruction(),
      feedbackPrompt(workflow, executionResult, userFeedback)};
}
