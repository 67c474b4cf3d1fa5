#include "clients/generation_service.h"
#include "clients/http_client.h"
#include "clients/paradigm_client.h"
#include "core/errors.h"
#include "utils/id_utils.h"
#include "utils/string_utils.h"
#include <cassert>
#include <iostream>

void testHttpHelpers() {
  std::cout << "Testing HttpClient - helpers...\n";

  HttpClient client("https://api.example.com/");
  assert(client.buildURL("/v1/messages") == "https://api.example.com/v1/messages");
  assert(client.buildURL("v1/messages") == "https://api.example.com/v1/messages");
  assert(client.timeoutSeconds() == 30);

  HttpResponse response;
  assert(response.transportFailed());
  response.status_code = 201;
  assert(response.ok());
  response.status_code = 429;
  response.body = std::string(500, 'x');
  assert(!response.ok());
  assert(response.bodyExcerpt().size() == 200);

  std::cout << "✓ HttpClient helpers test passed\n";
}

void testMessagesPayload() {
  std::cout << "Testing AnthropicGenerationService - payloads...\n";

  GenerationSettings settings;
  settings.model = "test-model";
  settings.max_tokens = 1234;

  json body = AnthropicGenerationService::buildRequestBody(
      settings, GenerationRequest{"system text", "user text"});
  assert(body["model"] == "test-model");
  assert(body["max_tokens"] == 1234);
  assert(body["system"] == "system text");
  assert(body["messages"].size() == 1);
  assert(body["messages"][0]["role"] == "user");
  assert(body["messages"][0]["content"] == "user text");

  json reply = {{"content",
                 {{{"type", "text"}, {"text", "part one, "}},
                  {{"type", "tool_use"}, {"name", "ignored"}},
                  {{"type", "text"}, {"text", "part two"}}}}};
  assert(AnthropicGenerationService::extractText(reply) ==
         "part one, part two");

  bool threw = false;
  try {
    AnthropicGenerationService::extractText({{"content", json::array()}});
  } catch (const GenerationServiceError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    AnthropicGenerationService::extractText({{"error", "overloaded"}});
  } catch (const GenerationServiceError &) {
    threw = true;
  }
  assert(threw);

  AnthropicGenerationService keyless(GenerationSettings{});
  threw = false;
  try {
    keyless.generate(GenerationRequest{"s", "u"});
  } catch (const GenerationServiceError &e) {
    threw = std::string(e.what()).find("API key") != std::string::npos;
  }
  assert(threw && "no request is sent without a key");

  std::cout << "✓ AnthropicGenerationService payloads test passed\n";
}

void testAnalysisStatus() {
  std::cout << "Testing ParadigmClient - analysis status...\n";

  assert(!ParadigmClient::interpretAnalysisStatus({{"status", "pending"}}));
  assert(!ParadigmClient::interpretAnalysisStatus({{"status", "processing"}}));
  assert(!ParadigmClient::interpretAnalysisStatus(json::object()));

  auto done = ParadigmClient::interpretAnalysisStatus(
      {{"status", "Completed"}, {"result", "42 pages"}});
  assert(done && *done == "42 pages");

  auto detailed = ParadigmClient::interpretAnalysisStatus(
      {{"status", "completed"}, {"result", nullptr},
       {"detailed_analysis", "detail"}});
  assert(detailed && *detailed == "detail");

  auto bare = ParadigmClient::interpretAnalysisStatus({{"status", "success"}});
  assert(bare && *bare == "Analysis completed");

  bool threw = false;
  try {
    ParadigmClient::interpretAnalysisStatus({{"status", "failed"}});
  } catch (const CapabilityError &e) {
    threw = std::string(e.what()) == "Analysis failed: failed";
  }
  assert(threw);

  std::cout << "✓ ParadigmClient analysis status test passed\n";
}

void testUtilities() {
  std::cout << "Testing utilities...\n";

  std::string first = IdUtils::generateUuid();
  std::string second = IdUtils::generateUuid();
  assert(first != second);
  assert(IdUtils::isUuid(first));
  assert(first[14] == '4');
  assert(!IdUtils::isUuid("not-a-uuid"));

  assert(StringUtils::truncate("abcdefgh", 5) == "ab...");
  assert(StringUtils::truncate("abc", 5) == "abc");
  assert(StringUtils::sanitizeUTF8("ok\xff\x01 text") == "ok text");
  assert(StringUtils::splitLines("a\r\nb\n").size() == 2);

  std::cout << "✓ Utilities test passed\n";
}

int main() {
  try {
    testHttpHelpers();
    testMessagesPayload();
    testAnalysisStatus();
    testUtilities();
    std::cout << "\n✅ All client tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
