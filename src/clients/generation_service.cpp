#include "clients/generation_service.h"
#include "core/errors.h"

namespace {
constexpr const char *MESSAGES_ENDPOINT = "/v1/messages";
constexpr const char *API_VERSION = "2023-06-01";
} // namespace

AnthropicGenerationService::AnthropicGenerationService(
    const GenerationSettings &settings)
    : settings_(settings), http_(settings.base_url, LogCategory::GENERATION) {
  http_.setTimeout(settings_.timeout_seconds);
  http_.setDefaultHeader("x-api-key", settings_.api_key);
  http_.setDefaultHeader("anthropic-version", API_VERSION);
}

json AnthropicGenerationService::buildRequestBody(
    const GenerationSettings &settings, const GenerationRequest &request) {
  json body;
  body["model"] = settings.model;
  body["max_tokens"] = settings.max_tokens;
  if (!request.system.empty()) {
    body["system"] = request.system;
  }
  body["messages"] =
      json::array({json{{"role", "user"}, {"content", request.user}}});
  return body;
}

std::string AnthropicGenerationService::extractText(const json &response) {
  if (!response.is_object() || !response.contains("content") ||
      !response["content"].is_array()) {
    throw GenerationServiceError("Generation response has no content blocks");
  }

  std::string text;
  for (const auto &block : response["content"]) {
    if (block.is_object() && block.value("type", "") == "text" &&
        block.contains("text") && block["text"].is_string()) {
      text += block["text"].get<std::string>();
    }
  }
  if (text.empty()) {
    throw GenerationServiceError("Generation response contained no text");
  }
  return text;
}

std::string
AnthropicGenerationService::generate(const GenerationRequest &request) {
  if (settings_.api_key.empty()) {
    throw GenerationServiceError("Generation API key is not configured");
  }

  Logger::info(LogCategory::GENERATION, "generate",
               "Requesting code from model " + settings_.model);

  HttpResponse response = http_.postJson(
      MESSAGES_ENDPOINT, buildRequestBody(settings_, request));

  if (response.transportFailed()) {
    throw GenerationServiceError("Generation request failed: " +
                                 response.error_message);
  }
  if (!response.ok()) {
    throw GenerationServiceError("Generation API error " +
                                     std::to_string(response.status_code) +
                                     ": " + response.bodyExcerpt(),
                                 response.status_code);
  }

  json parsed;
  try {
    parsed = json::parse(response.body);
  } catch (const json::parse_error &e) {
    throw GenerationServiceError(
        "Generation response is not valid JSON: " + std::string(e.what()),
        response.status_code);
  }

  std::string text = extractText(parsed);
  Logger::debug(LogCategory::GENERATION, "generate", "Raw response:\n" + text);
  return text;
}
