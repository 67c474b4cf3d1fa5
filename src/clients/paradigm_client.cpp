#include "clients/paradigm_client.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <thread>

namespace {
constexpr const char *SEARCH_ENDPOINT = "/api/v2/chat/document-search";
constexpr const char *ANALYSIS_ENDPOINT = "/api/v2/chat/document-analysis";
constexpr const char *COMPLETIONS_ENDPOINT = "/api/v2/chat/completions";
constexpr const char *IMAGE_ENDPOINT = "/api/v2/chat/image-analysis";

std::chrono::milliseconds remaining(CapabilityDeadline deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    throw CapabilityError("Capability call exceeded the execution deadline");
  }
  return left;
}

std::string textOf(const json &value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}
} // namespace

ParadigmClient::ParadigmClient(const ParadigmSettings &settings)
    : settings_(settings), http_(settings.base_url, LogCategory::CAPABILITY) {
  http_.setTimeout(settings_.request_timeout_seconds);
  http_.setBearerToken(settings_.api_key);
}

json ParadigmClient::parseBody(const HttpResponse &response,
                               const std::string &what) const {
  if (response.transportFailed()) {
    throw CapabilityError(what + " request failed: " + response.error_message);
  }
  if (!response.ok()) {
    throw CapabilityError(what + " API error " +
                          std::to_string(response.status_code) + ": " +
                          response.bodyExcerpt());
  }
  try {
    return json::parse(response.body);
  } catch (const json::parse_error &e) {
    throw CapabilityError(what + " returned invalid JSON: " +
                          std::string(e.what()));
  }
}

json ParadigmClient::documentSearch(const std::string &query,
                                    const DocumentSearchOptions &options,
                                    CapabilityDeadline deadline) {
  json payload;
  payload["query"] = query;
  payload["company_scope"] = options.company_scope;
  payload["private_scope"] = options.private_scope;
  payload["tool"] = options.tool;
  payload["private"] = options.is_private;
  if (options.workspace_ids && !options.workspace_ids->is_null() &&
      !options.workspace_ids->empty()) {
    payload["workspace_ids"] = *options.workspace_ids;
  }
  if (options.file_ids && !options.file_ids->is_null() &&
      !options.file_ids->empty()) {
    payload["file_ids"] = *options.file_ids;
  }

  Logger::debug(LogCategory::CAPABILITY, "documentSearch", "query: " + query);
  return parseBody(http_.postJson(SEARCH_ENDPOINT, payload, remaining(deadline)),
                   "Document search");
}

std::optional<std::string>
ParadigmClient::interpretAnalysisStatus(const json &payload) {
  std::string status =
      StringUtils::toLower(payload.is_object() && payload.contains("status") &&
                                   payload["status"].is_string()
                               ? payload["status"].get<std::string>()
                               : std::string());

  if (status == "completed" || status == "complete" || status == "finished" ||
      status == "success") {
    for (const char *key : {"result", "detailed_analysis"}) {
      if (payload.contains(key) && !payload[key].is_null()) {
        std::string text = textOf(payload[key]);
        if (!text.empty()) {
          return text;
        }
      }
    }
    return std::string("Analysis completed");
  }
  if (status == "failed" || status == "error") {
    throw CapabilityError("Analysis failed: " + status);
  }
  return std::nullopt;
}

/// Starts a document analysis and polls its status endpoint. A 404 from the
/// status endpoint means the analysis is not registered yet. Polling stops at
/// the earlier of the configured maximum wait and the execution deadline.
std::string
ParadigmClient::analyzeDocuments(const std::string &query,
                                 const std::vector<std::string> &documentIds,
                                 const std::optional<std::string> &model,
                                 bool isPrivate, CapabilityDeadline deadline) {
  json payload;
  payload["query"] = query;
  payload["document_ids"] = documentIds;
  payload["private"] = isPrivate;
  if (model && !model->empty()) {
    payload["model"] = *model;
  }

  json started = parseBody(
      http_.postJson(ANALYSIS_ENDPOINT, payload, remaining(deadline)),
      "Analysis");
  if (!started.contains("chat_response_id") ||
      started["chat_response_id"].is_null()) {
    throw CapabilityError("Analysis response has no chat_response_id");
  }
  const std::string responseId = textOf(started["chat_response_id"]);
  Logger::info(LogCategory::CAPABILITY, "analyzeDocuments",
               "Polling analysis " + responseId);

  const auto pollInterval =
      std::chrono::seconds(settings_.analysis_poll_interval_seconds);
  const auto waitLimit = std::chrono::steady_clock::now() +
                         std::chrono::seconds(settings_.analysis_max_wait_seconds);
  const std::string statusEndpoint =
      std::string(ANALYSIS_ENDPOINT) + "/" + responseId;

  while (std::chrono::steady_clock::now() < waitLimit) {
    HttpResponse response = http_.get(statusEndpoint, remaining(deadline));
    if (response.status_code == 200) {
      json body = parseBody(response, "Polling");
      if (auto result = interpretAnalysisStatus(body)) {
        return *result;
      }
    } else if (response.status_code != 404) {
      parseBody(response, "Polling");
    }

    auto sleepFor = std::min<std::chrono::milliseconds>(pollInterval,
                                                        remaining(deadline));
    std::this_thread::sleep_for(sleepFor);
  }

  throw CapabilityError("Analysis timed out");
}

std::string
ParadigmClient::chatCompletion(const std::string &prompt,
                               const std::optional<std::string> &model,
                               CapabilityDeadline deadline) {
  json payload;
  payload["model"] = (model && !model->empty()) ? *model : settings_.chat_model;
  payload["messages"] = json::array(
      {json{{"role", "system"}, {"content", "You are a helpful assistant."}},
       json{{"role", "user"}, {"content", prompt}}});

  json body = parseBody(
      http_.postJson(COMPLETIONS_ENDPOINT, payload, remaining(deadline)),
      "Chat completion");
  try {
    return textOf(body.at("choices").at(0).at("message").at("content"));
  } catch (const json::exception &e) {
    throw CapabilityError("Chat completion response is malformed: " +
                          std::string(e.what()));
  }
}

std::string
ParadigmClient::analyzeImage(const std::string &query,
                             const std::vector<std::string> &documentIds,
                             const std::optional<std::string> &model,
                             bool isPrivate, CapabilityDeadline deadline) {
  json payload;
  payload["query"] = query;
  payload["document_ids"] = documentIds;
  payload["private"] = isPrivate;
  if (model && !model->empty()) {
    payload["model"] = *model;
  }

  json body = parseBody(
      http_.postJson(IMAGE_ENDPOINT, payload, remaining(deadline)),
      "Image analysis");
  if (body.contains("answer") && !body["answer"].is_null()) {
    return textOf(body["answer"]);
  }
  return "No analysis result provided";
}
