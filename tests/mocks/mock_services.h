#ifndef MOCK_SERVICES_H
#define MOCK_SERVICES_H

#include "clients/capability_provider.h"
#include "clients/generation_service.h"
#include "core/errors.h"
#include "workflow/syntax_checker.h"
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Replays canned responses in order. An entry starting with "!error:" is
// thrown as a GenerationServiceError instead, one starting with "!crash:" as
// a std::logic_error.
class MockGenerationService : public IGenerationService {
  std::mutex mutex_;
  std::deque<std::string> responses_;
  std::vector<GenerationRequest> requests_;

public:
  void enqueue(const std::string &response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(response);
  }

  void enqueueError(const std::string &message) {
    enqueue("!error:" + message);
  }

  std::string generate(const GenerationRequest &request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (responses_.empty()) {
      throw GenerationServiceError("no canned response left", 500);
    }
    std::string response = responses_.front();
    responses_.pop_front();
    if (response.rfind("!error:", 0) == 0) {
      throw GenerationServiceError(response.substr(7), 503);
    }
    if (response.rfind("!crash:", 0) == 0) {
      throw std::logic_error(response.substr(7));
    }
    return response;
  }

  std::vector<GenerationRequest> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }
};

class MockCapabilityProvider : public ICapabilityProvider {
  std::mutex mutex_;
  std::vector<std::string> calls_;

  void record(const std::string &call) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(call);
  }

public:
  json documentSearch(const std::string &query,
                      const DocumentSearchOptions &options,
                      CapabilityDeadline) override {
    record("document_search:" + query);
    json result;
    result["answer"] = "found: " + query;
    result["file_ids"] = options.file_ids.value_or(json(nullptr));
    result["private"] = options.is_private;
    return result;
  }

  std::string analyzeDocuments(const std::string &query,
                               const std::vector<std::string> &documentIds,
                               const std::optional<std::string> &,
                               bool, CapabilityDeadline) override {
    record("analyze_documents:" + query);
    return "analysis of " + std::to_string(documentIds.size()) + " documents";
  }

  std::string chatCompletion(const std::string &prompt,
                             const std::optional<std::string> &model,
                             CapabilityDeadline) override {
    record("chat_completion:" + prompt);
    if (prompt == "fail") {
      throw CapabilityError("Chat completion failed: upstream 500");
    }
    return "echo(" + model.value_or("default") + "): " + prompt;
  }

  std::string analyzeImage(const std::string &query,
                           const std::vector<std::string> &documentIds,
                           const std::optional<std::string> &, bool,
                           CapabilityDeadline) override {
    record("analyze_image:" + query);
    return "image " + (documentIds.empty() ? std::string("none")
                                           : documentIds.front());
  }

  std::vector<std::string> calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
};

// Answers every check with a fixed verdict; "!unavailable" makes check()
// throw SandboxError instead.
class MockSyntaxChecker : public ISyntaxChecker {
  std::mutex mutex_;
  std::optional<std::string> verdict_;
  std::vector<std::string> checked_;

public:
  explicit MockSyntaxChecker(std::optional<std::string> verdict = std::nullopt)
      : verdict_(std::move(verdict)) {}

  std::optional<std::string> check(const std::string &code) override {
    std::lock_guard<std::mutex> lock(mutex_);
    checked_.push_back(code);
    if (verdict_ && *verdict_ == "!unavailable") {
      throw SandboxError("Python interpreter not found: python3");
    }
    return verdict_;
  }

  std::vector<std::string> checked() {
    std::lock_guard<std::mutex> lock(mutex_);
    return checked_;
  }
};

#endif
