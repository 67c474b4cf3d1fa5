#ifndef CAPABILITY_PROVIDER_H
#define CAPABILITY_PROVIDER_H

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

using CapabilityDeadline = std::chrono::steady_clock::time_point;

struct DocumentSearchOptions {
  std::optional<json> workspace_ids;
  std::optional<json> file_ids;
  bool company_scope = true;
  bool private_scope = true;
  std::string tool = "DocumentSearch";
  bool is_private = false;
};

// The operations generated programs may call. Every call is bounded by the
// deadline of the execution it serves; implementations throw CapabilityError.
class ICapabilityProvider {
public:
  virtual ~ICapabilityProvider() = default;

  virtual json documentSearch(const std::string &query,
                              const DocumentSearchOptions &options,
                              CapabilityDeadline deadline) = 0;

  // Submits an analysis and polls until it reaches a terminal status.
  virtual std::string
  analyzeDocuments(const std::string &query,
                   const std::vector<std::string> &documentIds,
                   const std::optional<std::string> &model, bool isPrivate,
                   CapabilityDeadline deadline) = 0;

  virtual std::string chatCompletion(const std::string &prompt,
                                     const std::optional<std::string> &model,
                                     CapabilityDeadline deadline) = 0;

  virtual std::string analyzeImage(const std::string &query,
                                   const std::vector<std::string> &documentIds,
                                   const std::optional<std::string> &model,
                                   bool isPrivate,
                                   CapabilityDeadline deadline) = 0;
};

#endif
