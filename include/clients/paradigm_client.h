#ifndef PARADIGM_CLIENT_H
#define PARADIGM_CLIENT_H

#include "clients/capability_provider.h"
#include "clients/http_client.h"
#include "core/app_config.h"

class ParadigmClient : public ICapabilityProvider {
  ParadigmSettings settings_;
  HttpClient http_;

  json parseBody(const HttpResponse &response, const std::string &what) const;

public:
  explicit ParadigmClient(const ParadigmSettings &settings);

  json documentSearch(const std::string &query,
                      const DocumentSearchOptions &options,
                      CapabilityDeadline deadline) override;

  std::string analyzeDocuments(const std::string &query,
                               const std::vector<std::string> &documentIds,
                               const std::optional<std::string> &model,
                               bool isPrivate,
                               CapabilityDeadline deadline) override;

  std::string chatCompletion(const std::string &prompt,
                             const std::optional<std::string> &model,
                             CapabilityDeadline deadline) override;

  std::string analyzeImage(const std::string &query,
                           const std::vector<std::string> &documentIds,
                           const std::optional<std::string> &model,
                           bool isPrivate,
                           CapabilityDeadline deadline) override;

  // Maps a polled analysis payload to its result text. Returns nullopt while
  // the analysis is still running; throws CapabilityError when it failed.
  static std::optional<std::string> interpretAnalysisStatus(const json &payload);
};

#endif
