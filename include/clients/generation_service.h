#ifndef GENERATION_SERVICE_H
#define GENERATION_SERVICE_H

#include "clients/http_client.h"
#include "core/app_config.h"
#include <string>

struct GenerationRequest {
  std::string system;
  std::string user;
};

class IGenerationService {
public:
  virtual ~IGenerationService() = default;

  // One request, no retries. Throws GenerationServiceError.
  virtual std::string generate(const GenerationRequest &request) = 0;
};

class AnthropicGenerationService : public IGenerationService {
  GenerationSettings settings_;
  HttpClient http_;

public:
  explicit AnthropicGenerationService(const GenerationSettings &settings);

  std::string generate(const GenerationRequest &request) override;

  static json buildRequestBody(const GenerationSettings &settings,
                               const GenerationRequest &request);
  // Concatenated text blocks of a Messages API response.
  static std::string extractText(const json &response);
};

#endif
