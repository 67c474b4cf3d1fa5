#ifndef PROMPT_BUILDER_H
#define PROMPT_BUILDER_H

#include "clients/generation_service.h"
#include "workflow/workflow_models.h"
#include <string>

class PromptBuilder {
public:
  // Program shape, capability menu, the attached_file_ids binding and usage
  // examples. Shared by generation and regeneration.
  static const std::string &systemInstruction();

  static std::string userPrompt(const std::string &description,
                                const json &context);

  static std::string feedbackPrompt(const Workflow &workflow,
                                    const std::string &executionResult,
                                    const std::string &userFeedback);

  static GenerationRequest forGeneration(const std::string &description,
                                         const json &context);
  static GenerationRequest forFeedback(const Workflow &workflow,
                                       const std::string &executionResult,
                                       const std::string &userFeedback);
};

#endif
