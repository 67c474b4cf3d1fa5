#include "workflow/workflow_generator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "workflow/prompt_builder.h"
#include "workflow/response_cleaner.h"

WorkflowGenerator::WorkflowGenerator(
    WorkflowStore &store, std::shared_ptr<IGenerationService> service,
    std::shared_ptr<ISyntaxChecker> syntaxChecker)
    : store_(store), service_(std::move(service)),
      syntaxChecker_(std::move(syntaxChecker)) {}

std::string WorkflowGenerator::acceptCode(const std::string &response,
                                          const std::string &failurePrefix,
                                          const std::string &workflowId) const {
  std::string code = ResponseCleaner::clean(response);
  if (Logger::isEnabled(LogLevel::DEBUG)) {
    Logger::debug(LogCategory::GENERATION, "acceptCode",
                  "Cleaned code for " + workflowId + ":\n" + code);
  }

  ValidationResult validation = CodeValidator::validate(code);
  if (validation.valid && syntaxChecker_) {
    std::optional<std::string> compileError;
    try {
      compileError = syntaxChecker_->check(code);
    } catch (const SandboxError &e) {
      throw GenerationError("Syntax check unavailable: " + std::string(e.what()),
                            workflowId);
    }
    validation = CodeValidator::validate(code, compileError);
  }
  if (!validation.valid) {
    std::string reason = validation.reason.value_or("invalid code");
    Logger::warning(LogCategory::VALIDATION, "acceptCode",
                    "Rejected code for " + workflowId + ": " + reason);
    throw CodeValidationError(failurePrefix, reason, workflowId);
  }
  return code;
}

Workflow WorkflowGenerator::generateWorkflow(
    const std::string &description, const std::optional<std::string> &name,
    const json &context) {
  if (StringUtils::trim(description).empty()) {
    throw InvalidRequestError("Workflow description must not be empty");
  }
  if (!service_) {
    throw ServiceUnavailableError(
        "Code generation is unavailable: no generation API key configured");
  }

  Workflow workflow = Workflow::create(description, name, context);
  store_.storeWorkflow(workflow);
  const std::string id = workflow.id;
  Logger::info(LogCategory::GENERATION, "generateWorkflow",
               "Generating workflow " + id);

  try {
    store_.updateWorkflow(id, [](Workflow &w) {
      w.updateStatus(WorkflowStatus::GENERATING);
    });

    std::string response;
    try {
      response = service_->generate(PromptBuilder::forGeneration(
          description, context.is_null() ? json(nullptr) : context));
    } catch (const GenerationServiceError &e) {
      throw GenerationError("Code generation failed: " + std::string(e.what()),
                            id);
    }

    std::string code =
        acceptCode(response, "Generated code validation failed", id);

    Workflow ready =
        store_.updateWorkflow(id, [&code](Workflow &w) { w.markReady(code); });
    Logger::info(LogCategory::GENERATION, "generateWorkflow",
                 "Workflow " + id + " is ready");
    return ready;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::GENERATION, "generateWorkflow",
                  "Workflow " + id + " failed: " + std::string(e.what()));
    std::string message = e.what();
    store_.updateWorkflow(
        id, [&message](Workflow &w) { w.markFailed(message); });
    throw;
  }
}

std::string
WorkflowGenerator::regenerateWithFeedback(const Workflow &workflow,
                                          const std::string &executionResult,
                                          const std::string &userFeedback) {
  if (!service_) {
    throw ServiceUnavailableError(
        "Code generation is unavailable: no generation API key configured");
  }

  Logger::info(LogCategory::GENERATION, "regenerateWithFeedback",
               "Regenerating workflow " + workflow.id);

  std::string response;
  try {
    response = service_->generate(
        PromptBuilder::forFeedback(workflow, executionResult, userFeedback));
  } catch (const GenerationServiceError &e) {
    throw GenerationError("Code regeneration failed: " + std::string(e.what()),
                          workflow.id);
  }

  return acceptCode(response, "Improved code validation failed", workflow.id);
}
