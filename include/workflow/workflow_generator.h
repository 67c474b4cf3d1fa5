#ifndef WORKFLOW_GENERATOR_H
#define WORKFLOW_GENERATOR_H

#include "clients/generation_service.h"
#include "workflow/code_validator.h"
#include "workflow/syntax_checker.h"
#include "workflow/workflow_store.h"
#include <memory>
#include <optional>
#include <string>

class WorkflowGenerator {
  WorkflowStore &store_;
  std::shared_ptr<IGenerationService> service_;
  std::shared_ptr<ISyntaxChecker> syntaxChecker_;

  // Cleans and validates a model response. Throws CodeValidationError.
  std::string acceptCode(const std::string &response,
                         const std::string &failurePrefix,
                         const std::string &workflowId) const;

public:
  // `service` may be null when no generation credentials are configured.
  // Without a `syntaxChecker` only the built-in scanner checks syntax.
  WorkflowGenerator(WorkflowStore &store,
                    std::shared_ptr<IGenerationService> service,
                    std::shared_ptr<ISyntaxChecker> syntaxChecker = nullptr);

  bool isAvailable() const { return service_ != nullptr; }

  // Stores a new workflow, drives it created -> generating -> ready and
  // returns the final snapshot. On any failure the stored workflow ends in
  // failed with the reason and the error is rethrown.
  Workflow generateWorkflow(const std::string &description,
                            const std::optional<std::string> &name =
                                std::nullopt,
                            const json &context = nullptr);

  // Returns validated replacement code for `workflow`. Does not touch the
  // store; the caller applies the result.
  std::string regenerateWithFeedback(const Workflow &workflow,
                                     const std::string &executionResult,
                                     const std::string &userFeedback);
};

#endif
