#ifndef WORKFLOW_EXECUTOR_H
#define WORKFLOW_EXECUTOR_H

#include "core/app_config.h"
#include "sandbox/capability_broker.h"
#include "workflow/workflow_store.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class WorkflowExecutor {
  WorkflowStore &store_;
  ExecutionSettings settings_;
  std::shared_ptr<CapabilityBroker> broker_;

public:
  WorkflowExecutor(WorkflowStore &store, const ExecutionSettings &settings,
                   std::shared_ptr<CapabilityBroker> broker);

  // Runs the workflow's code once in a fresh isolate and returns the terminal
  // execution record. Lookup and state errors are thrown before anything
  // runs; everything after that ends in completed, failed or timeout.
  WorkflowExecution
  executeWorkflow(const std::string &workflowId, const std::string &userInput,
                  const std::optional<std::vector<std::string>>
                      &attachedFileIds = std::nullopt);

  std::chrono::seconds timeout() const {
    return std::chrono::seconds(settings_.timeout_seconds);
  }
};

#endif
