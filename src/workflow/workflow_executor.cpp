#include "workflow/workflow_executor.h"
#include "core/errors.h"
#include "core/logger.h"
#include "sandbox/sandbox_process.h"
#include "utils/time_utils.h"

WorkflowExecutor::WorkflowExecutor(WorkflowStore &store,
                                   const ExecutionSettings &settings,
                                   std::shared_ptr<CapabilityBroker> broker)
    : store_(store), settings_(settings), broker_(std::move(broker)) {}

WorkflowExecution WorkflowExecutor::executeWorkflow(
    const std::string &workflowId, const std::string &userInput,
    const std::optional<std::vector<std::string>> &attachedFileIds) {
  if (workflowId.empty()) {
    throw InvalidRequestError("Workflow id must not be empty");
  }

  WorkflowExecution execution =
      WorkflowExecution::create(workflowId, userInput, attachedFileIds);
  Workflow workflow = store_.beginExecution(workflowId);
  store_.storeExecution(execution);
  execution.markRunning();
  store_.storeExecution(execution);

  Logger::info(LogCategory::EXECUTION, "executeWorkflow",
               "Execution " + execution.id + " of workflow " + workflowId +
                   " started");

  const auto started = std::chrono::steady_clock::now();
  SandboxRequest request;
  request.code = *workflow.generated_code;
  request.user_input = userInput;
  request.attached_file_ids = attachedFileIds;
  request.timeout = timeout();

  try {
    SandboxProcess sandbox(settings_, broker_.get());
    SandboxOutcome outcome = sandbox.run(request);

    switch (outcome.kind) {
    case SandboxOutcomeKind::COMPLETED:
      execution.markCompleted(outcome.value, outcome.elapsedSeconds);
      break;
    case SandboxOutcomeKind::TIMED_OUT:
      execution.markTimedOut(outcome.error,
                             static_cast<double>(request.timeout.count()));
      break;
    case SandboxOutcomeKind::FAILED:
      execution.markFailed(outcome.error, outcome.elapsedSeconds);
      break;
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::EXECUTION, "executeWorkflow",
                  "Execution " + execution.id +
                      " could not run: " + std::string(e.what()));
    execution.markFailed(e.what(),
                         TimeUtils::toSeconds(std::chrono::steady_clock::now() -
                                              started));
  }

  store_.storeExecution(execution);
  store_.finishExecution(workflowId, execution);

  Logger::info(LogCategory::EXECUTION, "executeWorkflow",
               "Execution " + execution.id + " finished as " +
                   executionStatusToString(execution.status) + " in " +
                   std::to_string(execution.execution_time.value_or(0.0)) +
                   "s");
  return execution;
}
