#include "service/workflow_service.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/time_utils.h"

WorkflowService::WorkflowService(WorkflowStore &store,
                                 WorkflowGenerator &generator,
                                 WorkflowExecutor &executor, WorkerPool &pool)
    : store_(store), generator_(generator), executor_(executor), pool_(pool) {}

Workflow WorkflowService::createWorkflow(const std::string &description,
                                         const std::optional<std::string> &name,
                                         const json &context) {
  return generator_.generateWorkflow(description, name, context);
}

Workflow WorkflowService::createWorkflowWithFiles(
    const std::string &description, const std::vector<std::string> &fileIds,
    const std::optional<std::string> &name, const json &context) {
  if (!context.is_null() && !context.is_object()) {
    throw InvalidRequestError("Workflow context must be a JSON object");
  }

  json enriched = context.is_object() ? context : json::object();
  enriched["uploaded_file_ids"] = fileIds;
  enriched["use_uploaded_files"] = true;

  Logger::info(LogCategory::SERVICE, "createWorkflowWithFiles",
               "Creating workflow with " + std::to_string(fileIds.size()) +
                   " uploaded files");
  return generator_.generateWorkflow(description, name, enriched);
}

Workflow WorkflowService::getWorkflow(const std::string &workflowId) const {
  std::optional<Workflow> workflow = store_.getWorkflow(workflowId);
  if (!workflow) {
    throw WorkflowNotFoundError(workflowId);
  }
  return *workflow;
}

WorkflowExecution WorkflowService::executeWorkflow(
    const std::string &workflowId, const std::string &userInput,
    const std::optional<std::vector<std::string>> &attachedFileIds) {
  return executor_.executeWorkflow(workflowId, userInput, attachedFileIds);
}

WorkflowExecution
WorkflowService::getExecution(const std::string &workflowId,
                              const std::string &executionId) const {
  std::optional<WorkflowExecution> execution = store_.getExecution(executionId);
  if (!execution) {
    throw ExecutionNotFoundError(executionId);
  }
  if (execution->workflow_id != workflowId) {
    throw InvalidRequestError("Execution " + executionId +
                              " does not belong to workflow " + workflowId);
  }
  return *execution;
}

std::vector<WorkflowExecution>
WorkflowService::listExecutions(const std::string &workflowId) const {
  if (!store_.getWorkflow(workflowId)) {
    throw WorkflowNotFoundError(workflowId);
  }
  return store_.listExecutions(workflowId);
}

// Asks the generator for corrected code and applies the outcome to the stored
// workflow: ready with the new code, or failed with the reason. Lookup and
// availability errors leave the workflow untouched.
Workflow WorkflowService::regenerateWorkflow(const std::string &workflowId,
                                             const std::string &executionResult,
                                             const std::string &feedback) {
  Workflow current = getWorkflow(workflowId);
  if (current.status == WorkflowStatus::GENERATING ||
      current.status == WorkflowStatus::CREATED) {
    throw WorkflowStateError("Workflow " + workflowId +
                             " is still being generated");
  }
  if (!generator_.isAvailable()) {
    throw ServiceUnavailableError(
        "Code generation is unavailable: no generation API key configured");
  }

  std::string code;
  try {
    code = generator_.regenerateWithFeedback(current, executionResult,
                                             feedback);
  } catch (const GenerationError &e) {
    std::string message = e.what();
    store_.updateWorkflow(workflowId,
                          [&message](Workflow &w) { w.markFailed(message); });
    Logger::error(LogCategory::SERVICE, "regenerateWorkflow",
                  "Regeneration of " + workflowId + " failed: " + message);
    throw;
  }

  Workflow updated = store_.updateWorkflow(
      workflowId, [&code](Workflow &w) { w.markReady(code); });
  Logger::info(LogCategory::SERVICE, "regenerateWorkflow",
               "Workflow " + workflowId + " regenerated");
  return updated;
}

json WorkflowService::health() const {
  json status;
  status["status"] = "healthy";
  status["timestamp"] = TimeUtils::getCurrentTimestamp();
  status["generation_available"] = generator_.isAvailable();
  status["workflows"] = store_.workflowCount();
  status["executions"] = store_.executionCount();
  status["active_executions"] = store_.activeExecutionCount();
  status["execution_timeout_seconds"] = executor_.timeout().count();
  status["workers"] = {{"total", pool_.totalWorkers()},
                       {"active", pool_.activeWorkers()},
                       {"pending", pool_.pendingTasks()},
                       {"completed", pool_.completedTasks()},
                       {"failed", pool_.failedTasks()}};
  return status;
}

std::future<Workflow>
WorkflowService::createWorkflowAsync(const std::string &description,
                                     const std::optional<std::string> &name,
                                     const json &context) {
  return pool_.submit("create_workflow", [this, description, name, context] {
    return createWorkflow(description, name, context);
  });
}

std::future<WorkflowExecution> WorkflowService::executeWorkflowAsync(
    const std::string &workflowId, const std::string &userInput,
    const std::optional<std::vector<std::string>> &attachedFileIds) {
  return pool_.submit("execute_workflow",
                      [this, workflowId, userInput, attachedFileIds] {
                        return executeWorkflow(workflowId, userInput,
                                               attachedFileIds);
                      });
}

std::future<Workflow>
WorkflowService::regenerateWorkflowAsync(const std::string &workflowId,
                                         const std::string &executionResult,
                                         const std::string &feedback) {
  return pool_.submit("regenerate_workflow",
                      [this, workflowId, executionResult, feedback] {
                        return regenerateWorkflow(workflowId, executionResult,
                                                  feedback);
                      });
}
