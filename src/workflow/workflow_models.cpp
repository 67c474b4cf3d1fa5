#include "workflow/workflow_models.h"
#include "core/errors.h"
#include "utils/id_utils.h"
#include "utils/string_utils.h"

std::string workflowStatusToString(WorkflowStatus status) {
  switch (status) {
  case WorkflowStatus::CREATED:
    return "created";
  case WorkflowStatus::GENERATING:
    return "generating";
  case WorkflowStatus::READY:
    return "ready";
  case WorkflowStatus::EXECUTING:
    return "executing";
  case WorkflowStatus::COMPLETED:
    return "completed";
  case WorkflowStatus::FAILED:
    return "failed";
  }
  return "failed";
}

WorkflowStatus workflowStatusFromString(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "created")
    return WorkflowStatus::CREATED;
  if (lower == "generating")
    return WorkflowStatus::GENERATING;
  if (lower == "ready")
    return WorkflowStatus::READY;
  if (lower == "executing")
    return WorkflowStatus::EXECUTING;
  if (lower == "completed")
    return WorkflowStatus::COMPLETED;
  if (lower == "failed")
    return WorkflowStatus::FAILED;
  throw std::invalid_argument("Unknown workflow status: " + value);
}

std::string executionStatusToString(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::PENDING:
    return "pending";
  case ExecutionStatus::RUNNING:
    return "running";
  case ExecutionStatus::COMPLETED:
    return "completed";
  case ExecutionStatus::FAILED:
    return "failed";
  case ExecutionStatus::TIMEOUT:
    return "timeout";
  }
  return "failed";
}

ExecutionStatus executionStatusFromString(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "pending")
    return ExecutionStatus::PENDING;
  if (lower == "running")
    return ExecutionStatus::RUNNING;
  if (lower == "completed")
    return ExecutionStatus::COMPLETED;
  if (lower == "failed")
    return ExecutionStatus::FAILED;
  if (lower == "timeout")
    return ExecutionStatus::TIMEOUT;
  throw std::invalid_argument("Unknown execution status: " + value);
}

bool isTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::COMPLETED ||
         status == ExecutionStatus::FAILED ||
         status == ExecutionStatus::TIMEOUT;
}

Workflow Workflow::create(const std::string &description,
                          std::optional<std::string> name, json context) {
  Workflow workflow;
  workflow.id = IdUtils::generateUuid();
  workflow.name = std::move(name);
  workflow.description = description;
  workflow.status = WorkflowStatus::CREATED;
  workflow.created_at = TimeUtils::Clock::now();
  workflow.updated_at = workflow.created_at;
  workflow.context = std::move(context);
  return workflow;
}

bool Workflow::isExecutable() const {
  return hasCode() && status != WorkflowStatus::GENERATING &&
         status != WorkflowStatus::CREATED;
}

bool Workflow::canTransition(WorkflowStatus from, WorkflowStatus to) {
  switch (from) {
  case WorkflowStatus::CREATED:
    return to == WorkflowStatus::GENERATING || to == WorkflowStatus::FAILED;
  case WorkflowStatus::GENERATING:
    return to == WorkflowStatus::READY || to == WorkflowStatus::FAILED;
  case WorkflowStatus::READY:
  case WorkflowStatus::COMPLETED:
  case WorkflowStatus::FAILED:
    return to == WorkflowStatus::EXECUTING || to == WorkflowStatus::READY ||
           to == WorkflowStatus::FAILED || to == WorkflowStatus::GENERATING;
  case WorkflowStatus::EXECUTING:
    return to == WorkflowStatus::COMPLETED || to == WorkflowStatus::FAILED ||
           to == WorkflowStatus::READY || to == WorkflowStatus::EXECUTING;
  }
  return false;
}

void Workflow::updateStatus(WorkflowStatus next) {
  if (!canTransition(status, next)) {
    throw WorkflowStateError("Workflow " + id + " cannot move from " +
                             workflowStatusToString(status) + " to " +
                             workflowStatusToString(next));
  }
  if ((next == WorkflowStatus::READY || next == WorkflowStatus::EXECUTING) &&
      !hasCode()) {
    throw WorkflowStateError("Workflow " + id + " has no generated code");
  }
  status = next;
  updated_at = TimeUtils::Clock::now();
  if (next != WorkflowStatus::FAILED) {
    error.reset();
  }
}

void Workflow::markReady(const std::string &code) {
  if (StringUtils::trim(code).empty()) {
    throw WorkflowStateError("Workflow " + id +
                             " cannot become ready with empty code");
  }
  generated_code = code;
  updateStatus(WorkflowStatus::READY);
}

void Workflow::markFailed(const std::string &message) {
  updateStatus(WorkflowStatus::FAILED);
  error = message;
}

json Workflow::toJson() const {
  json out;
  out["id"] = id;
  out["name"] = name ? json(*name) : json(nullptr);
  out["description"] = description;
  out["generated_code"] = generated_code ? json(*generated_code) : json(nullptr);
  out["status"] = workflowStatusToString(status);
  out["error"] = error ? json(*error) : json(nullptr);
  out["created_at"] = TimeUtils::toIsoString(created_at);
  out["updated_at"] = TimeUtils::toIsoString(updated_at);
  out["context"] = context;
  return out;
}

WorkflowExecution
WorkflowExecution::create(const std::string &workflowId,
                          const std::string &userInput,
                          std::optional<std::vector<std::string>> attachedFileIds) {
  WorkflowExecution execution;
  execution.id = IdUtils::generateUuid();
  execution.workflow_id = workflowId;
  execution.user_input = userInput;
  execution.attached_file_ids = std::move(attachedFileIds);
  execution.status = ExecutionStatus::PENDING;
  execution.created_at = TimeUtils::Clock::now();
  return execution;
}

void WorkflowExecution::markRunning() {
  if (status != ExecutionStatus::PENDING) {
    throw WorkflowStateError("Execution " + id + " is already " +
                             executionStatusToString(status));
  }
  status = ExecutionStatus::RUNNING;
}

namespace {
void requireRunning(const WorkflowExecution &execution) {
  if (execution.status != ExecutionStatus::RUNNING) {
    throw WorkflowStateError("Execution " + execution.id + " is " +
                             executionStatusToString(execution.status) +
                             ", expected running");
  }
}
} // namespace

void WorkflowExecution::markCompleted(const std::string &output,
                                      double seconds) {
  requireRunning(*this);
  status = ExecutionStatus::COMPLETED;
  result = output;
  error.reset();
  execution_time = seconds;
  completed_at = TimeUtils::Clock::now();
}

void WorkflowExecution::markFailed(const std::string &message,
                                   double seconds) {
  requireRunning(*this);
  status = ExecutionStatus::FAILED;
  result.reset();
  error = message;
  execution_time = seconds;
  completed_at = TimeUtils::Clock::now();
}

void WorkflowExecution::markTimedOut(const std::string &message,
                                     double deadlineSeconds) {
  requireRunning(*this);
  status = ExecutionStatus::TIMEOUT;
  result.reset();
  error = message;
  execution_time = deadlineSeconds;
  completed_at = TimeUtils::Clock::now();
}

json WorkflowExecution::toJson() const {
  json out;
  out["id"] = id;
  out["workflow_id"] = workflow_id;
  out["user_input"] = user_input;
  out["attached_file_ids"] =
      attached_file_ids ? json(*attached_file_ids) : json(nullptr);
  out["status"] = executionStatusToString(status);
  out["result"] = result ? json(*result) : json(nullptr);
  out["error"] = error ? json(*error) : json(nullptr);
  out["execution_time"] = execution_time ? json(*execution_time) : json(nullptr);
  out["created_at"] = TimeUtils::toIsoString(created_at);
  out["completed_at"] =
      completed_at ? json(TimeUtils::toIsoString(*completed_at)) : json(nullptr);
  return out;
}
