#include "workflow/workflow_store.h"
#include "core/errors.h"
#include "core/logger.h"
#include <algorithm>

void WorkflowStore::storeWorkflow(const Workflow &workflow) {
  if (workflow.id.empty()) {
    throw InvalidRequestError("Workflow id must not be empty");
  }

  std::unique_lock<std::shared_mutex> lock(workflowsMutex_);
  auto it = workflows_.find(workflow.id);
  if (it != workflows_.end()) {
    std::lock_guard<std::mutex> entryLock(it->second->mutex);
    it->second->workflow = workflow;
    return;
  }

  auto entry = std::make_shared<WorkflowEntry>();
  entry->workflow = workflow;
  workflows_.emplace(workflow.id, std::move(entry));
  Logger::debug(LogCategory::STORE, "storeWorkflow",
                "Stored workflow " + workflow.id);
}

std::shared_ptr<WorkflowStore::WorkflowEntry>
WorkflowStore::findEntry(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(workflowsMutex_);
  auto it = workflows_.find(id);
  if (it == workflows_.end()) {
    return nullptr;
  }
  return it->second;
}

std::optional<Workflow> WorkflowStore::getWorkflow(const std::string &id) const {
  auto entry = findEntry(id);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->workflow;
}

Workflow
WorkflowStore::updateWorkflow(const std::string &id,
                              const std::function<void(Workflow &)> &mutator) {
  auto entry = findEntry(id);
  if (!entry) {
    throw WorkflowNotFoundError(id);
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  Workflow working = entry->workflow;
  mutator(working);
  entry->workflow = working;
  return working;
}

Workflow WorkflowStore::beginExecution(const std::string &workflowId) {
  auto entry = findEntry(workflowId);
  if (!entry) {
    throw WorkflowNotFoundError(workflowId);
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  Workflow &workflow = entry->workflow;
  if (!workflow.hasCode()) {
    throw WorkflowStateError("Workflow " + workflowId +
                             " has no generated code");
  }
  if (!workflow.isExecutable()) {
    throw WorkflowStateError("Workflow " + workflowId + " is " +
                             workflowStatusToString(workflow.status) +
                             " and cannot be executed");
  }

  if (workflow.status != WorkflowStatus::EXECUTING) {
    workflow.updateStatus(WorkflowStatus::EXECUTING);
  }
  entry->activeExecutions++;
  return workflow;
}

void WorkflowStore::finishExecution(const std::string &workflowId,
                                    const WorkflowExecution &execution) {
  auto entry = findEntry(workflowId);
  if (!entry) {
    Logger::warning(LogCategory::STORE, "finishExecution",
                    "Workflow " + workflowId +
                        " vanished while an execution was in flight");
    return;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->activeExecutions > 0) {
    entry->activeExecutions--;
  }
  if (entry->activeExecutions > 0 ||
      entry->workflow.status != WorkflowStatus::EXECUTING) {
    return;
  }

  if (execution.status == ExecutionStatus::COMPLETED) {
    entry->workflow.updateStatus(WorkflowStatus::COMPLETED);
  } else {
    entry->workflow.markFailed(execution.error.value_or("Execution failed"));
  }
}

void WorkflowStore::storeExecution(const WorkflowExecution &execution) {
  std::unique_lock<std::shared_mutex> lock(executionsMutex_);
  executions_[execution.id] = execution;
}

std::optional<WorkflowExecution>
WorkflowStore::getExecution(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(executionsMutex_);
  auto it = executions_.find(id);
  if (it == executions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<WorkflowExecution>
WorkflowStore::listExecutions(const std::string &workflowId) const {
  std::vector<WorkflowExecution> result;
  {
    std::shared_lock<std::shared_mutex> lock(executionsMutex_);
    for (const auto &[id, execution] : executions_) {
      if (execution.workflow_id == workflowId) {
        result.push_back(execution);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const WorkflowExecution &a, const WorkflowExecution &b) {
              return a.created_at < b.created_at;
            });
  return result;
}

size_t WorkflowStore::workflowCount() const {
  std::shared_lock<std::shared_mutex> lock(workflowsMutex_);
  return workflows_.size();
}

size_t WorkflowStore::executionCount() const {
  std::shared_lock<std::shared_mutex> lock(executionsMutex_);
  return executions_.size();
}

size_t WorkflowStore::activeExecutionCount() const {
  std::vector<std::shared_ptr<WorkflowEntry>> entries;
  {
    std::shared_lock<std::shared_mutex> lock(workflowsMutex_);
    entries.reserve(workflows_.size());
    for (const auto &[id, entry] : workflows_) {
      entries.push_back(entry);
    }
  }

  size_t total = 0;
  for (const auto &entry : entries) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    total += entry->activeExecutions;
  }
  return total;
}
