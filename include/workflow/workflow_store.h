#ifndef WORKFLOW_STORE_H
#define WORKFLOW_STORE_H

#include "workflow/workflow_models.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// In-memory registry of workflows and executions. Lookups take the map lock
// shared; each workflow carries its own mutex so status transitions of one
// workflow are serialized without blocking the others. Callers only ever see
// copies.
class WorkflowStore {
public:
  WorkflowStore() = default;
  WorkflowStore(const WorkflowStore &) = delete;
  WorkflowStore &operator=(const WorkflowStore &) = delete;

  void storeWorkflow(const Workflow &workflow);
  std::optional<Workflow> getWorkflow(const std::string &id) const;

  // Applies `mutator` under the workflow's lock and returns the updated copy.
  // Throws WorkflowNotFoundError; exceptions from the mutator propagate and
  // leave the stored record untouched.
  Workflow updateWorkflow(const std::string &id,
                          const std::function<void(Workflow &)> &mutator);

  // Registers an in-flight run: checks that the workflow is executable,
  // moves it to EXECUTING and returns a private copy of it.
  Workflow beginExecution(const std::string &workflowId);

  // Releases a run. When it was the last one in flight and nothing else
  // changed the status meanwhile, the workflow takes the run's outcome.
  void finishExecution(const std::string &workflowId,
                       const WorkflowExecution &execution);

  void storeExecution(const WorkflowExecution &execution);
  std::optional<WorkflowExecution> getExecution(const std::string &id) const;
  std::vector<WorkflowExecution>
  listExecutions(const std::string &workflowId) const;

  size_t workflowCount() const;
  size_t executionCount() const;
  size_t activeExecutionCount() const;

private:
  struct WorkflowEntry {
    mutable std::mutex mutex;
    Workflow workflow;
    size_t activeExecutions = 0;
  };

  std::shared_ptr<WorkflowEntry> findEntry(const std::string &id) const;

  mutable std::shared_mutex workflowsMutex_;
  std::unordered_map<std::string, std::shared_ptr<WorkflowEntry>> workflows_;

  mutable std::shared_mutex executionsMutex_;
  std::unordered_map<std::string, WorkflowExecution> executions_;
};

#endif
