#ifndef WORKFLOW_SERVICE_H
#define WORKFLOW_SERVICE_H

#include "service/worker_pool.h"
#include "workflow/workflow_executor.h"
#include "workflow/workflow_generator.h"
#include "workflow/workflow_store.h"
#include <future>
#include <optional>
#include <string>
#include <vector>

// Operations the boundary layer consumes. Lookup failures surface as
// WorkflowNotFoundError / ExecutionNotFoundError, caller mistakes as
// InvalidRequestError.
class WorkflowService {
  WorkflowStore &store_;
  WorkflowGenerator &generator_;
  WorkflowExecutor &executor_;
  WorkerPool &pool_;

public:
  WorkflowService(WorkflowStore &store, WorkflowGenerator &generator,
                  WorkflowExecutor &executor, WorkerPool &pool);

  Workflow createWorkflow(const std::string &description,
                          const std::optional<std::string> &name = std::nullopt,
                          const json &context = nullptr);

  // Same as createWorkflow, with the uploaded file ids recorded in the
  // context so the generated code reads them from attached_file_ids.
  Workflow createWorkflowWithFiles(const std::string &description,
                                   const std::vector<std::string> &fileIds,
                                   const std::optional<std::string> &name =
                                       std::nullopt,
                                   const json &context = nullptr);

  Workflow getWorkflow(const std::string &workflowId) const;

  WorkflowExecution
  executeWorkflow(const std::string &workflowId, const std::string &userInput,
                  const std::optional<std::vector<std::string>>
                      &attachedFileIds = std::nullopt);

  // Throws InvalidRequestError when the execution belongs to another
  // workflow.
  WorkflowExecution getExecution(const std::string &workflowId,
                                 const std::string &executionId) const;

  std::vector<WorkflowExecution>
  listExecutions(const std::string &workflowId) const;

  Workflow regenerateWorkflow(const std::string &workflowId,
                              const std::string &executionResult,
                              const std::string &feedback);

  json health() const;

  std::future<Workflow>
  createWorkflowAsync(const std::string &description,
                      const std::optional<std::string> &name = std::nullopt,
                      const json &context = nullptr);
  std::future<WorkflowExecution>
  executeWorkflowAsync(const std::string &workflowId,
                       const std::string &userInput,
                       const std::optional<std::vector<std::string>>
                           &attachedFileIds = std::nullopt);
  std::future<Workflow> regenerateWorkflowAsync(const std::string &workflowId,
                                                const std::string &executionResult,
                                                const std::string &feedback);
};

#endif
