#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

class WorkflowError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Caller errors: malformed input, or ids that do not belong together.
class InvalidRequestError : public WorkflowError {
public:
  using WorkflowError::WorkflowError;
};

class WorkflowNotFoundError : public WorkflowError {
public:
  explicit WorkflowNotFoundError(const std::string &workflowId)
      : WorkflowError("Workflow " + workflowId + " not found"),
        workflowId_(workflowId) {}

  const std::string &workflowId() const { return workflowId_; }

private:
  std::string workflowId_;
};

class ExecutionNotFoundError : public WorkflowError {
public:
  explicit ExecutionNotFoundError(const std::string &executionId)
      : WorkflowError("Execution " + executionId + " not found"),
        executionId_(executionId) {}

  const std::string &executionId() const { return executionId_; }

private:
  std::string executionId_;
};

class WorkflowStateError : public WorkflowError {
public:
  using WorkflowError::WorkflowError;
};

class GenerationError : public WorkflowError {
public:
  GenerationError(const std::string &message, std::string workflowId = "")
      : WorkflowError(message), workflowId_(std::move(workflowId)) {}

  const std::string &workflowId() const { return workflowId_; }

private:
  std::string workflowId_;
};

class CodeValidationError : public GenerationError {
public:
  CodeValidationError(const std::string &prefix, const std::string &reason,
                      std::string workflowId = "")
      : GenerationError(prefix + ": " + reason, std::move(workflowId)),
        reason_(reason) {}

  const std::string &reason() const { return reason_; }

private:
  std::string reason_;
};

class ServiceUnavailableError : public WorkflowError {
public:
  using WorkflowError::WorkflowError;
};

// Failures of the external services, raised by the HTTP clients.
class GenerationServiceError : public std::runtime_error {
public:
  GenerationServiceError(const std::string &message, int statusCode = 0)
      : std::runtime_error(message), statusCode_(statusCode) {}

  int statusCode() const { return statusCode_; }

private:
  int statusCode_;
};

class CapabilityError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The isolate could not be set up (pipes, fork, work directory).
class SandboxError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

#endif
