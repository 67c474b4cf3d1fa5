#ifndef WORKFLOW_MODELS_H
#define WORKFLOW_MODELS_H

#include "utils/time_utils.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

enum class WorkflowStatus {
  CREATED,
  GENERATING,
  READY,
  EXECUTING,
  COMPLETED,
  FAILED
};

enum class ExecutionStatus { PENDING, RUNNING, COMPLETED, FAILED, TIMEOUT };

std::string workflowStatusToString(WorkflowStatus status);
WorkflowStatus workflowStatusFromString(const std::string &value);
std::string executionStatusToString(ExecutionStatus status);
ExecutionStatus executionStatusFromString(const std::string &value);

bool isTerminal(ExecutionStatus status);

struct Workflow {
  std::string id;
  std::optional<std::string> name;
  std::string description;
  std::optional<std::string> generated_code;
  WorkflowStatus status = WorkflowStatus::CREATED;
  std::optional<std::string> error;
  TimeUtils::TimePoint created_at;
  TimeUtils::TimePoint updated_at;
  json context;

  static Workflow create(const std::string &description,
                         std::optional<std::string> name = std::nullopt,
                         json context = nullptr);

  bool hasCode() const {
    return generated_code.has_value() && !generated_code->empty();
  }

  // Code present and generation not in progress.
  bool isExecutable() const;

  static bool canTransition(WorkflowStatus from, WorkflowStatus to);

  // Moves to `next`, refreshing updated_at. Any non-failed target clears
  // error. Throws WorkflowStateError on an illegal transition or when
  // entering READY/EXECUTING without code.
  void updateStatus(WorkflowStatus next);

  void markReady(const std::string &code);
  void markFailed(const std::string &message);

  json toJson() const;
};

struct WorkflowExecution {
  std::string id;
  std::string workflow_id;
  std::string user_input;
  std::optional<std::vector<std::string>> attached_file_ids;
  ExecutionStatus status = ExecutionStatus::PENDING;
  std::optional<std::string> result;
  std::optional<std::string> error;
  std::optional<double> execution_time;
  TimeUtils::TimePoint created_at;
  std::optional<TimeUtils::TimePoint> completed_at;

  static WorkflowExecution
  create(const std::string &workflowId, const std::string &userInput,
         std::optional<std::vector<std::string>> attachedFileIds =
             std::nullopt);

  void markRunning();
  void markCompleted(const std::string &output, double seconds);
  void markFailed(const std::string &message, double seconds);
  void markTimedOut(const std::string &message, double deadlineSeconds);

  json toJson() const;
};

#endif
