#ifndef REQUEST_DISPATCHER_H
#define REQUEST_DISPATCHER_H

#include "service/workflow_service.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Maps JSON-lines requests of the form {"request_id", "op", ...} onto
// WorkflowService calls. Every request yields exactly one response object:
//   {"request_id": ..., "ok": true, "data": ...}
//   {"request_id": ..., "ok": false, "error": {"category", "message"}}
class RequestDispatcher {
  WorkflowService &service_;
  bool debug_;

  json route(const std::string &op, const json &request);
  json errorResponse(const json &requestId, const std::string &category,
                     const std::string &message) const;

public:
  RequestDispatcher(WorkflowService &service, bool debug);

  json dispatch(const json &request);

  // Parses one input line and dispatches it. Never throws for bad input.
  std::string handleLine(const std::string &line);

  static std::string requiredString(const json &request,
                                    const std::string &field);
  static std::optional<std::string> optionalString(const json &request,
                                                   const std::string &field);
  static std::optional<std::vector<std::string>>
  optionalStringList(const json &request, const std::string &field);
};

#endif
