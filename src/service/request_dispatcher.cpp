#include "service/request_dispatcher.h"
#include "core/errors.h"
#include "core/logger.h"

RequestDispatcher::RequestDispatcher(WorkflowService &service, bool debug)
    : service_(service), debug_(debug) {}

std::string RequestDispatcher::requiredString(const json &request,
                                              const std::string &field) {
  auto it = request.find(field);
  if (it == request.end() || it->is_null()) {
    throw InvalidRequestError("Missing required field: " + field);
  }
  if (!it->is_string()) {
    throw InvalidRequestError("Field " + field + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<std::string>
RequestDispatcher::optionalString(const json &request,
                                  const std::string &field) {
  auto it = request.find(field);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw InvalidRequestError("Field " + field + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<std::vector<std::string>>
RequestDispatcher::optionalStringList(const json &request,
                                      const std::string &field) {
  auto it = request.find(field);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_array()) {
    throw InvalidRequestError("Field " + field + " must be a list of strings");
  }

  std::vector<std::string> values;
  values.reserve(it->size());
  for (const auto &item : *it) {
    if (!item.is_string()) {
      throw InvalidRequestError("Field " + field +
                                " must be a list of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

json RequestDispatcher::route(const std::string &op, const json &request) {
  if (op == "health") {
    return service_.health();
  }

  if (op == "create_workflow" || op == "create_workflow_with_files") {
    std::string description = requiredString(request, "description");
    std::optional<std::string> name = optionalString(request, "name");
    json context = request.value("context", json(nullptr));
    if (!context.is_null() && !context.is_object()) {
      throw InvalidRequestError("Field context must be an object");
    }

    if (op == "create_workflow") {
      return service_.createWorkflow(description, name, context).toJson();
    }

    std::optional<std::vector<std::string>> fileIds =
        optionalStringList(request, "file_ids");
    if (!fileIds) {
      throw InvalidRequestError("Missing required field: file_ids");
    }
    return service_.createWorkflowWithFiles(description, *fileIds, name, context)
        .toJson();
  }

  if (op == "get_workflow") {
    return service_.getWorkflow(requiredString(request, "workflow_id")).toJson();
  }

  if (op == "execute_workflow") {
    return service_
        .executeWorkflow(requiredString(request, "workflow_id"),
                         requiredString(request, "user_input"),
                         optionalStringList(request, "attached_file_ids"))
        .toJson();
  }

  if (op == "get_execution") {
    return service_
        .getExecution(requiredString(request, "workflow_id"),
                      requiredString(request, "execution_id"))
        .toJson();
  }

  if (op == "list_executions") {
    std::string workflowId = requiredString(request, "workflow_id");
    json executions = json::array();
    for (const auto &execution : service_.listExecutions(workflowId)) {
      executions.push_back(execution.toJson());
    }
    return json{{"workflow_id", workflowId}, {"executions", executions}};
  }

  if (op == "regenerate_workflow") {
    return service_
        .regenerateWorkflow(requiredString(request, "workflow_id"),
                            requiredString(request, "execution_result"),
                            requiredString(request, "feedback"))
        .toJson();
  }

  throw InvalidRequestError("Unknown operation: " + op);
}

json RequestDispatcher::errorResponse(const json &requestId,
                                      const std::string &category,
                                      const std::string &message) const {
  return json{{"request_id", requestId},
              {"ok", false},
              {"error", {{"category", category}, {"message", message}}}};
}

// Runs one request and folds every failure into a categorized error
// response. Caller errors keep their message; unexpected failures are logged
// in full and reported generically unless debug is on.
json RequestDispatcher::dispatch(const json &request) {
  json requestId = nullptr;
  if (request.is_object()) {
    requestId = request.value("request_id", json(nullptr));
  }

  try {
    if (!request.is_object()) {
      throw InvalidRequestError("Request must be a JSON object");
    }
    std::string op = requiredString(request, "op");
    Logger::debug(LogCategory::SERVICE, "dispatch",
                  "Request " + requestId.dump() + " op=" + op);

    json data = route(op, request);
    return json{{"request_id", requestId}, {"ok", true}, {"data", data}};
  } catch (const InvalidRequestError &e) {
    return errorResponse(requestId, "bad_request", e.what());
  } catch (const WorkflowStateError &e) {
    return errorResponse(requestId, "bad_request", e.what());
  } catch (const WorkflowNotFoundError &e) {
    return errorResponse(requestId, "not_found", e.what());
  } catch (const ExecutionNotFoundError &e) {
    return errorResponse(requestId, "not_found", e.what());
  } catch (const GenerationError &e) {
    return errorResponse(requestId, "generation_failed", e.what());
  } catch (const ServiceUnavailableError &e) {
    return errorResponse(requestId, "unavailable", e.what());
  } catch (const json::exception &e) {
    return errorResponse(requestId, "bad_request",
                         "Malformed request: " + std::string(e.what()));
  } catch (const std::exception &e) {
    Logger::error(LogCategory::SERVICE, "dispatch",
                  "Request " + requestId.dump() +
                      " failed: " + std::string(e.what()));
    return errorResponse(requestId, "internal",
                         debug_ ? std::string(e.what())
                                : "Internal server error");
  }
}

std::string RequestDispatcher::handleLine(const std::string &line) {
  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error &e) {
    Logger::warning(LogCategory::SERVICE, "handleLine",
                    "Malformed request line: " + std::string(e.what()));
    return errorResponse(nullptr, "bad_request",
                         "Malformed JSON: " + std::string(e.what()))
        .dump(-1, ' ', false, json::error_handler_t::replace);
  }
  return dispatch(request).dump(-1, ' ', false,
                                json::error_handler_t::replace);
}
