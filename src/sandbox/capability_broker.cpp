#include "sandbox/capability_broker.h"
#include "core/errors.h"
#include "core/logger.h"
#include <algorithm>

namespace {

std::string requireString(const json &args, const char *key) {
  if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
    throw CapabilityError(std::string("argument '") + key +
                          "' must be a string");
  }
  return args[key].get<std::string>();
}

bool optionalBool(const json &args, const char *key, bool fallback) {
  if (!args.contains(key) || args[key].is_null()) {
    return fallback;
  }
  if (!args[key].is_boolean()) {
    throw CapabilityError(std::string("argument '") + key +
                          "' must be a boolean");
  }
  return args[key].get<bool>();
}

std::optional<std::string> optionalString(const json &args, const char *key) {
  if (!args.contains(key) || args[key].is_null()) {
    return std::nullopt;
  }
  if (!args[key].is_string()) {
    throw CapabilityError(std::string("argument '") + key +
                          "' must be a string");
  }
  return args[key].get<std::string>();
}

std::optional<json> optionalArray(const json &args, const char *key) {
  if (!args.contains(key) || args[key].is_null()) {
    return std::nullopt;
  }
  if (!args[key].is_array()) {
    throw CapabilityError(std::string("argument '") + key +
                          "' must be a list");
  }
  return args[key];
}

// Document ids may arrive as numbers or strings; the API takes strings.
std::vector<std::string> idList(const json &args, const char *key) {
  if (!args.contains(key) || !args[key].is_array()) {
    throw CapabilityError(std::string("argument '") + key +
                          "' must be a list");
  }
  std::vector<std::string> ids;
  for (const auto &item : args[key]) {
    if (item.is_string()) {
      ids.push_back(item.get<std::string>());
    } else if (item.is_number_integer()) {
      ids.push_back(std::to_string(item.get<long long>()));
    } else {
      throw CapabilityError(std::string("argument '") + key +
                            "' must contain ids");
    }
  }
  return ids;
}

} // namespace

CapabilityBroker::CapabilityBroker(std::shared_ptr<ICapabilityProvider> provider)
    : provider_(std::move(provider)) {}

const std::vector<std::string> &CapabilityBroker::permittedCapabilities() {
  static const std::vector<std::string> names = {
      "document_search", "analyze_documents_with_polling", "chat_completion",
      "analyze_image"};
  return names;
}

bool CapabilityBroker::isPermitted(const std::string &capability) {
  const auto &names = permittedCapabilities();
  return std::find(names.begin(), names.end(), capability) != names.end();
}

json CapabilityBroker::handle(const std::string &capability, const json &args,
                              CapabilityDeadline deadline) {
  if (!isPermitted(capability)) {
    callsRejected_++;
    Logger::warning(LogCategory::CAPABILITY, "handle",
                    "Refused capability call: " + capability);
    throw CapabilityError("capability not permitted: " + capability);
  }
  if (!provider_) {
    callsRejected_++;
    throw CapabilityError("capability provider not configured");
  }
  if (!args.is_object()) {
    throw CapabilityError("capability arguments must be an object");
  }

  Logger::info(LogCategory::CAPABILITY, "handle", "Serving " + capability);

  json value;
  if (capability == "document_search") {
    DocumentSearchOptions options;
    options.workspace_ids = optionalArray(args, "workspace_ids");
    options.file_ids = optionalArray(args, "file_ids");
    options.company_scope = optionalBool(args, "company_scope", true);
    options.private_scope = optionalBool(args, "private_scope", true);
    options.tool = optionalString(args, "tool").value_or("DocumentSearch");
    options.is_private = optionalBool(args, "private", false);
    value = provider_->documentSearch(requireString(args, "query"), options,
                                      deadline);
  } else if (capability == "analyze_documents_with_polling") {
    value = provider_->analyzeDocuments(
        requireString(args, "query"), idList(args, "document_ids"),
        optionalString(args, "model"), optionalBool(args, "private", false),
        deadline);
  } else if (capability == "chat_completion") {
    value = provider_->chatCompletion(requireString(args, "prompt"),
                                      optionalString(args, "model"), deadline);
  } else {
    value = provider_->analyzeImage(
        requireString(args, "query"), idList(args, "document_ids"),
        optionalString(args, "model"), optionalBool(args, "private", false),
        deadline);
  }

  callsServed_++;
  return value;
}
