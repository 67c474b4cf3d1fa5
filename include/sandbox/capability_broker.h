#ifndef CAPABILITY_BROKER_H
#define CAPABILITY_BROKER_H

#include "clients/capability_provider.h"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Answers capability calls coming out of an isolate. Only the fixed menu is
// served; any other name is refused with "capability not permitted: <name>".
class CapabilityBroker {
  std::shared_ptr<ICapabilityProvider> provider_;
  std::atomic<size_t> callsServed_{0};
  std::atomic<size_t> callsRejected_{0};

public:
  explicit CapabilityBroker(std::shared_ptr<ICapabilityProvider> provider);

  static const std::vector<std::string> &permittedCapabilities();
  static bool isPermitted(const std::string &capability);

  // Throws CapabilityError for refused calls, malformed arguments and
  // provider failures.
  json handle(const std::string &capability, const json &args,
              CapabilityDeadline deadline);

  size_t callsServed() const { return callsServed_.load(); }
  size_t callsRejected() const { return callsRejected_.load(); }
};

#endif
