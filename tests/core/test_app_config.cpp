#include "core/app_config.h"
#include <cassert>
#include <iostream>

void testDefaults() {
  std::cout << "Testing AppConfig - defaults...\n";

  AppSettings settings = AppConfig::parseSettings(json::object(), AppSettings{});
  assert(settings.execution.timeout_seconds == 300);
  assert(settings.execution.network_isolation == IsolationMode::BEST_EFFORT);
  assert(settings.server.workers == 4);
  assert(!settings.server.debug);
  assert(settings.generation.base_url == "https://api.anthropic.com");

  std::cout << "✓ AppConfig defaults test passed\n";
}

void testOverlay() {
  std::cout << "Testing AppConfig - overlay...\n";

  json config = {
      {"generation", {{"api_key", "sk-test"}, {"max_tokens", 2000}}},
      {"execution",
       {{"timeout_seconds", 30},
        {"network_isolation", "off"},
        {"work_root", "/var/tmp"}}},
      {"server", {{"workers", 8}, {"debug", true}}},
      {"logging", {{"level", "DEBUG"}, {"database", {{"port", 6543}}}}}};

  AppSettings settings = AppConfig::parseSettings(config, AppSettings{});
  assert(settings.generation.api_key == "sk-test");
  assert(settings.generation.max_tokens == 2000);
  assert(settings.generation.model == GenerationSettings{}.model);
  assert(settings.execution.timeout_seconds == 30);
  assert(settings.execution.network_isolation == IsolationMode::OFF);
  assert(settings.execution.work_root == "/var/tmp");
  assert(settings.server.workers == 8);
  assert(settings.server.debug);
  assert(settings.logging.level == "DEBUG");
  assert(settings.logging.database.port == "6543");

  std::cout << "✓ AppConfig overlay test passed\n";
}

void testExecutionLimits() {
  std::cout << "Testing AppConfig - execution limits...\n";

  bool threw = false;
  try {
    AppConfig::parseSettings({{"execution", {{"timeout_seconds", 0}}}},
                             AppSettings{});
  } catch (const std::invalid_argument &e) {
    threw = true;
    assert(std::string(e.what()).find("execution.timeout_seconds") !=
           std::string::npos);
  }
  assert(threw && "timeout below minimum must be rejected");

  threw = false;
  try {
    AppConfig::parseSettings({{"execution", {{"memory_limit_mb", 1}}}},
                             AppSettings{});
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw && "memory limit below minimum must be rejected");

  threw = false;
  try {
    AppConfig::parseSettings({{"server", {{"workers", 0}}}}, AppSettings{});
  } catch (const std::invalid_argument &e) {
    threw = true;
    assert(std::string(e.what()).find("server.workers") != std::string::npos);
  }
  assert(threw && "zero workers must be rejected");

  threw = false;
  try {
    AppConfig::parseSettings({{"execution", {{"python_executable", ""}}}},
                             AppSettings{});
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw && "empty interpreter must be rejected");

  std::cout << "✓ AppConfig execution limits test passed\n";
}

void testIsolationModeParsing() {
  std::cout << "Testing AppConfig - isolation modes...\n";

  const std::string key = "execution.network_isolation";
  assert(isolationModeFromString("OFF", key) == IsolationMode::OFF);
  assert(isolationModeFromString(" best-effort ", key) ==
         IsolationMode::BEST_EFFORT);
  assert(isolationModeFromString("required", key) == IsolationMode::REQUIRED);
  assert(isolationModeToString(IsolationMode::REQUIRED) == "required");

  bool threw = false;
  try {
    isolationModeFromString("sometimes", "execution.filesystem_isolation");
  } catch (const std::invalid_argument &e) {
    threw = true;
    assert(std::string(e.what()).find("execution.filesystem_isolation") !=
           std::string::npos);
  }
  assert(threw);

  AppSettings defaults = AppConfig::parseSettings(json::object(), AppSettings{});
  assert(defaults.execution.filesystem_isolation == IsolationMode::BEST_EFFORT);

  json config = {{"execution",
                  {{"filesystem_isolation", "required"},
                   {"network_isolation", "off"}}}};
  AppSettings parsed = AppConfig::parseSettings(config, AppSettings{});
  assert(parsed.execution.filesystem_isolation == IsolationMode::REQUIRED);
  assert(parsed.execution.network_isolation == IsolationMode::OFF);

  std::cout << "✓ AppConfig isolation modes test passed\n";
}

void testSetForTesting() {
  std::cout << "Testing AppConfig - setForTesting...\n";

  AppSettings settings;
  settings.generation.api_key = "key";
  AppConfig::setForTesting(settings);
  assert(AppConfig::isInitialized());
  assert(AppConfig::hasGenerationCredentials());

  settings.generation.api_key.clear();
  AppConfig::setForTesting(settings);
  assert(!AppConfig::hasGenerationCredentials());

  settings.execution.max_open_files = 1;
  bool threw = false;
  try {
    AppConfig::setForTesting(settings);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ AppConfig setForTesting test passed\n";
}

int main() {
  try {
    testDefaults();
    testOverlay();
    testExecutionLimits();
    testIsolationModeParsing();
    testSetForTesting();
    std::cout << "\n✅ All AppConfig tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
