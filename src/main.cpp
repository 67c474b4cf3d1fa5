#include "clients/generation_service.h"
#include "clients/paradigm_client.h"
#include "core/app_config.h"
#include "core/logger.h"
#include "sandbox/capability_broker.h"
#include "sandbox/python_syntax_checker.h"
#include "sandbox/sandbox_process.h"
#include "service/request_dispatcher.h"
#include "service/worker_pool.h"
#include "service/workflow_service.h"
#include "workflow/workflow_executor.h"
#include "workflow/workflow_generator.h"
#include "workflow/workflow_store.h"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <poll.h>
#include <unistd.h>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

constexpr int STDIN_POLL_INTERVAL_MS = 200;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Logger shutdown failed: " << e.what() << std::endl;
  }
}

class ResponseWriter {
  std::mutex mutex_;

public:
  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << '\n' << std::flush;
  }
};

// Reads stdin in chunks, handing complete lines to `onLine`. Returns on EOF
// or once a shutdown signal arrives. Throws std::runtime_error on read
// failures.
template <typename OnLine> void readRequests(OnLine onLine) {
  std::string pending;
  char buffer[8192];

  while (!g_shutdownRequested.load()) {
    struct pollfd pfd {};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, STDIN_POLL_INTERVAL_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error("poll on stdin failed: " +
                               std::string(std::strerror(errno)));
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw std::runtime_error("read from stdin failed: " +
                               std::string(std::strerror(errno)));
    }
    if (n == 0) {
      break;
    }

    pending.append(buffer, static_cast<size_t>(n));
    size_t start = 0;
    size_t newline;
    while ((newline = pending.find('\n', start)) != std::string::npos) {
      onLine(pending.substr(start, newline - start));
      start = newline + 1;
    }
    pending.erase(0, start);
  }

  if (!g_shutdownRequested.load() && !pending.empty()) {
    onLine(pending);
  }
}
} // namespace

int main(int argc, char *argv[]) {
  const std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    AppSettings settings;
    try {
      AppConfig::loadFromFile(configPath);
      settings = AppConfig::getSettings();
    } catch (const std::invalid_argument &e) {
      std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize(settings.logging);
    SandboxProcess::ignoreSigpipe();
    if (!SandboxProcess::protectHost()) {
      Logger::warning(LogCategory::SYSTEM, "main",
                      "Could not mark the process non-dumpable: " +
                          std::string(std::strerror(errno)));
    }

    if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main", "FlowForge started");

    WorkflowStore store;
    std::shared_ptr<IGenerationService> generationService;
    std::shared_ptr<ICapabilityProvider> capabilityProvider;
    try {
      if (!settings.generation.api_key.empty()) {
        generationService =
            std::make_shared<AnthropicGenerationService>(settings.generation);
      } else {
        Logger::warning(LogCategory::SYSTEM, "main",
                        "No generation API key configured; workflow "
                        "generation is unavailable");
      }

      if (!settings.paradigm.api_key.empty()) {
        capabilityProvider =
            std::make_shared<ParadigmClient>(settings.paradigm);
      } else {
        Logger::warning(LogCategory::SYSTEM, "main",
                        "No Paradigm API key configured; capability calls "
                        "from workflows will be refused");
      }
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Initialization failed: " + std::string(e.what()));
      std::cerr << "Initialization error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_INIT_ERROR;
    }

    auto broker = std::make_shared<CapabilityBroker>(capabilityProvider);
    WorkflowGenerator generator(
        store, generationService,
        std::make_shared<PythonSyntaxChecker>(settings.execution));
    WorkflowExecutor executor(store, settings.execution, broker);
    WorkerPool pool(settings.server.workers);
    WorkflowService service(store, generator, executor, pool);
    RequestDispatcher dispatcher(service, settings.server.debug);
    ResponseWriter writer;

    Logger::info(LogCategory::SYSTEM, "main",
                 "Serving requests on stdin with " +
                     std::to_string(pool.totalWorkers()) + " workers");

    try {
      readRequests([&](const std::string &line) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
          return;
        }
        pool.post("request", [&dispatcher, &writer, line] {
          writer.write(dispatcher.handleLine(line));
        });
      });
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Request loop failed: " + std::string(e.what()));
      pool.shutdown();
      cleanupLogger();
      return EXIT_EXECUTION_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 g_shutdownRequested.load()
                     ? "Shutdown requested, draining pending requests"
                     : "Input closed, draining pending requests");
    pool.shutdown();

    Logger::info(LogCategory::SYSTEM, "main", "FlowForge stopped");
    cleanupLogger();
    return EXIT_SUCCESS_CODE;

  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  }
}
