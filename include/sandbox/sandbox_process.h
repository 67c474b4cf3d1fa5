#ifndef SANDBOX_PROCESS_H
#define SANDBOX_PROCESS_H

#include "core/app_config.h"
#include "sandbox/capability_broker.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct SandboxRequest {
  std::string code;
  std::string user_input;
  std::optional<std::vector<std::string>> attached_file_ids;
  std::chrono::seconds timeout{300};
  // Compile the code without running it; the outcome value is "" or
  // "line N: <message>".
  bool compile_only = false;
};

enum class SandboxOutcomeKind { COMPLETED, FAILED, TIMED_OUT };

struct SandboxOutcome {
  SandboxOutcomeKind kind = SandboxOutcomeKind::FAILED;
  std::string value;
  std::string error;
  // Captured stdout/stderr of the isolate, bounded by max_output_bytes.
  std::string output;
  bool outputTruncated = false;
  double elapsedSeconds = 0.0;
  // True when the program ran in private namespaces with the minimal
  // file system view.
  bool filesystemIsolated = false;
};

// What the configured interpreter reports about itself. The installation
// prefixes are the only host directories besides the system ones that an
// isolated program can see.
struct InterpreterInfo {
  std::string executable;
  std::vector<std::string> prefixes;
};

// Runs one program in a disposable child process. Each call forks a fresh
// interpreter in its own process group with a private work directory, a
// scrubbed environment and resource limits; the process is killed and reaped
// before run() returns, whatever the outcome. With filesystem_isolation the
// program also runs in private user, mount and pid namespaces and sees only a
// read-only view of the system and interpreter directories plus /work.
class SandboxProcess {
  ExecutionSettings settings_;
  CapabilityBroker *broker_;

public:
  // `broker` may be null, in which case every capability call is refused.
  SandboxProcess(const ExecutionSettings &settings, CapabilityBroker *broker);

  // Throws SandboxError when the isolate cannot be started, including when
  // filesystem_isolation is required but unavailable. Failures of the
  // program itself are reported through the outcome.
  SandboxOutcome run(const SandboxRequest &request);

  // Absolute path of `executable`, searched on PATH when it has no slash.
  // Empty when nothing executable is found.
  static std::string resolveInterpreter(const std::string &executable);

  // Asks the interpreter for its real executable and prefixes. Cached per
  // path. Throws SandboxError when it cannot be queried.
  static InterpreterInfo describeInterpreter(const std::string &executable);

  // Whether the namespaces and mounts behind filesystem_isolation can be set
  // up for these settings. Checked once per interpreter, work root and
  // network mode.
  static bool filesystemIsolationAvailable(const ExecutionSettings &settings);

  static std::string describeExitStatus(int status);
  static void ignoreSigpipe();

  // Marks the host process non-dumpable so no other process running as the
  // same user, isolates included, can read its /proc entries (environment,
  // memory, descriptors). Returns false if the kernel refused.
  static bool protectHost();
};

#endif
