#include "core/errors.h"
#include "sandbox/sandbox_process.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Starts real python3 isolates. The secret test re-runs this binary with a
// credential in its own environment, the way the service holds its API keys,
// and checks that the workflow cannot find it anywhere under /proc.
namespace {
const std::string SECRET_VARIABLE = "FLOWFORGE_HOST_SECRET";
const std::string SECRET_VALUE = "sk-host-secret-4242";
const std::string CHILD_FLAG = "--run-secret-scan";

const std::string SECRET_SCAN_PROGRAM = R"(import asyncio
import os


async def execute_workflow(user_input):
    marker = b"FLOWFORGE_HOST_SECRET"
    paths = ["/proc/%d/environ" % os.getppid(), "/proc/self/environ"]
    try:
        paths += ["/proc/%s/environ" % p for p in os.listdir("/proc") if p.isdigit()]
    except OSError:
        pass
    leaks = []
    for path in paths:
        try:
            with open(path, "rb") as handle:
                if marker in handle.read():
                    leaks.append(path)
        except OSError:
            pass
    if marker.decode() in os.environ:
        leaks.append("os.environ")
    return "leaked: " + ",".join(leaks) if leaks else "hidden"
)";

const std::string VIEW_PROGRAM = R"(import asyncio
import os


async def execute_workflow(user_input):
    with open("note.txt", "w") as handle:
        handle.write("ok")
    try:
        open("/usr/flowforge_write_test", "w").close()
        usr_writable = True
    except OSError:
        usr_writable = False
    return " ".join([
        "marker=%s" % os.path.exists(user_input),
        "passwd=%s" % os.path.exists("/etc/passwd"),
        "cwd=%s" % os.getcwd(),
        "home=%s" % os.environ.get("HOME"),
        "note=%s" % open("note.txt").read(),
        "usr_writable=%s" % usr_writable,
    ])
)";

ExecutionSettings isolationSettings(IsolationMode filesystem) {
  ExecutionSettings settings;
  settings.timeout_seconds = 30;
  settings.network_isolation = IsolationMode::OFF;
  settings.filesystem_isolation = filesystem;
  settings.max_output_bytes = 4096;
  return settings;
}

// Runs inside the re-executed binary: exit 0 when the isolate saw nothing.
int runSecretScan(const std::string &mode) {
  const char *secret = std::getenv(SECRET_VARIABLE.c_str());
  if (!secret || SECRET_VALUE != secret) {
    std::cerr << "secret missing from the host environment\n";
    return 2;
  }

  ExecutionSettings settings = isolationSettings(
      isolationModeFromString(mode, "execution.filesystem_isolation"));
  SandboxProcess sandbox(settings, nullptr);
  SandboxRequest request;
  request.code = SECRET_SCAN_PROGRAM;
  request.timeout = std::chrono::seconds(settings.timeout_seconds);

  SandboxOutcome outcome = sandbox.run(request);
  if (outcome.kind != SandboxOutcomeKind::COMPLETED) {
    std::cerr << "isolate failed: " << outcome.error << "\n";
    return 3;
  }
  if (outcome.value != "hidden") {
    std::cerr << "isolate found the secret: " << outcome.value << "\n";
    return 1;
  }
  return 0;
}

int rerunWithSecret(const std::string &mode) {
  std::string self = fs::read_symlink("/proc/self/exe").string();
  std::string command = SECRET_VARIABLE + "=" + SECRET_VALUE + " '" + self +
                        "' " + CHILD_FLAG + " " + mode;
  int status = std::system(command.c_str());
  assert(status != -1);
  return WIFEXITED(status) ? WEXITSTATUS(status) : 128;
}
} // namespace

void testHostSecretHidden() {
  std::cout << "Testing SandboxProcess - host secrets stay out of reach...\n";

  assert(std::getenv(SECRET_VARIABLE.c_str()) == nullptr);
  assert(rerunWithSecret("off") == 0);
  assert(rerunWithSecret("best_effort") == 0);

  std::cout << "✓ SandboxProcess host secret test passed\n";
}

void testHostIsNotDumpable() {
  std::cout << "Testing SandboxProcess - host process protection...\n";

  SandboxProcess sandbox(isolationSettings(IsolationMode::OFF), nullptr);
  assert(prctl(PR_GET_DUMPABLE, 0, 0, 0, 0) == 0);
  assert(SandboxProcess::protectHost());

  std::cout << "✓ SandboxProcess host process protection test passed\n";
}

void testPrivateFileSystemView() {
  std::cout << "Testing SandboxProcess - private file system view...\n";

  ExecutionSettings settings = isolationSettings(IsolationMode::BEST_EFFORT);
  if (!SandboxProcess::filesystemIsolationAvailable(settings)) {
    std::cout << "  namespaces unavailable here, checking required mode\n";
    settings.filesystem_isolation = IsolationMode::REQUIRED;
    SandboxProcess sandbox(settings, nullptr);
    SandboxRequest request;
    request.code = VIEW_PROGRAM;
    bool threw = false;
    try {
      sandbox.run(request);
    } catch (const SandboxError &e) {
      threw = true;
      assert(std::string(e.what()).find("required but unavailable") !=
             std::string::npos);
    }
    assert(threw);
    std::cout << "✓ SandboxProcess private file system view test passed\n";
    return;
  }

  fs::path marker = fs::temp_directory_path() /
                    ("flowforge_isolation_marker_" + std::to_string(getpid()));
  std::ofstream(marker) << "host only";
  assert(fs::exists(marker));

  settings.filesystem_isolation = IsolationMode::REQUIRED;
  SandboxProcess sandbox(settings, nullptr);
  SandboxRequest request;
  request.code = VIEW_PROGRAM;
  request.user_input = marker.string();
  request.timeout = std::chrono::seconds(settings.timeout_seconds);

  SandboxOutcome outcome = sandbox.run(request);
  fs::remove(marker);
  if (outcome.kind != SandboxOutcomeKind::COMPLETED) {
    std::cerr << outcome.error << "\n" << outcome.output << "\n";
  }
  assert(outcome.kind == SandboxOutcomeKind::COMPLETED);
  assert(outcome.filesystemIsolated);
  assert(outcome.value == "marker=False passwd=False cwd=/work home=/work "
                          "note=ok usr_writable=False");

  std::cout << "✓ SandboxProcess private file system view test passed\n";
}

void testUnisolatedRunSeesHost() {
  std::cout << "Testing SandboxProcess - isolation switched off...\n";

  SandboxProcess sandbox(isolationSettings(IsolationMode::OFF), nullptr);
  SandboxRequest request;
  request.code = "import asyncio\n\n\nasync def execute_workflow(x):\n"
                 "    import os\n    return str(os.path.exists('/etc'))\n";
  SandboxOutcome outcome = sandbox.run(request);
  assert(outcome.kind == SandboxOutcomeKind::COMPLETED);
  assert(!outcome.filesystemIsolated);
  assert(outcome.value == "True");

  std::cout << "✓ SandboxProcess isolation switched off test passed\n";
}

int main(int argc, char **argv) {
  if (argc == 3 && argv[1] == CHILD_FLAG) {
    try {
      return runSecretScan(argv[2]);
    } catch (const std::exception &e) {
      std::cerr << "secret scan failed: " << e.what() << "\n";
      return 4;
    }
  }

  try {
    testHostSecretHidden();
    testHostIsNotDumpable();
    testPrivateFileSystemView();
    testUnisolatedRunSeesHost();
    std::cout << "\n✅ All SandboxProcess isolation tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
