#ifndef RUNNER_SCRIPT_H
#define RUNNER_SCRIPT_H

#include <string>

// Channel descriptors inside the isolate.
constexpr int SANDBOX_TO_HOST_FD = 3;
constexpr int SANDBOX_FROM_HOST_FD = 4;

// Python program passed to the interpreter with -c. It reads the start
// message from fd 4, injects paradigm_client and attached_file_ids, runs
// execute_workflow(user_input) in a fresh namespace and reports exactly one
// result line on fd 3. Capability calls travel as call/reply lines on the
// same pair of descriptors. A start message with "compile_only" set only
// compiles the code and reports "" or "line N: <message>" as the value.
const std::string &sandboxHarnessSource();

#endif
