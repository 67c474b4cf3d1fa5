#include "sandbox/sandbox_process.h"
#include "core/errors.h"
#include "core/logger.h"
#include "sandbox/runner_script.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <linux/capability.h>
#include <linux/securebits.h>
#include <map>
#include <memory>
#include <mutex>
#include <poll.h>
#include <sched.h>
#include <set>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statfs.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr size_t MAX_CHANNEL_MESSAGE = 64 * 1024 * 1024;
constexpr size_t OUTPUT_EXCERPT = 1000;
constexpr int EXIT_SETUP_FAILED = 126;
constexpr int EXIT_EXEC_FAILED = 127;
constexpr int FIRST_HIGH_FD = 10;
constexpr long MAX_FD_TO_CLOSE = 65536;
constexpr auto ISOLATION_CHECK_TIMEOUT = std::chrono::seconds(15);

// Paths inside the private root.
constexpr const char *SANDBOX_WORK_DIR = "/work";
constexpr const char *OLD_ROOT_DIR = "/.old";

constexpr const char *SYSTEM_DIRECTORIES[] = {
    "/usr", "/bin", "/sbin", "/lib", "/lib64", "/lib32", "/libx32"};
constexpr const char *DEVICE_FILES[] = {"/dev/null", "/dev/zero",
                                        "/dev/urandom"};

constexpr const char *INTERPRETER_QUERY =
    "import sys,json;print(json.dumps([sys.executable,sys.prefix,"
    "sys.base_prefix,sys.exec_prefix,sys.base_exec_prefix]))";

class FileDescriptor {
  int fd_;

public:
  explicit FileDescriptor(int fd = -1) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(FileDescriptor &&other) noexcept : fd_(other.release()) {}
  FileDescriptor &operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  int get() const noexcept { return fd_; }
  int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }
  bool is_valid() const noexcept { return fd_ >= 0; }
};

struct Pipe {
  FileDescriptor read;
  FileDescriptor write;
};

Pipe makePipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    throw SandboxError(std::string("pipe2 failed: ") + std::strerror(errno));
  }
  return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw SandboxError(std::string("fcntl failed: ") + std::strerror(errno));
  }
}

// Private directory per run: `work/` is the program's working directory and
// `root/` the mount point of its private file system view.
class WorkDirectory {
  std::string path_;

public:
  explicit WorkDirectory(const std::string &root) {
    std::string pattern = root;
    while (pattern.size() > 1 && pattern.back() == '/') {
      pattern.pop_back();
    }
    pattern += "/flowforge-XXXXXX";

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
      throw SandboxError("Failed to create work directory under " + root +
                         ": " + std::strerror(errno));
    }
    path_ = buffer.data();

    if (mkdir(workPath().c_str(), 0700) != 0 ||
        mkdir(rootPath().c_str(), 0700) != 0) {
      std::string reason = std::strerror(errno);
      removeTree();
      throw SandboxError("Failed to prepare work directory " + path_ + ": " +
                         reason);
    }
  }

  ~WorkDirectory() { removeTree(); }

  WorkDirectory(const WorkDirectory &) = delete;
  WorkDirectory &operator=(const WorkDirectory &) = delete;

  const std::string &path() const { return path_; }
  std::string workPath() const { return path_ + "/work"; }
  std::string rootPath() const { return path_ + "/root"; }

private:
  void removeTree() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      Logger::warning(LogCategory::SANDBOX, "WorkDirectory",
                      "Failed to remove " + path_ + ": " + ec.message());
    }
  }
};

// Owns the child's pid: the process group is killed and the child reaped
// on every exit path, including exceptions.
class ChildGuard {
  pid_t pid_;
  bool reaped_ = false;
  int status_ = 0;

  void killGroup() {
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
  }

public:
  explicit ChildGuard(pid_t pid) : pid_(pid) {}
  ~ChildGuard() {
    if (!reaped_) {
      terminate();
    }
  }

  ChildGuard(const ChildGuard &) = delete;
  ChildGuard &operator=(const ChildGuard &) = delete;

  pid_t pid() const { return pid_; }

  int terminate() {
    if (reaped_) {
      return status_;
    }
    killGroup();
    while (waitpid(pid_, &status_, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
    return status_;
  }

  std::optional<int>
  waitUntil(std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
      pid_t r = waitpid(pid_, &status_, WNOHANG);
      if (r == pid_) {
        reaped_ = true;
        // Descendants still in the group keep its id alive.
        ::kill(-pid_, SIGKILL);
        return status_;
      }
      if (r < 0 && errno != EINTR) {
        reaped_ = true;
        return status_;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return std::nullopt;
  }
};

int remainingMs(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  if (left <= 0) {
    return 0;
  }
  return left > 60000 ? 60000 : static_cast<int>(left);
}

enum class WriteStatus { OK, CLOSED, TIMEOUT };

WriteStatus writeLine(int fd, const std::string &payload,
                      std::chrono::steady_clock::time_point deadline) {
  std::string data = payload;
  data += '\n';
  size_t offset = 0;

  while (offset < data.size()) {
    ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int wait = remainingMs(deadline);
      if (wait <= 0) {
        return WriteStatus::TIMEOUT;
      }
      pollfd pfd{fd, POLLOUT, 0};
      int ready = ::poll(&pfd, 1, wait);
      if (ready > 0 && (pfd.revents & (POLLERR | POLLHUP))) {
        return WriteStatus::CLOSED;
      }
      continue;
    }
    return WriteStatus::CLOSED;
  }
  return WriteStatus::OK;
}

struct ChildBind {
  const char *source;
  const char *target;
  bool writable;
  bool device;
};

struct ChildPlan {
  const char *interpreter;
  char *const *argv;
  char *const *envp;
  const char *workDir;
  int devNull;
  int outputWrite;
  int toHostWrite;
  int fromHostRead;
  pid_t parentPid;
  IsolationMode network;
  bool dropCapabilities;
  rlim_t addressSpace;
  rlim_t cpuSeconds;
  rlim_t fileSize;
  rlim_t openFiles;

  // Private root; unused when privateRoot is false.
  bool privateRoot = false;
  const char *uidMap = nullptr;
  const char *gidMap = nullptr;
  const char *rootDir = nullptr;
  const char *tmpDir = nullptr;
  const char *procDir = nullptr;
  const char *oldRootDir = nullptr;
  const char *const *directories = nullptr;
  size_t directoryCount = 0;
  const char *const *files = nullptr;
  size_t fileCount = 0;
  const ChildBind *binds = nullptr;
  size_t bindCount = 0;
};

// Only async-signal-safe calls from here on: the parent may be multithreaded.
[[noreturn]] void childFail(const char *message, int code) {
  const char prefix[] = "sandbox: ";
  ssize_t ignored = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
  ignored = ::write(STDERR_FILENO, message, std::strlen(message));
  ignored = ::write(STDERR_FILENO, "\n", 1);
  (void)ignored;
  _exit(code);
}

bool lowerLimit(int resource, rlim_t value) {
  struct rlimit current;
  if (getrlimit(resource, &current) != 0) {
    return false;
  }
  if (current.rlim_max != RLIM_INFINITY && value > current.rlim_max) {
    value = current.rlim_max;
  }
  struct rlimit limit;
  limit.rlim_cur = value;
  limit.rlim_max = value;
  return setrlimit(resource, &limit) == 0;
}

bool writeProcFile(const char *path, const char *content) {
  int fd = ::open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  size_t length = std::strlen(content);
  ssize_t n = ::write(fd, content, length);
  ::close(fd);
  return n == static_cast<ssize_t>(length);
}

// Flags a bind remount inside a user namespace must keep: the kernel locks
// them on mounts inherited from the parent namespace.
unsigned long lockedMountFlags(const char *path) {
  struct statfs fs;
  if (statfs(path, &fs) != 0) {
    return 0;
  }
  unsigned long flags = 0;
  if (fs.f_flags & ST_RDONLY) {
    flags |= MS_RDONLY;
  }
  if (fs.f_flags & ST_NOSUID) {
    flags |= MS_NOSUID;
  }
  if (fs.f_flags & ST_NODEV) {
    flags |= MS_NODEV;
  }
  if (fs.f_flags & ST_NOEXEC) {
    flags |= MS_NOEXEC;
  }
  if (fs.f_flags & ST_NOATIME) {
    flags |= MS_NOATIME;
  }
  if (fs.f_flags & ST_NODIRATIME) {
    flags |= MS_NODIRATIME;
  }
  if (fs.f_flags & ST_RELATIME) {
    flags |= MS_RELATIME;
  }
  return flags;
}

bool bindMount(const ChildBind &bind) {
  if (mount(bind.source, bind.target, nullptr, MS_BIND | MS_REC, nullptr) !=
      0) {
    return false;
  }
  unsigned long flags =
      MS_BIND | MS_REMOUNT | MS_NOSUID | lockedMountFlags(bind.target);
  if (!bind.device) {
    flags |= MS_NODEV;
  }
  if (!bind.writable) {
    flags |= MS_RDONLY;
  }
  return mount(nullptr, bind.target, nullptr, flags, nullptr) == 0;
}

bool dropAllCapabilities() {
  if (prctl(PR_SET_SECUREBITS,
            SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_SETUID_FIXUP |
                SECBIT_NO_SETUID_FIXUP_LOCKED,
            0, 0, 0) != 0) {
    return false;
  }
  for (int cap = 0; prctl(PR_CAPBSET_READ, cap, 0, 0, 0) >= 0; ++cap) {
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0) {
      return false;
    }
  }
  // Kernels without ambient capabilities have nothing to clear.
  if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) != 0 &&
      errno != EINVAL) {
    return false;
  }
  struct __user_cap_header_struct header;
  header.version = _LINUX_CAPABILITY_VERSION_3;
  header.pid = 0;
  struct __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3];
  std::memset(data, 0, sizeof(data));
  return syscall(SYS_capset, &header, data) == 0;
}

// Waits for the namespace's init process and exits the same way.
[[noreturn]] void relayExit(pid_t inner) {
  for (int fd = STDIN_FILENO; fd <= SANDBOX_FROM_HOST_FD; ++fd) {
    ::close(fd);
  }
  int status = 0;
  while (waitpid(inner, &status, 0) < 0) {
    if (errno != EINTR) {
      _exit(EXIT_SETUP_FAILED);
    }
  }
  if (WIFEXITED(status)) {
    _exit(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    signal(sig, SIG_DFL);
    ::kill(getpid(), sig);
  }
  _exit(EXIT_SETUP_FAILED);
}

// Moves the child into fresh user, mount, pid, ipc and uts namespaces (and a
// network namespace unless networking is allowed) and builds a read-only root
// holding only the system directories, the interpreter prefixes, three device
// nodes, a writable /work and an empty /tmp. Returns in the namespace's init
// process after pivot_root; the original child only relays its exit.
void enterPrivateRoot(const ChildPlan &plan) {
  int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC |
              CLONE_NEWUTS;
  if (plan.network != IsolationMode::OFF) {
    flags |= CLONE_NEWNET;
  }

  // The id maps are only writable while the process is dumpable.
  prctl(PR_SET_DUMPABLE, 1, 0, 0, 0);
  if (unshare(flags) != 0) {
    childFail("namespace setup failed", EXIT_SETUP_FAILED);
  }
  if (!writeProcFile("/proc/self/setgroups", "deny") && errno != ENOENT) {
    childFail("setgroups deny failed", EXIT_SETUP_FAILED);
  }
  if (!writeProcFile("/proc/self/gid_map", plan.gidMap) ||
      !writeProcFile("/proc/self/uid_map", plan.uidMap)) {
    childFail("id map setup failed", EXIT_SETUP_FAILED);
  }
  prctl(PR_SET_DUMPABLE, 0, 0, 0, 0);

  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
    childFail("making mounts private failed", EXIT_SETUP_FAILED);
  }
  if (mount("tmpfs", plan.rootDir, "tmpfs", MS_NOSUID | MS_NODEV,
            "size=16m,mode=0755") != 0) {
    childFail("root tmpfs mount failed", EXIT_SETUP_FAILED);
  }
  for (size_t i = 0; i < plan.directoryCount; ++i) {
    if (mkdir(plan.directories[i], 0755) != 0 && errno != EEXIST) {
      childFail("creating mount point failed", EXIT_SETUP_FAILED);
    }
  }
  for (size_t i = 0; i < plan.fileCount; ++i) {
    int fd = ::open(plan.files[i], O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      childFail("creating device mount point failed", EXIT_SETUP_FAILED);
    }
    ::close(fd);
  }
  for (size_t i = 0; i < plan.bindCount; ++i) {
    if (!bindMount(plan.binds[i])) {
      childFail("bind mount failed", EXIT_SETUP_FAILED);
    }
  }
  if (mount("tmpfs", plan.tmpDir, "tmpfs", MS_NOSUID | MS_NODEV,
            "size=16m,mode=1777") != 0) {
    childFail("tmp mount failed", EXIT_SETUP_FAILED);
  }
  if (mount(nullptr, plan.rootDir, nullptr,
            MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) != 0) {
    childFail("read-only root remount failed", EXIT_SETUP_FAILED);
  }

  pid_t inner = fork();
  if (inner < 0) {
    childFail("fork into pid namespace failed", EXIT_SETUP_FAILED);
  }
  if (inner > 0) {
    relayExit(inner);
  }

  prctl(PR_SET_PDEATHSIG, SIGKILL);
  // Without a proc mount the program still runs; it just sees no /proc.
  mount("proc", plan.procDir, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
        nullptr);
  if (syscall(SYS_pivot_root, plan.rootDir, plan.oldRootDir) != 0) {
    childFail("pivot_root failed", EXIT_SETUP_FAILED);
  }
  if (chdir("/") != 0 || umount2(OLD_ROOT_DIR, MNT_DETACH) != 0) {
    childFail("detaching host root failed", EXIT_SETUP_FAILED);
  }
}

[[noreturn]] void runChild(const ChildPlan &plan) {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  signal(SIGPIPE, SIG_DFL);

  if (setsid() < 0) {
    childFail("setsid failed", EXIT_SETUP_FAILED);
  }
  prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (getppid() != plan.parentPid) {
    _exit(EXIT_SETUP_FAILED);
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    childFail("PR_SET_NO_NEW_PRIVS failed", EXIT_SETUP_FAILED);
  }

  // Lift the kept descriptors out of the 0..4 range before dup2 so that no
  // target overwrites a source that is still needed.
  int highNull = fcntl(plan.devNull, F_DUPFD, FIRST_HIGH_FD);
  int highOutput = fcntl(plan.outputWrite, F_DUPFD, FIRST_HIGH_FD);
  int highToHost = fcntl(plan.toHostWrite, F_DUPFD, FIRST_HIGH_FD);
  int highFromHost = fcntl(plan.fromHostRead, F_DUPFD, FIRST_HIGH_FD);
  if (highNull < 0 || highOutput < 0 || highToHost < 0 || highFromHost < 0) {
    childFail("descriptor setup failed", EXIT_SETUP_FAILED);
  }
  if (dup2(highNull, STDIN_FILENO) < 0 ||
      dup2(highOutput, STDOUT_FILENO) < 0 ||
      dup2(highOutput, STDERR_FILENO) < 0 ||
      dup2(highToHost, SANDBOX_TO_HOST_FD) < 0 ||
      dup2(highFromHost, SANDBOX_FROM_HOST_FD) < 0) {
    childFail("descriptor setup failed", EXIT_SETUP_FAILED);
  }

  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0 || maxFd > MAX_FD_TO_CLOSE) {
    maxFd = MAX_FD_TO_CLOSE;
  }
  for (int fd = SANDBOX_FROM_HOST_FD + 1; fd < maxFd; ++fd) {
    ::close(fd);
  }

  if (plan.privateRoot) {
    enterPrivateRoot(plan);
  } else if (plan.network != IsolationMode::OFF) {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0 &&
        plan.network == IsolationMode::REQUIRED) {
      childFail("network isolation unavailable", EXIT_SETUP_FAILED);
    }
  }

  if (!lowerLimit(RLIMIT_CORE, 0) ||
      !lowerLimit(RLIMIT_AS, plan.addressSpace) ||
      !lowerLimit(RLIMIT_CPU, plan.cpuSeconds) ||
      !lowerLimit(RLIMIT_FSIZE, plan.fileSize) ||
      !lowerLimit(RLIMIT_NOFILE, plan.openFiles)) {
    childFail("setrlimit failed", EXIT_SETUP_FAILED);
  }

  if (chdir(plan.workDir) != 0) {
    childFail("chdir to work directory failed", EXIT_SETUP_FAILED);
  }
  if (plan.dropCapabilities && !dropAllCapabilities()) {
    childFail("dropping capabilities failed", EXIT_SETUP_FAILED);
  }

  execve(plan.interpreter, plan.argv, plan.envp);
  childFail("exec of python interpreter failed", EXIT_EXEC_FAILED);
}

struct OutputCollector {
  std::string data;
  size_t limit;
  bool truncated = false;

  // Returns false at end of stream.
  bool drain(int fd) {
    char buffer[8192];
    while (true) {
      ssize_t n = ::read(fd, buffer, sizeof(buffer));
      if (n > 0) {
        size_t room = data.size() < limit ? limit - data.size() : 0;
        size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n)
                                                    : room;
        data.append(buffer, take);
        if (take < static_cast<size_t>(n)) {
          truncated = true;
        }
        continue;
      }
      if (n == 0) {
        return false;
      }
      if (errno == EINTR) {
        continue;
      }
      return errno == EAGAIN || errno == EWOULDBLOCK;
    }
  }
};

std::string tail(const std::string &text, size_t length) {
  return text.size() > length ? "..." + text.substr(text.size() - length)
                              : text;
}

std::string dumpJson(const json &value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string shellQuote(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  return quoted + "'";
}

bool isWithin(const std::string &path, const std::string &directory) {
  return path == directory ||
         (path.size() > directory.size() &&
          path.compare(0, directory.size(), directory) == 0 &&
          path[directory.size()] == '/');
}

// The host paths an isolated program sees, laid out under the run's root
// directory. Built in the parent; the child only walks the arrays.
class MountView {
  struct Bind {
    std::string source;
    std::string target;
    bool writable;
    bool device;
  };

  std::string rootDir_;
  std::vector<std::string> directories_;
  std::set<std::string> knownDirectories_;
  std::vector<std::string> files_;
  std::vector<Bind> binds_;
  std::vector<std::string> covered_;
  std::string tmpDir_;
  std::string procDir_;
  std::string oldRootDir_;

  std::vector<const char *> directoryPtrs_;
  std::vector<const char *> filePtrs_;
  std::vector<ChildBind> childBinds_;

  void addDirectory(const std::string &inside) {
    size_t position = 0;
    while (position != std::string::npos) {
      position = inside.find('/', position + 1);
      std::string prefix = inside.substr(0, position);
      if (knownDirectories_.insert(prefix).second) {
        directories_.push_back(rootDir_ + prefix);
      }
    }
  }

  void addBind(const std::string &source, const std::string &inside,
               bool writable, bool device) {
    if (device) {
      addDirectory(std::filesystem::path(inside).parent_path().string());
      files_.push_back(rootDir_ + inside);
    } else {
      addDirectory(inside);
    }
    binds_.push_back(Bind{source, rootDir_ + inside, writable, device});
  }

  bool isCovered(const std::string &path) const {
    for (const auto &directory : covered_) {
      if (isWithin(path, directory)) {
        return true;
      }
    }
    return false;
  }

public:
  MountView(const std::string &rootDir, const std::string &hostWorkDir,
            const InterpreterInfo &interpreter)
      : rootDir_(rootDir) {
    std::error_code ec;
    for (const char *directory : SYSTEM_DIRECTORIES) {
      if (!std::filesystem::is_directory(directory, ec)) {
        continue;
      }
      addBind(directory, directory, false, false);
      covered_.push_back(directory);
      auto canonical = std::filesystem::canonical(directory, ec);
      if (!ec) {
        covered_.push_back(canonical.string());
      }
    }

    for (const auto &prefix : interpreter.prefixes) {
      auto canonical = std::filesystem::canonical(prefix, ec);
      if (ec || !std::filesystem::is_directory(canonical, ec)) {
        continue;
      }
      std::string path = canonical.string();
      if (path == "/") {
        throw SandboxError("Interpreter prefix is the root directory");
      }
      if (!isCovered(path)) {
        addBind(path, path, false, false);
        covered_.push_back(path);
      }
    }

    for (const char *device : DEVICE_FILES) {
      if (std::filesystem::exists(device, ec)) {
        addBind(device, device, false, true);
      }
    }
    addBind(hostWorkDir, SANDBOX_WORK_DIR, true, false);

    addDirectory("/tmp");
    addDirectory("/proc");
    addDirectory(OLD_ROOT_DIR);
    tmpDir_ = rootDir_ + "/tmp";
    procDir_ = rootDir_ + "/proc";
    oldRootDir_ = rootDir_ + OLD_ROOT_DIR;

    // Pointers are taken only once every string is in place.
    for (const auto &directory : directories_) {
      directoryPtrs_.push_back(directory.c_str());
    }
    for (const auto &file : files_) {
      filePtrs_.push_back(file.c_str());
    }
    for (const auto &bind : binds_) {
      childBinds_.push_back(ChildBind{bind.source.c_str(), bind.target.c_str(),
                                      bind.writable, bind.device});
    }
  }

  MountView(const MountView &) = delete;
  MountView &operator=(const MountView &) = delete;

  void applyTo(ChildPlan &plan) const {
    plan.rootDir = rootDir_.c_str();
    plan.tmpDir = tmpDir_.c_str();
    plan.procDir = procDir_.c_str();
    plan.oldRootDir = oldRootDir_.c_str();
    plan.directories = directoryPtrs_.data();
    plan.directoryCount = directoryPtrs_.size();
    plan.files = filePtrs_.data();
    plan.fileCount = filePtrs_.size();
    plan.binds = childBinds_.data();
    plan.bindCount = childBinds_.size();
  }
};

// Everything the child needs, prepared before fork so the child allocates
// nothing.
class LaunchPlan {
  std::vector<std::string> args_;
  std::vector<std::string> env_;
  std::vector<char *> argv_;
  std::vector<char *> envp_;
  std::string workDir_;
  std::string uidMap_;
  std::string gidMap_;
  std::unique_ptr<MountView> view_;
  const ExecutionSettings &settings_;
  rlim_t cpuSeconds_;

public:
  LaunchPlan(const InterpreterInfo &interpreter, const std::string &script,
             const WorkDirectory &workDir, const ExecutionSettings &settings,
             std::chrono::seconds timeout, bool privateRoot)
      : settings_(settings),
        cpuSeconds_(static_cast<rlim_t>(timeout.count()) + 1) {
    workDir_ = privateRoot ? std::string(SANDBOX_WORK_DIR) : workDir.workPath();
    args_ = {interpreter.executable, "-I", "-B", "-c", script};
    env_ = {"PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + workDir_,
            "TMPDIR=" + workDir_,
            "LANG=C.UTF-8",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONIOENCODING=utf-8"};
    for (auto &arg : args_) {
      argv_.push_back(arg.data());
    }
    argv_.push_back(nullptr);
    for (auto &var : env_) {
      envp_.push_back(var.data());
    }
    envp_.push_back(nullptr);

    if (privateRoot) {
      uidMap_ = std::to_string(geteuid()) + " " + std::to_string(geteuid()) +
                " 1";
      gidMap_ = std::to_string(getegid()) + " " + std::to_string(getegid()) +
                " 1";
      view_ = std::make_unique<MountView>(workDir.rootPath(),
                                          workDir.workPath(), interpreter);
    }
  }

  LaunchPlan(const LaunchPlan &) = delete;
  LaunchPlan &operator=(const LaunchPlan &) = delete;

  ChildPlan childPlan(int devNull, int outputWrite, int toHostWrite,
                      int fromHostRead) const {
    ChildPlan plan;
    plan.interpreter = args_[0].c_str();
    plan.argv = argv_.data();
    plan.envp = envp_.data();
    plan.workDir = workDir_.c_str();
    plan.devNull = devNull;
    plan.outputWrite = outputWrite;
    plan.toHostWrite = toHostWrite;
    plan.fromHostRead = fromHostRead;
    plan.parentPid = getpid();
    plan.network = settings_.network_isolation;
    plan.dropCapabilities = geteuid() == 0;
    plan.addressSpace =
        static_cast<rlim_t>(settings_.memory_limit_mb) * 1024 * 1024;
    plan.cpuSeconds = cpuSeconds_;
    plan.fileSize =
        static_cast<rlim_t>(settings_.max_file_size_mb) * 1024 * 1024;
    plan.openFiles = static_cast<rlim_t>(settings_.max_open_files);
    if (view_) {
      plan.privateRoot = true;
      plan.uidMap = uidMap_.c_str();
      plan.gidMap = gidMap_.c_str();
      view_->applyTo(plan);
    }
    return plan;
  }
};

// Starts the interpreter in the private root with a trivial program.
bool privateRootWorks(const InterpreterInfo &interpreter,
                      const ExecutionSettings &settings) {
  WorkDirectory workDir(settings.work_root);
  LaunchPlan launch(interpreter, "pass", workDir, settings,
                    std::chrono::seconds(settings.timeout_seconds), true);
  FileDescriptor devNull(::open("/dev/null", O_RDWR | O_CLOEXEC));
  if (!devNull.is_valid()) {
    throw SandboxError(std::string("Failed to open /dev/null: ") +
                       std::strerror(errno));
  }
  ChildPlan plan = launch.childPlan(devNull.get(), devNull.get(),
                                    devNull.get(), devNull.get());

  pid_t pid = fork();
  if (pid < 0) {
    throw SandboxError(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    runChild(plan);
  }

  ChildGuard child(pid);
  auto status =
      child.waitUntil(std::chrono::steady_clock::now() + ISOLATION_CHECK_TIMEOUT);
  if (!status) {
    child.terminate();
    return false;
  }
  return WIFEXITED(*status) && WEXITSTATUS(*status) == 0;
}

} // namespace

SandboxProcess::SandboxProcess(const ExecutionSettings &settings,
                               CapabilityBroker *broker)
    : settings_(settings), broker_(broker) {
  ignoreSigpipe();
  static std::once_flag once;
  std::call_once(once, []() {
    if (!protectHost()) {
      Logger::warning(LogCategory::SANDBOX, "SandboxProcess",
                      "Could not mark the host process non-dumpable: " +
                          std::string(std::strerror(errno)));
    }
  });
}

void SandboxProcess::ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

bool SandboxProcess::protectHost() {
  return prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) == 0;
}

std::string SandboxProcess::resolveInterpreter(const std::string &executable) {
  if (executable.empty()) {
    return "";
  }
  if (executable.find('/') != std::string::npos) {
    return access(executable.c_str(), X_OK) == 0 ? executable : "";
  }

  const char *pathEnv = std::getenv("PATH");
  std::string path = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    std::string dir = path.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    if (!dir.empty()) {
      std::string candidate = dir + "/" + executable;
      if (access(candidate.c_str(), X_OK) == 0) {
        return candidate;
      }
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return "";
}

InterpreterInfo
SandboxProcess::describeInterpreter(const std::string &executable) {
  std::string path = resolveInterpreter(executable);
  if (path.empty()) {
    throw SandboxError("Python interpreter not found: " + executable);
  }

  static std::mutex cacheMutex;
  static std::map<std::string, InterpreterInfo> cache;
  std::lock_guard<std::mutex> lock(cacheMutex);
  auto cached = cache.find(path);
  if (cached != cache.end()) {
    return cached->second;
  }

  std::string command = shellQuote(path) + " -I -B -c " +
                        shellQuote(INTERPRETER_QUERY) + " 2>/dev/null";
  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    throw SandboxError("Failed to query interpreter " + path + ": " +
                       std::strerror(errno));
  }
  char buffer[512];
  std::string result;
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result += buffer;
  }
  int status = pclose(pipe);
  if (status != 0) {
    throw SandboxError("Interpreter " + path + " could not be queried (" +
                       describeExitStatus(status) + ")");
  }

  InterpreterInfo info;
  try {
    json reported = json::parse(StringUtils::trim(result));
    info.executable = reported.at(0).get<std::string>();
    for (size_t i = 1; i < reported.size(); ++i) {
      std::string prefix = reported[i].is_string()
                               ? reported[i].get<std::string>()
                               : std::string();
      if (!prefix.empty() &&
          std::find(info.prefixes.begin(), info.prefixes.end(), prefix) ==
              info.prefixes.end()) {
        info.prefixes.push_back(prefix);
      }
    }
  } catch (const json::exception &e) {
    throw SandboxError("Interpreter " + path +
                       " reported unusable paths: " + e.what());
  }
  if (info.executable.empty() || info.executable.front() != '/') {
    throw SandboxError("Interpreter " + path +
                       " did not report an absolute executable path");
  }

  Logger::debug(LogCategory::SANDBOX, "describeInterpreter",
                path + " runs " + info.executable);
  cache.emplace(path, info);
  return info;
}

bool SandboxProcess::filesystemIsolationAvailable(
    const ExecutionSettings &settings) {
  InterpreterInfo interpreter;
  try {
    interpreter = describeInterpreter(settings.python_executable);
  } catch (const SandboxError &e) {
    Logger::warning(LogCategory::SANDBOX, "filesystemIsolationAvailable",
                    e.what());
    return false;
  }

  static std::mutex cacheMutex;
  static std::map<std::string, bool> cache;
  std::string key = interpreter.executable + "\n" + settings.work_root + "\n" +
                    isolationModeToString(settings.network_isolation);
  std::lock_guard<std::mutex> lock(cacheMutex);
  auto cached = cache.find(key);
  if (cached != cache.end()) {
    return cached->second;
  }

  bool available = false;
  try {
    available = privateRootWorks(interpreter, settings);
  } catch (const SandboxError &e) {
    Logger::warning(LogCategory::SANDBOX, "filesystemIsolationAvailable",
                    e.what());
  }
  if (available) {
    Logger::info(LogCategory::SANDBOX, "filesystemIsolationAvailable",
                 "Workflows run in private namespaces with a read-only root");
  } else {
    Logger::warning(LogCategory::SANDBOX, "filesystemIsolationAvailable",
                    "Namespaces for filesystem isolation are unavailable; "
                    "workflows can see the host file system");
  }
  cache.emplace(key, available);
  return available;
}

std::string SandboxProcess::describeExitStatus(int status) {
  if (WIFEXITED(status)) {
    int code = WEXITSTATUS(status);
    if (code == EXIT_SETUP_FAILED) {
      return "sandbox setup failed";
    }
    if (code == EXIT_EXEC_FAILED) {
      return "interpreter could not be started";
    }
    return "exit status " + std::to_string(code);
  }
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    const char *name = strsignal(sig);
    return "killed by signal " + std::to_string(sig) +
           (name ? std::string(" (") + name + ")" : std::string());
  }
  return "unknown status " + std::to_string(status);
}

/// Runs the harness for one request.
///
/// The parent drives the exchange from a single poll loop bounded by the
/// request deadline: it sends the start message on fd 4, answers capability
/// calls through the broker, collects stdout/stderr, and stops at the first
/// of (a) a result line, (b) end of both streams, (c) the deadline. In every
/// case the whole process group is SIGKILLed and the child reaped before the
/// outcome is returned.
SandboxOutcome SandboxProcess::run(const SandboxRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + request.timeout;

  InterpreterInfo interpreter =
      describeInterpreter(settings_.python_executable);
  bool privateRoot = false;
  if (settings_.filesystem_isolation != IsolationMode::OFF) {
    privateRoot = filesystemIsolationAvailable(settings_);
    if (!privateRoot &&
        settings_.filesystem_isolation == IsolationMode::REQUIRED) {
      throw SandboxError(
          "Filesystem isolation is required but unavailable on this host");
    }
  }

  WorkDirectory workDir(settings_.work_root);
  LaunchPlan launch(interpreter, sandboxHarnessSource(), workDir, settings_,
                    request.timeout, privateRoot);
  Pipe toHost = makePipe();
  Pipe fromHost = makePipe();
  Pipe output = makePipe();
  FileDescriptor devNull(::open("/dev/null", O_RDWR | O_CLOEXEC));
  if (!devNull.is_valid()) {
    throw SandboxError(std::string("Failed to open /dev/null: ") +
                       std::strerror(errno));
  }

  ChildPlan plan = launch.childPlan(devNull.get(), output.write.get(),
                                    toHost.write.get(), fromHost.read.get());

  pid_t pid = fork();
  if (pid < 0) {
    throw SandboxError(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    runChild(plan);
  }

  ChildGuard child(pid);
  Logger::debug(LogCategory::SANDBOX, "run",
                "Started isolate pid " + std::to_string(pid) + " in " +
                    workDir.path());

  toHost.write.reset();
  fromHost.read.reset();
  output.write.reset();
  devNull.reset();
  setNonBlocking(toHost.read.get());
  setNonBlocking(output.read.get());
  setNonBlocking(fromHost.write.get());

  OutputCollector collected{std::string(), settings_.max_output_bytes};
  std::string channelBuffer;
  std::optional<json> result;
  std::string protocolError;
  bool channelEof = false;
  bool outputEof = false;
  bool timedOut = false;

  json start;
  start["code"] = request.code;
  start["user_input"] = request.user_input;
  start["attached_file_ids"] = request.attached_file_ids
                                   ? json(*request.attached_file_ids)
                                   : json(nullptr);
  if (request.compile_only) {
    start["compile_only"] = true;
  }
  if (writeLine(fromHost.write.get(), dumpJson(start), deadline) ==
      WriteStatus::TIMEOUT) {
    timedOut = true;
  }

  auto handleMessage = [&](const std::string &line) {
    json message;
    try {
      message = json::parse(line);
    } catch (const json::parse_error &e) {
      protocolError = "Malformed message from workflow process: " +
                      std::string(e.what());
      return;
    }

    std::string type = message.value("type", "");
    if (type == "result") {
      result = std::move(message);
      return;
    }
    if (type != "call") {
      protocolError = "Unexpected message from workflow process: " + type;
      return;
    }

    json reply;
    reply["id"] = message.contains("id") ? message["id"] : json(nullptr);
    std::string capability = message.value("capability", "");
    try {
      if (!broker_) {
        throw CapabilityError("capability not permitted: " + capability);
      }
      reply["value"] = broker_->handle(
          capability, message.contains("args") ? message["args"] : json::object(),
          deadline);
      reply["ok"] = true;
    } catch (const std::exception &e) {
      // Reported back to the program, which raises it as RuntimeError.
      reply["ok"] = false;
      reply["error"] = e.what();
      Logger::warning(LogCategory::SANDBOX, "run",
                      "Capability " + capability + " failed: " + e.what());
    }

    if (writeLine(fromHost.write.get(), dumpJson(reply), deadline) ==
        WriteStatus::TIMEOUT) {
      timedOut = true;
    }
  };

  while (!timedOut && !result && protocolError.empty() &&
         !(channelEof && outputEof)) {
    int wait = remainingMs(deadline);
    if (wait <= 0) {
      timedOut = true;
      break;
    }

    pollfd fds[2];
    nfds_t count = 0;
    int channelIndex = -1;
    int outputIndex = -1;
    if (!channelEof) {
      channelIndex = static_cast<int>(count);
      fds[count++] = pollfd{toHost.read.get(), POLLIN, 0};
    }
    if (!outputEof) {
      outputIndex = static_cast<int>(count);
      fds[count++] = pollfd{output.read.get(), POLLIN, 0};
    }

    int ready = ::poll(fds, count, wait);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw SandboxError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (ready == 0) {
      continue;
    }

    if (outputIndex >= 0 && fds[outputIndex].revents != 0) {
      outputEof = !collected.drain(output.read.get());
    }

    if (channelIndex >= 0 && fds[channelIndex].revents != 0) {
      char buffer[8192];
      while (true) {
        ssize_t n = ::read(toHost.read.get(), buffer, sizeof(buffer));
        if (n > 0) {
          channelBuffer.append(buffer, static_cast<size_t>(n));
          continue;
        }
        if (n == 0) {
          channelEof = true;
        } else if (errno == EINTR) {
          continue;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
          channelEof = true;
        }
        break;
      }

      size_t newline;
      while (!result && protocolError.empty() && !timedOut &&
             (newline = channelBuffer.find('\n')) != std::string::npos) {
        std::string line = channelBuffer.substr(0, newline);
        channelBuffer.erase(0, newline + 1);
        if (!line.empty()) {
          handleMessage(line);
        }
      }
      if (channelBuffer.size() > MAX_CHANNEL_MESSAGE) {
        protocolError = "Message from workflow process exceeds size limit";
      }
    }
  }

  int status = 0;
  if (timedOut || result || !protocolError.empty()) {
    status = child.terminate();
  } else if (auto reaped = child.waitUntil(deadline)) {
    status = *reaped;
  } else {
    timedOut = true;
    status = child.terminate();
  }
  if (!outputEof) {
    collected.drain(output.read.get());
  }

  SandboxOutcome outcome;
  outcome.filesystemIsolated = privateRoot;
  outcome.elapsedSeconds = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - started)
                               .count();
  outcome.output = collected.data;
  outcome.outputTruncated = collected.truncated;

  if (timedOut) {
    outcome.kind = SandboxOutcomeKind::TIMED_OUT;
    outcome.error = "Execution timed out after " +
                    std::to_string(request.timeout.count()) + " seconds";
  } else if (result) {
    const json &message = *result;
    if (message.value("ok", false)) {
      outcome.kind = SandboxOutcomeKind::COMPLETED;
      const json value =
          message.contains("value") ? message["value"] : json("");
      outcome.value = value.is_string() ? value.get<std::string>()
                                        : dumpJson(value);
    } else {
      outcome.kind = SandboxOutcomeKind::FAILED;
      outcome.error = message.contains("error") && message["error"].is_string()
                          ? message["error"].get<std::string>()
                          : std::string("Workflow raised an error");
    }
  } else if (!protocolError.empty()) {
    outcome.kind = SandboxOutcomeKind::FAILED;
    outcome.error = protocolError;
  } else {
    outcome.kind = SandboxOutcomeKind::FAILED;
    outcome.error = "Workflow process exited without a result (" +
                    describeExitStatus(status) + ")";
    if (!collected.data.empty()) {
      outcome.error += ": " + tail(collected.data, OUTPUT_EXCERPT);
    }
  }

  Logger::debug(LogCategory::SANDBOX, "run",
                "Isolate pid " + std::to_string(pid) + " finished after " +
                    std::to_string(outcome.elapsedSeconds) + "s");
  if (!outcome.output.empty()) {
    Logger::debug(LogCategory::SANDBOX, "run",
                  "Isolate output:\n" + tail(outcome.output, OUTPUT_EXCERPT));
  }
  return outcome;
}
