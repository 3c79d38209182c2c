#include "posix_worker_launcher.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gateway {
namespace {

constexpr long long kWritePollSliceMs = 50;

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

static bool IsExecutableFile(const std::string& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return ::access(path.c_str(), X_OK) == 0;
}

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

static int DecodeExitStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return -WTERMSIG(status);
  return -1;
}

class PosixWorkerProcess : public IWorkerProcess {
 public:
  PosixWorkerProcess(pid_t pid,
                     int stdin_fd,
                     int stdout_fd,
                     int stderr_fd,
                     WorkerCallbacks callbacks,
                     std::chrono::milliseconds grace)
      : pid_(pid),
        stdin_fd_(stdin_fd),
        stdout_fd_(stdout_fd),
        stderr_fd_(stderr_fd),
        callbacks_(std::move(callbacks)),
        grace_(grace) {
    monitor_ = std::thread([this] { MonitorLoop(); });
  }

  ~PosixWorkerProcess() override {
    RequestStop();
    {
      std::unique_lock<std::mutex> lock(exit_mu_);
      if (!exit_cv_.wait_for(lock, grace_, [&] { return exited_; })) {
        std::cout << "[worker] pid=" << pid_ << " did not exit within " << grace_.count() << "ms, killing\n";
        ::kill(pid_, SIGKILL);
      }
    }
    stop_ = true;
    if (!monitor_.joinable()) return;
    if (monitor_.get_id() == std::this_thread::get_id()) {
      monitor_.detach();
    } else {
      monitor_.join();
    }
  }

  int64_t pid() const override { return pid_; }

  bool Write(const std::string& data, std::chrono::milliseconds timeout, std::string* err) override {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::lock_guard<std::mutex> lock(write_mu_);
    size_t off = 0;
    std::string failure;
    while (off < data.size()) {
      if (stopping_) {
        failure = "worker is stopping";
        break;
      }
      if (stdin_fd_ < 0) {
        failure = "worker stdin is closed";
        break;
      }
      const ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
      if (n > 0) {
        off += static_cast<size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        failure = std::string("write to worker stdin failed: ") + std::strerror(errno);
        break;
      }
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) {
        failure = "timed out writing to worker stdin";
        break;
      }
      // Short slices so RequestStop() is noticed while the pipe stays full.
      pollfd pfd{stdin_fd_, POLLOUT, 0};
      ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, kWritePollSliceMs)));
    }
    if (failure.empty()) return true;
    if (off > 0) {
      std::cout << "[worker] pid=" << pid_ << " partial write (" << off << "/" << data.size()
                << " bytes), closing stdin\n";
      CloseFd(&stdin_fd_);
    }
    if (err) *err = failure;
    return false;
  }

  void RequestStop() override {
    stopping_ = true;
    if (running_) ::kill(pid_, SIGTERM);
    CloseInput();
  }

  bool IsRunning() const override { return running_; }

 private:
  void CloseInput() {
    std::lock_guard<std::mutex> lock(write_mu_);
    CloseFd(&stdin_fd_);
  }

  void MonitorLoop() {
    char buf[4096];
    while (!stop_ && (stdout_fd_ >= 0 || stderr_fd_ >= 0)) {
      pollfd fds[2];
      nfds_t n = 0;
      int* owners[2];
      WorkerStream streams[2];
      if (stdout_fd_ >= 0) {
        fds[n] = {stdout_fd_, POLLIN, 0};
        owners[n] = &stdout_fd_;
        streams[n] = WorkerStream::kStdout;
        n++;
      }
      if (stderr_fd_ >= 0) {
        fds[n] = {stderr_fd_, POLLIN, 0};
        owners[n] = &stderr_fd_;
        streams[n] = WorkerStream::kStderr;
        n++;
      }
      const int rc = ::poll(fds, n, 100);
      if (rc < 0) {
        if (errno == EINTR) continue;
        break;
      }
      if (rc == 0) continue;
      for (nfds_t i = 0; i < n; i++) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        const ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
        if (got > 0) {
          if (callbacks_.on_output) callbacks_.on_output(streams[i], std::string(buf, static_cast<size_t>(got)));
          continue;
        }
        if (got < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        CloseFd(owners[i]);
      }
    }
    CloseFd(&stdout_fd_);
    CloseFd(&stderr_fd_);

    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    const int code = r == pid_ ? DecodeExitStatus(status) : -1;
    running_ = false;
    {
      std::lock_guard<std::mutex> lock(exit_mu_);
      exited_ = true;
    }
    exit_cv_.notify_all();
    if (callbacks_.on_exit) callbacks_.on_exit(code);
  }

  const pid_t pid_;
  std::mutex write_mu_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  WorkerCallbacks callbacks_;
  std::chrono::milliseconds grace_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> running_{true};
  std::mutex exit_mu_;
  std::condition_variable exit_cv_;
  bool exited_ = false;
  std::thread monitor_;
};

}  // namespace

std::optional<std::string> ResolveExecutable(const std::string& command, const EnvironmentList& env) {
  if (command.empty()) return std::nullopt;
  if (command.find('/') != std::string::npos) {
    if (IsExecutableFile(command)) return command;
    return std::nullopt;
  }
  std::string path;
  bool found_path = false;
  for (const auto& [k, v] : env) {
    if (k == "PATH") {
      path = v;
      found_path = true;
    }
  }
  if (!found_path) {
    const char* p = std::getenv("PATH");
    path = p ? p : "/usr/local/bin:/usr/bin:/bin";
  }
  size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find(':', start);
    if (end == std::string::npos) end = path.size();
    std::string dir = path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + command;
    if (IsExecutableFile(candidate)) return candidate;
    start = end + 1;
  }
  return std::nullopt;
}

std::unique_ptr<IWorkerProcess> PosixWorkerLauncher::Launch(const WorkerLaunchSpec& spec,
                                                            WorkerCallbacks callbacks,
                                                            std::string* err) {
  IgnoreSigpipeOnce();

  auto resolved = ResolveExecutable(spec.executable, spec.env);
  if (!resolved) {
    if (err) *err = "worker executable not found: " + spec.executable;
    return nullptr;
  }

  // Everything exec needs is built before fork.
  std::vector<std::string> argv_storage;
  argv_storage.push_back(spec.executable);
  for (const auto& a : spec.args) argv_storage.push_back(a);
  std::vector<char*> argv;
  for (auto& a : argv_storage) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  env_storage.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) env_storage.push_back(k + "=" + v);
  std::vector<char*> envp;
  for (auto& e : env_storage) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    if (err) *err = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    // Ignored and blocked signals survive exec; the worker starts with defaults.
    ::signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    int child_errno = 0;
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      child_errno = errno;
    } else {
      ::execve(resolved->c_str(), argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&status_pipe[1]);
  // Only the parent's end: writes must be able to give up instead of blocking forever.
  ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);

  int child_errno = 0;
  ssize_t got;
  do {
    got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);
  if (got > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    if (err) *err = "failed to exec " + *resolved + ": " + std::strerror(child_errno);
    close_all();
    return nullptr;
  }

  std::cout << "[worker] spawned pid=" << pid << " executable=" << *resolved << "\n";
  return std::make_unique<PosixWorkerProcess>(pid, in_pipe[1], out_pipe[0], err_pipe[0], std::move(callbacks),
                                              spec.terminate_grace);
}

}  // namespace gateway
