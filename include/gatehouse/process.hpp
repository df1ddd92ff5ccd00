#pragma once

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#ifdef __linux__
#include <sys/prctl.h>
#endif

extern char **environ;

namespace gatehouse {

/// Writes to a dead child's pipe must fail with EPIPE, not kill us.
inline void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

/// Child process connected through three pipes. A reaper thread waits
/// for the child, so exit is observed even when nobody polls.
class child_process {
public:
  using exit_fn = std::function<void(int exit_code)>;

  /// `env` entries are "NAME=value" strings added to the inherited
  /// environment.
  static std::unique_ptr<child_process>
  spawn(const std::vector<std::string> &argv,
        const std::vector<std::string> &env = {}, exit_fn on_exit = nullptr) {
    if (argv.empty()) {
      throw std::invalid_argument("spawn requires a command");
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0) {
      int saved = errno;
      for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                     err_pipe[0], err_pipe[1]}) {
        if (fd >= 0) {
          ::close(fd);
        }
      }
      throw std::runtime_error("pipe2() failed: " +
                               std::string(std::strerror(saved)));
    }

    // Everything the child touches is prepared before fork().
    std::vector<char *> args;
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
      env_storage.emplace_back(*e);
    }
    for (const auto &entry : env) {
      env_storage.push_back(entry);
    }
    std::vector<char *> envp;
    for (auto &entry : env_storage) {
      envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
      int saved = errno;
      for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                     err_pipe[0], err_pipe[1]}) {
        ::close(fd);
      }
      throw std::runtime_error("fork() failed: " +
                               std::string(std::strerror(saved)));
    }

    if (pid == 0) {
#ifdef __linux__
      ::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
      ::dup2(in_pipe[0], STDIN_FILENO);
      ::dup2(out_pipe[1], STDOUT_FILENO);
      ::dup2(err_pipe[1], STDERR_FILENO);
      ::execvpe(args[0], args.data(), envp.data());
      const char msg[] = "exec failed\n";
      (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      ::_exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    return std::unique_ptr<child_process>(new child_process(
        pid, in_pipe[1], out_pipe[0], err_pipe[0], std::move(on_exit)));
  }

  ~child_process() {
    if (running()) {
      signal(SIGKILL);
    }
    if (reaper_.joinable()) {
      reaper_.join();
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
  }

  child_process(const child_process &) = delete;
  child_process &operator=(const child_process &) = delete;

  pid_t pid() const { return pid_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  bool running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return !exited_;
  }

  int exit_code() const {
    std::lock_guard<std::mutex> lock(mu_);
    return exit_code_;
  }

  /// Write one newline-terminated message to the child's stdin.
  bool write_stdin(const std::string &line) {
    std::lock_guard<std::mutex> lock(write_mu_);
    if (stdin_fd_ < 0) {
      return false;
    }
    std::string framed = line;
    framed.push_back('\n');
    const char *ptr = framed.data();
    size_t left = framed.size();
    while (left > 0) {
      ssize_t n = ::write(stdin_fd_, ptr, left);
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        return false;
      }
      ptr += n;
      left -= static_cast<size_t>(n);
    }
    return true;
  }

  /// Closing stdin is the polite way to ask a host to stop. Returns false
  /// when a writer is blocked on the pipe; a signal has to follow then.
  bool close_stdin() {
    std::unique_lock<std::mutex> lock(write_mu_, std::try_to_lock);
    if (!lock.owns_lock()) {
      return false;
    }
    close_fd(stdin_fd_);
    return true;
  }

  void signal(int sig) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!exited_) {
      ::kill(pid_, sig);
    }
  }

  /// True once the child has exited; false if `timeout_ms` passed first.
  bool wait_exit(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    return exit_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this]() { return exited_; });
  }

private:
  child_process(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                exit_fn on_exit)
      : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
        stderr_fd_(stderr_fd), on_exit_(std::move(on_exit)) {
    reaper_ = std::thread([this]() { reap(); });
  }

  static void close_fd(int &fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  void reap() {
    int status = 0;
    pid_t rc = -1;
    do {
      rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    int code = -1;
    if (rc == pid_) {
      if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
      }
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      exited_ = true;
      exit_code_ = code;
    }
    exit_cv_.notify_all();
    if (on_exit_) {
      on_exit_(code);
    }
  }

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  exit_fn on_exit_;

  std::mutex write_mu_;
  mutable std::mutex mu_;
  std::condition_variable exit_cv_;
  bool exited_ = false;
  int exit_code_ = -1;
  std::thread reaper_;
};

} // namespace gatehouse
