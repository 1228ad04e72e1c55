#pragma once

#include "registry.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <optional>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace mcpbridge {

/// Default wait between SIGTERM and SIGKILL.
constexpr std::chrono::milliseconds kDefaultKillGrace{2000};

/// The OS refused or failed to start a process.
class spawn_error : public std::runtime_error {
public:
  explicit spawn_error(const std::string &message)
      : std::runtime_error(message) {}
};

/// Ambient environment with `overrides` applied, as KEY=VALUE strings.
inline std::vector<std::string>
merged_environment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string_view::npos || eq == 0)
      continue;
    env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
  }
  for (const auto &[key, value] : overrides)
    env[key] = value;

  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto &[key, value] : env)
    out.push_back(key + "=" + value);
  return out;
}

/// A spawned tool server with piped stdin/stdout/stderr.
///
/// The child leads its own process group so terminate() also reaches
/// helpers it forks. Only terminate() reaps the child.
class child_process {
public:
  child_process() = default;
  ~child_process() {
    terminate(std::chrono::milliseconds(0));
    close_fds();
  }

  child_process(const child_process &) = delete;
  child_process &operator=(const child_process &) = delete;

  /// Start `spec` in the current working directory.
  /// Throws spawn_error when the command cannot be executed.
  void spawn(const spawn_spec &spec) {
    if (pid_ > 0)
      throw std::logic_error("child_process already spawned");
    if (spec.command.empty())
      throw spawn_error("spawn: empty command");

    // Everything the child needs is built before fork(); the child only
    // calls async-signal-safe functions.
    std::vector<std::string> args;
    args.reserve(spec.args.size() + 1);
    args.push_back(spec.command);
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args)
      argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto env = merged_environment(spec.env);
    std::vector<char *> envp;
    envp.reserve(env.size() + 1);
    for (auto &kv : env)
      envp.push_back(kv.data());
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
      for (int *p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
        for (int i = 0; i < 2; ++i) {
          if (p[i] >= 0) {
            ::close(p[i]);
            p[i] = -1;
          }
        }
      }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
      int err = errno;
      close_all();
      throw spawn_error("spawn " + spec.command +
                        ": pipe() failed: " + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
      int err = errno;
      close_all();
      throw spawn_error("spawn " + spec.command +
                        ": fork() failed: " + std::strerror(err));
    }

    if (pid == 0) {
      ::setpgid(0, 0);

      sigset_t none;
      sigemptyset(&none);
      ::sigprocmask(SIG_SETMASK, &none, nullptr);
      ::signal(SIGPIPE, SIG_DFL);

      ::dup2(in_pipe[0], STDIN_FILENO);
      ::dup2(out_pipe[1], STDOUT_FILENO);
      ::dup2(err_pipe[1], STDERR_FILENO);

      environ = envp.data();
      ::execvp(argv[0], argv.data());

      int err = errno;
      ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
      (void)ignored;
      ::_exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
      n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
      ::waitpid(pid, nullptr, 0);
      ::close(in_pipe[1]);
      ::close(out_pipe[0]);
      ::close(err_pipe[0]);
      throw spawn_error("spawn " + spec.command + ": " +
                        std::strerror(exec_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    ::fcntl(stdin_fd_, F_SETFL, ::fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
  }

  pid_t pid() const { return pid_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  /// Write all of `data` to the child's stdin without ever blocking
  /// teardown. Gives up (returns false) once close_stdin() or terminate()
  /// runs, or when `hangup_fd` reports that its peer went away.
  bool write(std::string_view data, int hangup_fd = -1) {
    std::lock_guard<std::mutex> lock(stdin_mu_);
    size_t written = 0;
    while (written < data.size()) {
      if (stdin_fd_ < 0 || stdin_closing_.load())
        return false;
      ssize_t n = ::write(stdin_fd_, data.data() + written,
                          data.size() - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR)
        continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        // Pipe full: wait in short steps so closing stays prompt.
        pollfd pfds[2] = {{stdin_fd_, POLLOUT, 0},
                          {hangup_fd, POLLRDHUP, 0}};
        int r = ::poll(pfds, 2, 100);
        if (r < 0 && errno != EINTR)
          return false;
        if (r > 0 && (pfds[1].revents & (POLLRDHUP | POLLHUP | POLLERR)))
          return false;
        continue;
      }
      return false;
    }
    return true;
  }

  ssize_t read_stdout(char *buf, size_t size) { return read_fd(stdout_fd_, buf, size); }
  ssize_t read_stderr(char *buf, size_t size) { return read_fd(stderr_fd_, buf, size); }

  /// Close the child's stdin. A write() stuck on a full pipe gives up
  /// within one poll step first.
  void close_stdin() {
    stdin_closing_.store(true);
    std::lock_guard<std::mutex> lock(stdin_mu_);
    if (stdin_fd_ >= 0) {
      ::close(stdin_fd_);
      stdin_fd_ = -1;
    }
  }

  /// True while the child has neither exited nor been reaped.
  bool running() {
    std::lock_guard<std::mutex> lock(wait_mu_);
    if (pid_ <= 0 || exit_code_)
      return false;
    return !try_reap();
  }

  /// Exit code once reaped; 128 + signal number for a signalled child.
  std::optional<int> exit_code() const {
    std::lock_guard<std::mutex> lock(wait_mu_);
    return exit_code_;
  }

  /// Stop the child: SIGTERM to its process group, then SIGKILL once
  /// `grace` has passed. Always reaps. Safe to call repeatedly.
  void terminate(std::chrono::milliseconds grace = kDefaultKillGrace) {
    std::lock_guard<std::mutex> lock(wait_mu_);
    if (pid_ <= 0 || terminated_)
      return;
    terminated_ = true;

    if (exit_code_) {
      close_stdin();
      return;
    }
    signal_group(SIGTERM);
    close_stdin();

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (!exit_code_ && !try_reap()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        signal_group(SIGKILL);
        int status = 0;
        pid_t r = -1;
        do {
          r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid_)
          record_status(status);
        else
          exit_code_ = -1;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  /// Close the stdout/stderr read ends. Only after the readers are done.
  void close_fds() {
    close_stdin();
    if (stdout_fd_ >= 0) {
      ::close(stdout_fd_);
      stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
      ::close(stderr_fd_);
      stderr_fd_ = -1;
    }
  }

private:
  static ssize_t read_fd(int fd, char *buf, size_t size) {
    if (fd < 0)
      return 0;
    ssize_t n = 0;
    do {
      n = ::read(fd, buf, size);
    } while (n < 0 && errno == EINTR);
    return n;
  }

  void signal_group(int sig) {
    if (::kill(-pid_, sig) != 0)
      ::kill(pid_, sig);
  }

  // Caller holds wait_mu_.
  bool try_reap() {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      record_status(status);
      return true;
    }
    if (r < 0 && errno == ECHILD) {
      exit_code_ = -1;
      return true;
    }
    return false;
  }

  void record_status(int status) {
    if (WIFEXITED(status))
      exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
      exit_code_ = 128 + WTERMSIG(status);
    else
      exit_code_ = -1;
  }

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  std::mutex stdin_mu_;
  std::atomic<bool> stdin_closing_{false};
  mutable std::mutex wait_mu_;
  std::optional<int> exit_code_;
  bool terminated_ = false;
};

} // namespace mcpbridge
