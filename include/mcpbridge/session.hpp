#pragma once

#include "framer.hpp"
#include "process.hpp"
#include "registry.hpp"
#include "websocket.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <mutex>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>

namespace mcpbridge {

enum class session_state { connecting, active, closing, closed };

inline std::string_view to_string(session_state s) {
  switch (s) {
  case session_state::connecting:
    return "connecting";
  case session_state::active:
    return "active";
  case session_state::closing:
    return "closing";
  case session_state::closed:
    return "closed";
  }
  return "unknown";
}

struct session_options {
  std::chrono::milliseconds kill_grace = kDefaultKillGrace;
  /// Zero disables the idle timeout.
  std::chrono::milliseconds idle_timeout{0};
};

/// One upgraded connection coupled to one spawned process.
///
/// run() spawns the process and then drains the connection on the calling
/// thread; two helper threads drain the process's stdout (through the
/// framer, to the connection) and stderr (to the log). Whichever side ends
/// first calls shutdown(), and only the first call tears anything down.
class session {
public:
  session(const spawn_spec &spec, int fd, session_options opts = {})
      : spec_(spec), fd_(fd), opts_(opts),
        ws_(fd, websocket_stream::role::server) {}

  ~session() {
    shutdown(kCloseInternalError, "Session destroyed");
    release();
  }

  session(const session &) = delete;
  session &operator=(const session &) = delete;

  const std::string &name() const { return spec_.name; }

  /// Spawn the process and relay until either side ends. Blocks.
  void run() {
    spdlog::info("[{}] Client connected", name());
    spdlog::info("[{}] Spawning: {}", name(), command_line());

    try {
      process_.spawn(spec_);
    } catch (const spawn_error &e) {
      spdlog::error("[{}] Spawn error: {}", name(), e.what());
      ws_.send_close(kCloseInternalError,
                     std::string("Failed to spawn process: ") + e.what());
      state_.store(session_state::closed);
      return;
    }

    // A shutdown() that raced the spawn has already shut the socket down,
    // so the first read below fails and tears the session down.
    state_.store(session_state::active);
    spdlog::debug("[{}] Process started with pid {}", name(), process_.pid());

    stdout_thread_ = std::thread([this]() { pump_stdout(); });
    stderr_thread_ = std::thread([this]() { pump_stderr(); });

    pump_connection();

    shutdown(kCloseNormal, "Connection closed");
    release();
  }

  /// Tear the session down: terminate the process, close the connection
  /// with `code`/`reason` if it is still open, and wake every reader.
  /// Only the first call does any work.
  void shutdown(uint16_t code, const std::string &reason) {
    // Held for the whole teardown so a concurrent caller returns only once
    // the socket and process are no longer in use.
    std::lock_guard<std::mutex> lock(teardown_mu_);
    auto expected = session_state::active;
    if (!state_.compare_exchange_strong(expected, session_state::closing)) {
      spdlog::debug("[{}] teardown ({}) ignored in state {}", name(), reason,
                    to_string(expected));
      // Never became active: just make sure a blocked reader wakes up.
      if (expected == session_state::connecting)
        ::shutdown(fd_, SHUT_RDWR);
      return;
    }

    spdlog::info("[{}] Cleaning up connection", name());
    process_.terminate(opts_.kill_grace);
    if (auto code_out = process_.exit_code())
      spdlog::info("[{}] Process exited with code {}", name(), *code_out);

    if (ws_.is_open())
      ws_.send_close(code, reason);
    ws_.abandon();
    ::shutdown(fd_, SHUT_RDWR);
    released_.store(true);
  }

private:
  std::string command_line() const {
    std::string out = spec_.command;
    for (const auto &arg : spec_.args) {
      out += ' ';
      out += arg;
    }
    return out;
  }

  void pump_connection() {
    auto idle = opts_.idle_timeout;
    for (;;) {
      if (idle.count() > 0) {
        pollfd pfd{fd_, POLLIN, 0};
        int r = ::poll(&pfd, 1, static_cast<int>(idle.count()));
        if (r < 0 && errno == EINTR)
          continue;
        if (r == 0) {
          spdlog::info("[{}] No client message for {} ms", name(),
                       idle.count());
          shutdown(kCloseNormal, "Idle timeout");
          return;
        }
      }

      ws_message msg;
      auto status = ws_.read(msg);
      if (status == read_status::message) {
        spdlog::debug("[{}] WS << {}", name(),
                      std::string_view(msg.payload).substr(0, 100));
        msg.payload.push_back('\n');
        // A child that stops reading must not pin this thread: the write
        // also ends when the client hangs up or teardown closes stdin.
        if (!process_.write(msg.payload, fd_))
          spdlog::debug("[{}] stdin closed; message dropped", name());
        continue;
      }
      if (status == read_status::closed) {
        spdlog::info("[{}] Client disconnected (code {})", name(),
                     msg.close_code);
      } else if (state_.load() == session_state::active) {
        spdlog::warn("[{}] WebSocket error: connection lost", name());
      }
      return;
    }
  }

  void pump_stdout() {
    char buf[4096];
    while (wait_readable(process_.stdout_fd())) {
      ssize_t n = process_.read_stdout(buf, sizeof(buf));
      if (n <= 0)
        break;
      for (auto &line : framer_.feed(std::string_view(buf, static_cast<size_t>(n)))) {
        if (!ws_.send_text(line))
          break;
        spdlog::debug("[{}] STDOUT >> {}", name(),
                      std::string_view(line).substr(0, 100));
      }
    }
    framer_.reset();
    shutdown(kCloseNormal, "Process exited");
  }

  void pump_stderr() {
    char buf[4096];
    while (wait_readable(process_.stderr_fd())) {
      ssize_t n = process_.read_stderr(buf, sizeof(buf));
      if (n <= 0)
        break;
      auto text = trim(std::string_view(buf, static_cast<size_t>(n)));
      if (!text.empty())
        spdlog::warn("[{}] STDERR: {}", name(), text);
    }
  }

  // Polls in short steps so a reader stuck behind a pipe that some
  // escaped grandchild keeps open still notices release().
  bool wait_readable(int fd) {
    for (;;) {
      pollfd pfd{fd, POLLIN, 0};
      int r = ::poll(&pfd, 1, 100);
      if (r > 0)
        return true;
      if (r < 0 && errno != EINTR)
        return false;
      if (r == 0 && released_.load())
        return false;
    }
  }

  // Join the helper threads and close the pipes. Connection thread only.
  void release() {
    released_.store(true);
    if (stdout_thread_.joinable())
      stdout_thread_.join();
    if (stderr_thread_.joinable())
      stderr_thread_.join();
    process_.close_fds();
    state_.store(session_state::closed);
  }

  const spawn_spec &spec_;
  int fd_;
  session_options opts_;
  websocket_stream ws_;
  child_process process_;
  line_framer framer_;

  std::atomic<session_state> state_{session_state::connecting};
  std::atomic<bool> released_{false};
  std::mutex teardown_mu_;
  std::thread stdout_thread_;
  std::thread stderr_thread_;
};

} // namespace mcpbridge
