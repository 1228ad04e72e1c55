#include "../include/mcpbridge/process.hpp"

#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

// Read stdout until `want` bytes arrived or 5s passed.
std::string read_stdout(mcpbridge::child_process &proc, size_t want) {
  std::string out;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
    pollfd pfd{proc.stdout_fd(), POLLIN, 0};
    if (::poll(&pfd, 1, 100) <= 0)
      continue;
    char buf[256];
    ssize_t n = proc.read_stdout(buf, sizeof(buf));
    if (n <= 0)
      break;
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

// A zombie counts as gone: whoever reaps it is not under test.
bool pid_alive(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string text;
  if (!std::getline(stat, text))
    return false;
  auto paren = text.rfind(')');
  return paren != std::string::npos && paren + 2 < text.size() &&
         text[paren + 2] != 'Z' && text[paren + 2] != 'X';
}

} // namespace

int main() {
  int passed = 0;
  std::signal(SIGPIPE, SIG_IGN);

  // --- merged_environment ---
  {
    ::setenv("MCPBRIDGE_TEST_AMBIENT", "ambient", 1);
    auto env = mcpbridge::merged_environment({{"MCPBRIDGE_TEST_EXTRA", "1"},
                                              {"MCPBRIDGE_TEST_AMBIENT", "over"}});
    bool saw_extra = false;
    bool saw_override = false;
    for (const auto &kv : env) {
      saw_extra = saw_extra || kv == "MCPBRIDGE_TEST_EXTRA=1";
      saw_override = saw_override || kv == "MCPBRIDGE_TEST_AMBIENT=over";
      assert(kv != "MCPBRIDGE_TEST_AMBIENT=ambient");
    }
    assert(saw_extra);
    ++passed;
    assert(saw_override);
    ++passed;
  }

  // --- cat echoes stdin to stdout ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"echo", "cat", {}, {}});
    assert(proc.pid() > 0);
    ++passed;
    assert(proc.running());
    ++passed;

    assert(proc.write("hello\n"));
    ++passed;
    assert(read_stdout(proc, 6) == "hello\n");
    ++passed;

    // Closing stdin lets cat exit on its own.
    proc.close_stdin();
    assert(read_stdout(proc, 1).empty());
    ++passed;
    for (int i = 0; i < 500 && proc.running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    proc.terminate();
    assert(proc.exit_code() == 0);
    ++passed;
    assert(!proc.running());
    ++passed;
  }

  // --- env overrides reach the child; PATH lookup works ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"env", "sh", {"-c", "printf '%s\\n' \"$MCPBRIDGE_GREETING\""},
                {{"MCPBRIDGE_GREETING", "hi there"}}});
    assert(read_stdout(proc, 9) == "hi there\n");
    ++passed;
    proc.terminate();
  }

  // --- stderr is a separate stream ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"noise", "sh", {"-c", "echo oops >&2"}, {}});
    std::string err;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (err.size() < 5 && std::chrono::steady_clock::now() < deadline) {
      char buf[64];
      ssize_t n = proc.read_stderr(buf, sizeof(buf));
      if (n <= 0)
        break;
      err.append(buf, static_cast<size_t>(n));
    }
    assert(err == "oops\n");
    ++passed;
    assert(read_stdout(proc, 1).empty());
    ++passed;
    proc.terminate();
  }

  // --- missing command is a spawn_error ---
  try {
    mcpbridge::child_process proc;
    proc.spawn({"broken", "this-binary-does-not-exist", {}, {}});
    assert(false && "spawn should have thrown");
  } catch (const mcpbridge::spawn_error &e) {
    std::string what = e.what();
    assert(what.find("this-binary-does-not-exist") != std::string::npos);
    ++passed;
    assert(what.find("No such file") != std::string::npos);
    ++passed;
  }

  // --- not executable ---
  try {
    mcpbridge::child_process proc;
    proc.spawn({"dir", "/tmp", {}, {}});
    assert(false && "spawn should have thrown");
  } catch (const mcpbridge::spawn_error &) {
    ++passed;
  }

  // --- terminate stops a long-running child ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"sleeper", "sleep", {"60"}, {}});
    pid_t pid = proc.pid();
    proc.terminate();
    assert(!pid_alive(pid));
    ++passed;
    assert(proc.exit_code() == 128 + SIGTERM);
    ++passed;
    proc.terminate(); // second call is a no-op
    ++passed;
  }

  // --- SIGTERM ignored: SIGKILL after the grace period ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"stubborn", "sh", {"-c", "trap '' TERM; echo ready; while :; do sleep 1; done"}, {}});
    assert(read_stdout(proc, 6) == "ready\n");
    pid_t pid = proc.pid();
    auto start = std::chrono::steady_clock::now();
    proc.terminate(std::chrono::milliseconds(300));
    auto took = std::chrono::steady_clock::now() - start;
    assert(!pid_alive(pid));
    ++passed;
    assert(took >= std::chrono::milliseconds(300));
    ++passed;
    assert(proc.exit_code() == 128 + SIGKILL);
    ++passed;
  }

  // --- helpers forked by the child die with it ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"tree", "sh", {"-c", "sleep 60 & echo $!; wait"}, {}});
    auto line = read_stdout(proc, 1);
    while (line.find('\n') == std::string::npos) {
      auto more = read_stdout(proc, 1);
      assert(!more.empty());
      line += more;
    }
    pid_t helper = static_cast<pid_t>(std::stol(line));
    assert(pid_alive(helper));
    ++passed;
    proc.terminate();
    // The helper is not our child; give init a moment to reap it.
    for (int i = 0; i < 50 && pid_alive(helper); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(!pid_alive(helper));
    ++passed;
  }

  // --- a write to a child that never reads ends when it is terminated ---
  {
    mcpbridge::child_process proc;
    proc.spawn({"deaf", "sleep", {"30"}, {}});
    pid_t pid = proc.pid();
    bool wrote = true;
    std::thread writer([&]() { wrote = proc.write(std::string(200000, 'x')); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto start = std::chrono::steady_clock::now();
    proc.terminate(std::chrono::milliseconds(300));
    writer.join();
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    ++passed;
    assert(!wrote);
    ++passed;
    assert(!pid_alive(pid));
    ++passed;
  }

  // --- a stuck write gives up when the watched socket hangs up ---
  {
    int sv[2] = {-1, -1};
    int rc = ::socketpair(AF_UNIX, SOCK_STREAM, 0, sv);
    assert(rc == 0);
    mcpbridge::child_process proc;
    proc.spawn({"deaf", "sleep", {"30"}, {}});
    bool wrote = true;
    std::thread writer([&]() { wrote = proc.write(std::string(200000, 'x'), sv[0]); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ::close(sv[1]);
    writer.join();
    assert(!wrote);
    ++passed;
    assert(proc.running());
    ++passed;
    proc.terminate();
    ::close(sv[0]);
  }

  // --- destructor kills a child that is still running ---
  {
    pid_t pid = -1;
    {
      mcpbridge::child_process proc;
      proc.spawn({"sleeper", "sleep", {"60"}, {}});
      pid = proc.pid();
    }
    assert(!pid_alive(pid));
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
