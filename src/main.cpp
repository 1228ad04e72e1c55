#include "mcpbridge/gateway.hpp"
#include "mcpbridge/options.hpp"
#include "mcpbridge/registry.hpp"

#include <csignal>
#include <cstdio>
#include <exception>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string describe_spec(const mcpbridge::spawn_spec &spec) {
  std::string out = spec.command;
  for (const auto &arg : spec.args) {
    out += ' ';
    out += arg;
  }
  return out;
}

} // namespace

int main(int argc, char **argv) {
  mcpbridge::options opts;
  try {
    opts = mcpbridge::parse_flags(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument &e) {
    std::fprintf(stderr, "mcp-bridge: %s\n\n%s", e.what(), mcpbridge::usage());
    return 2;
  }
  if (opts.show_help) {
    std::fputs(mcpbridge::usage(), stdout);
    return 0;
  }

  auto level = spdlog::level::from_str(opts.log_level);
  if (level == spdlog::level::off && opts.log_level != "off") {
    std::fprintf(stderr, "mcp-bridge: unknown log level '%s'\n",
                 opts.log_level.c_str());
    return 2;
  }
  spdlog::set_level(level);

  // Writes to a vanished peer or child must fail with EPIPE, not kill us.
  std::signal(SIGPIPE, SIG_IGN);

  // Route SIGINT/SIGTERM to a waiter thread; every thread started from here
  // inherits the mask, and children reset it before exec.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  auto servers = mcpbridge::registry::load(opts.config_path);

  mcpbridge::gateway gw(std::move(servers), opts);
  try {
    gw.start();
  } catch (const std::exception &e) {
    spdlog::critical("cannot listen on {}: {}", opts.listen_uri, e.what());
    return 1;
  }

  spdlog::info("Available servers:");
  for (const auto &name : gw.servers().names()) {
    const auto *spec = gw.servers().find(name);
    spdlog::info("- ws://localhost:{}/mcp/{} -> {}", gw.port(), name,
                 describe_spec(*spec));
  }

  std::thread waiter([&gw, stop_signals]() {
    int sig = 0;
    if (sigwait(&stop_signals, &sig) == 0)
      spdlog::info("received signal {}, shutting down", sig);
    gw.stop();
  });

  try {
    gw.serve();
  } catch (const std::exception &e) {
    spdlog::critical("gateway stopped: {}", e.what());
    pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();
    return 1;
  }

  waiter.join();
  spdlog::info("MCP Bridge Server stopped");
  return 0;
}
