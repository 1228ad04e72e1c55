#pragma once

#include "process.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge {

/// Default registry source when --config is omitted.
constexpr std::string_view kDefaultConfigPath = "servers.json";

struct options {
  std::string listen_uri = std::string(kDefaultURI);
  std::string config_path = std::string(kDefaultConfigPath);
  std::chrono::milliseconds kill_grace = kDefaultKillGrace;
  /// Zero disables the idle timeout.
  std::chrono::milliseconds idle_timeout{0};
  std::string log_level = "info";
  bool show_help = false;
};

inline long parse_millis(const std::string &flag, const std::string &text) {
  size_t used = 0;
  long value = 0;
  try {
    value = std::stol(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument(flag + " expects milliseconds, got '" + text + "'");
  }
  if (used != text.size() || value < 0)
    throw std::invalid_argument(flag + " expects milliseconds, got '" + text + "'");
  return value;
}

/// Parse command-line args (without argv[0]). MCP_BRIDGE_CONFIG replaces
/// the default config path; --config wins over both.
inline options parse_flags(const std::vector<std::string> &args) {
  options opts;
  if (const char *env_config = std::getenv("MCP_BRIDGE_CONFIG");
      env_config != nullptr && *env_config != '\0')
    opts.config_path = env_config;

  for (size_t i = 0; i < args.size(); ++i) {
    const auto &arg = args[i];
    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      continue;
    }
    if (i + 1 >= args.size())
      throw std::invalid_argument("missing value for " + arg);

    const auto &value = args[++i];
    if (arg == "--listen")
      opts.listen_uri = value;
    else if (arg == "--port")
      opts.listen_uri = "tcp://:" + value;
    else if (arg == "--config")
      opts.config_path = value;
    else if (arg == "--kill-grace-ms")
      opts.kill_grace = std::chrono::milliseconds(parse_millis(arg, value));
    else if (arg == "--idle-timeout-ms")
      opts.idle_timeout = std::chrono::milliseconds(parse_millis(arg, value));
    else if (arg == "--log-level")
      opts.log_level = value;
    else
      throw std::invalid_argument("unknown flag: " + arg);
  }

  (void)parse_uri(opts.listen_uri);
  return opts;
}

inline const char *usage() {
  return "usage: mcp-bridge [--listen <uri> | --port <n>] [--config <path>]\n"
         "                  [--kill-grace-ms <n>] [--idle-timeout-ms <n>]\n"
         "                  [--log-level trace|debug|info|warn|error|off]\n"
         "\n"
         "  --listen           tcp://host:port or unix:///path (default tcp://:8000)\n"
         "  --config           JSON map of server name to {command, args, env}\n"
         "                     (default servers.json, or $MCP_BRIDGE_CONFIG)\n"
         "  --kill-grace-ms    wait between SIGTERM and SIGKILL (default 2000)\n"
         "  --idle-timeout-ms  close sessions idle this long; 0 disables (default)\n";
}

} // namespace mcpbridge
