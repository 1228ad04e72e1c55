#include "../include/mcpbridge/registry.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>

namespace {

std::string make_temp_json_path() {
  char tmpl[] = "/tmp/mcpbridge_registry_test_XXXXXX";
  int fd = ::mkstemp(tmpl);
  assert(fd >= 0);
  ::close(fd);
  std::string path = std::string(tmpl) + ".json";
  std::remove(tmpl);
  return path;
}

std::string write_temp(const std::string &text) {
  auto path = make_temp_json_path();
  std::ofstream f(path);
  f << text;
  return path;
}

} // namespace

int main() {
  int passed = 0;
  spdlog::set_level(spdlog::level::off);

  // --- load a well-formed config ---
  {
    auto path = write_temp(R"({
      "fetch": {"command": "uvx", "args": ["mcp-server-fetch"]},
      "filesystem": {
        "command": "npx",
        "args": ["-y", "@modelcontextprotocol/server-filesystem", "/data"],
        "env": {"NODE_ENV": "production"}
      },
      "echo": {"command": "cat"}
    })");
    auto reg = mcpbridge::registry::load(path);
    assert(reg.size() == 3);
    ++passed;

    auto names = reg.names();
    assert(names.size() == 3);
    ++passed;
    assert(names[0] == "echo" && names[1] == "fetch" && names[2] == "filesystem");
    ++passed;

    const auto *fs = reg.find("filesystem");
    assert(fs != nullptr);
    ++passed;
    assert(fs->name == "filesystem");
    ++passed;
    assert(fs->command == "npx");
    ++passed;
    assert(fs->args.size() == 3 && fs->args[2] == "/data");
    ++passed;
    assert(fs->env.at("NODE_ENV") == "production");
    ++passed;

    const auto *echo = reg.find("echo");
    assert(echo != nullptr && echo->args.empty() && echo->env.empty());
    ++passed;

    assert(reg.find("missing") == nullptr);
    ++passed;

    auto doc = reg.to_json();
    assert(doc.is_object() && doc.size() == 3);
    ++passed;
    assert(doc["fetch"]["command"] == "uvx");
    ++passed;
    assert(doc["fetch"]["args"][0] == "mcp-server-fetch");
    ++passed;
    assert(doc["filesystem"]["env"]["NODE_ENV"] == "production");
    ++passed;
    assert(doc["echo"]["env"].is_object() && doc["echo"]["env"].empty());
    ++passed;

    std::remove(path.c_str());
  }

  // --- missing file: empty registry, no throw ---
  {
    auto reg = mcpbridge::registry::load("/nonexistent/dir/servers.json");
    assert(reg.empty());
    ++passed;
    assert(reg.to_json().is_object() && reg.to_json().empty());
    ++passed;
  }

  // --- malformed JSON: empty registry, no throw ---
  {
    auto path = write_temp("{ \"echo\": { \"command\": ");
    auto reg = mcpbridge::registry::load(path);
    assert(reg.empty());
    ++passed;
    std::remove(path.c_str());
  }

  // --- top level not an object ---
  {
    auto path = write_temp(R"(["cat"])");
    auto reg = mcpbridge::registry::load(path);
    assert(reg.empty());
    ++passed;
    std::remove(path.c_str());
  }

  // --- bad entries are skipped, good ones kept ---
  {
    auto doc = nlohmann::json::parse(R"({
      "ok": {"command": "cat"},
      "no-command": {"args": []},
      "bad-args": {"command": "cat", "args": "x"},
      "bad-env": {"command": "cat", "env": {"A": 1}},
      "bad.name": {"command": "cat"},
      "not-object": "cat",
      "null-env": {"command": "cat", "env": null}
    })");
    auto reg = mcpbridge::registry::from_json(doc);
    assert(reg.size() == 2);
    ++passed;
    assert(reg.find("ok") != nullptr);
    ++passed;
    assert(reg.find("null-env") != nullptr);
    ++passed;
    assert(reg.find("bad-args") == nullptr && reg.find("bad.name") == nullptr);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
