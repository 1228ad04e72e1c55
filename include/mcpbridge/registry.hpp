#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpbridge {

/// How to start one tool server process.
struct spawn_spec {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
};

/// True when `name` can appear as the last segment of /mcp/<name>.
inline bool valid_server_name(std::string_view name) {
  if (name.empty())
    return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  });
}

/// Read-only name -> spawn_spec mapping. Built once, then shared by const
/// reference with every connection thread.
class registry {
public:
  using json = nlohmann::json;

  registry() = default;
  explicit registry(std::vector<spawn_spec> specs) {
    for (auto &spec : specs) {
      auto name = spec.name;
      specs_.emplace(std::move(name), std::move(spec));
    }
  }

  const spawn_spec *find(const std::string &name) const {
    auto it = specs_.find(name);
    return it == specs_.end() ? nullptr : &it->second;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto &kv : specs_)
      out.push_back(kv.first);
    return out;
  }

  size_t size() const { return specs_.size(); }
  bool empty() const { return specs_.empty(); }

  /// Body of GET /servers.
  json to_json() const {
    json out = json::object();
    for (const auto &[name, spec] : specs_) {
      out[name] = {{"command", spec.command},
                   {"args", spec.args},
                   {"env", spec.env}};
    }
    return out;
  }

  /// Build from a parsed configuration document. Entries with the wrong
  /// shape are skipped with a warning.
  static registry from_json(const json &doc) {
    std::vector<spawn_spec> specs;
    if (!doc.is_object()) {
      spdlog::warn("server config is not a JSON object; no servers loaded");
      return registry{};
    }

    for (const auto &[name, entry] : doc.items()) {
      if (!valid_server_name(name)) {
        spdlog::warn("skipping server '{}': name must match [A-Za-z0-9_-]+",
                     name);
        continue;
      }
      if (!entry.is_object() || !entry.contains("command") ||
          !entry["command"].is_string()) {
        spdlog::warn("skipping server '{}': \"command\" must be a string",
                     name);
        continue;
      }

      spawn_spec spec;
      spec.name = name;
      spec.command = entry["command"].get<std::string>();

      bool ok = true;
      if (entry.contains("args")) {
        const auto &args = entry["args"];
        if (!args.is_array()) {
          ok = false;
        } else {
          for (const auto &arg : args) {
            if (!arg.is_string()) {
              ok = false;
              break;
            }
            spec.args.push_back(arg.get<std::string>());
          }
        }
      }
      if (ok && entry.contains("env") && !entry["env"].is_null()) {
        const auto &env = entry["env"];
        if (!env.is_object()) {
          ok = false;
        } else {
          for (const auto &[key, value] : env.items()) {
            if (!value.is_string()) {
              ok = false;
              break;
            }
            spec.env[key] = value.get<std::string>();
          }
        }
      }
      if (!ok) {
        spdlog::warn("skipping server '{}': \"args\" must be an array of "
                     "strings and \"env\" an object of strings",
                     name);
        continue;
      }

      specs.push_back(std::move(spec));
    }
    return registry{std::move(specs)};
  }

  /// Load the registry from a JSON file. Never throws: a missing or
  /// malformed file yields an empty registry and a warning.
  static registry load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
      spdlog::warn("config file not found at {}; no servers loaded", path);
      return registry{};
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
      spdlog::error("failed to parse {}: invalid JSON; no servers loaded",
                    path);
      return registry{};
    }
    return from_json(doc);
  }

private:
  std::map<std::string, spawn_spec> specs_;
};

} // namespace mcpbridge
