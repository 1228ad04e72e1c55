#pragma once

#include "registry.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge {

/// Path prefix of the upgrade endpoint.
constexpr std::string_view kRoutePrefix = "/mcp/";

/// Strip any query string or fragment from a request target.
inline std::string_view request_path(std::string_view target) {
  auto pos = target.find_first_of("?#");
  return pos == std::string_view::npos ? target : target.substr(0, pos);
}

/// Extract <name> from "/mcp/<name>". Anything else yields nullopt,
/// including extra segments and a trailing slash.
inline std::optional<std::string> route_name(std::string_view target) {
  auto path = request_path(target);
  if (path.substr(0, kRoutePrefix.size()) != kRoutePrefix)
    return std::nullopt;
  auto name = path.substr(kRoutePrefix.size());
  if (!valid_server_name(name))
    return std::nullopt;
  return std::string(name);
}

/// Resolve a request target against the registry. Returns nullptr for an
/// unknown or malformed route; the caller must refuse the upgrade.
inline const spawn_spec *resolve_route(const registry &reg,
                                       std::string_view target) {
  auto name = route_name(target);
  if (!name)
    return nullptr;
  return reg.find(*name);
}

} // namespace mcpbridge
