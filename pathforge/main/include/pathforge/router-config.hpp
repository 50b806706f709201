#pragma once

#include <string>
#include <vector>

namespace pathforge {

struct RouterConfig {
  // Verbs reported as available by an OPTIONS request on a node having a fallback method, in addition to the verbs
  // of its dedicated methods.
  // Default: HEAD, GET, PUT, POST, DELETE, OPTIONS
  std::vector<std::string> fallbackVerbs{"HEAD", "GET", "PUT", "POST", "DELETE", "OPTIONS"};

  // Name under which a handler receives the part of the path that was not consumed, if it wants it.
  // A handler wanting this value is invoked even when the path is not fully consumed, making it a catch-all.
  std::string pathInfoKey{"path_info"};

  // Name under which the top-level controller of a request is made available for injection.
  std::string rootControllerKey{"root_controller"};

  // If true, a HEAD request on a node without HEAD method is handled by its GET method.
  bool headFallsBackToGet{true};

  // If true, an OPTIONS request on a node without method handling it reports the available verbs.
  // Otherwise it is reported as not implemented.
  bool synthesizeOptions{true};

  RouterConfig& withFallbackVerbs(std::vector<std::string> verbs);

  RouterConfig& withPathInfoKey(std::string key);

  RouterConfig& withRootControllerKey(std::string key);

  RouterConfig& withHeadFallsBackToGet(bool enable = true);

  RouterConfig& withSynthesizeOptions(bool enable = true);

  // Throws std::invalid_argument if an injection key is empty, or if a fallback verb is empty or not uppercase.
  void validate() const;

  bool operator==(const RouterConfig&) const noexcept = default;
};

}  // namespace pathforge
