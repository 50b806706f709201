#include "pathforge/router-config.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "pathforge/ascii-upper.hpp"

namespace pathforge {

RouterConfig& RouterConfig::withFallbackVerbs(std::vector<std::string> verbs) {
  fallbackVerbs = std::move(verbs);
  return *this;
}

RouterConfig& RouterConfig::withPathInfoKey(std::string key) {
  pathInfoKey = std::move(key);
  return *this;
}

RouterConfig& RouterConfig::withRootControllerKey(std::string key) {
  rootControllerKey = std::move(key);
  return *this;
}

RouterConfig& RouterConfig::withHeadFallsBackToGet(bool enable) {
  headFallsBackToGet = enable;
  return *this;
}

RouterConfig& RouterConfig::withSynthesizeOptions(bool enable) {
  synthesizeOptions = enable;
  return *this;
}

void RouterConfig::validate() const {
  if (pathInfoKey.empty()) {
    throw std::invalid_argument("pathInfoKey cannot be empty");
  }
  if (rootControllerKey.empty()) {
    throw std::invalid_argument("rootControllerKey cannot be empty");
  }
  if (pathInfoKey == rootControllerKey) {
    throw std::invalid_argument("pathInfoKey and rootControllerKey must differ");
  }
  for (const auto& verb : fallbackVerbs) {
    if (verb.empty()) {
      throw std::invalid_argument("fallback verbs cannot be empty");
    }
    if (!IsUpperAscii(verb)) {
      throw std::invalid_argument("fallback verb '" + verb + "' should be uppercase");
    }
  }
}

}  // namespace pathforge
