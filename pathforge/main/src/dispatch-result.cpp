#include "pathforge/dispatch-result.hpp"

#include <string>

namespace pathforge {

std::string DispatchResult::allowHeader() const {
  std::string ret;
  for (const auto& verb : verbs) {
    if (!ret.empty()) {
      ret.push_back(',');
    }
    ret.append(verb);
  }
  return ret;
}

}  // namespace pathforge
