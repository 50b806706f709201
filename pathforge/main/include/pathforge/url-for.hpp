#pragma once

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "pathforge/controller.hpp"
#include "pathforge/function.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

// Raised when a path cannot be built for a handler.
class UrlForError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Path segments leading to 'handler' of 'controller', from the top-level controller. 'values' provides the value of
// each Binding on the way, converted by the Binding formatter.
// Throws UrlForError if 'handler' is not routed by 'controller', or if a value is missing or cannot be formatted.
std::vector<std::string> PathSegmentsFor(Controller& controller, const Function& handler, const ValueMap& values);

// 'base' followed by a slash and the slash separated 'segments'.
std::string JoinUrl(std::string_view base, std::span<const std::string> segments);

// JoinUrl(base, PathSegmentsFor(controller, handler, values))
std::string UrlFor(Controller& controller, const Function& handler, const ValueMap& values = {},
                   std::string_view base = {});

// Same as above, for the handler registered under 'handlerName' in the routing table of 'controller'.
std::string UrlFor(Controller& controller, std::string_view handlerName, const ValueMap& values = {},
                   std::string_view base = {});

}  // namespace pathforge
