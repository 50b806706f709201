#include "pathforge/url-for.hpp"

#include <algorithm>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pathforge/binding.hpp"
#include "pathforge/controller.hpp"
#include "pathforge/element.hpp"
#include "pathforge/function.hpp"
#include "pathforge/route-table.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

std::vector<std::string> PathSegmentsFor(Controller& controller, const Function& handler, const ValueMap& values) {
  std::shared_ptr<Element> elem = controller.routes().handlerElement(handler);
  if (!elem) {
    throw UrlForError("handler '" + std::string(handler.name()) + "' is not routed by this controller");
  }

  std::vector<std::string> segments;
  std::unordered_set<const Element*> seen;
  for (Controller* current = &controller; current != nullptr; current = current->parent()) {
    const Value owner(current);
    for (; elem; elem = elem->parent()) {
      if (!seen.insert(elem.get()).second) {
        throw std::logic_error("loop detected while walking up the routing tree");
      }
      if (elem->kind() == Element::Kind::Path) {
        segments.push_back(*elem->ident());
      } else if (elem->kind() == Element::Kind::Binding) {
        const std::string& name = *elem->ident();
        auto it = values.find(name);
        if (it == values.end()) {
          throw UrlForError("missing value for binding \"" + name + "\"");
        }
        auto segment = static_cast<const Binding&>(*elem).format(owner, it->second);
        if (!segment) {
          throw UrlForError("cannot format the value of binding \"" + name + "\"");
        }
        segments.push_back(std::move(*segment));
      }
    }
    elem = current->mountElement();
  }

  std::ranges::reverse(segments);
  return segments;
}

std::string JoinUrl(std::string_view base, std::span<const std::string> segments) {
  std::string ret(base);
  ret.push_back('/');
  for (std::size_t pos = 0; pos < segments.size(); ++pos) {
    if (pos != 0) {
      ret.push_back('/');
    }
    ret.append(segments[pos]);
  }
  return ret;
}

std::string UrlFor(Controller& controller, const Function& handler, const ValueMap& values, std::string_view base) {
  return JoinUrl(base, PathSegmentsFor(controller, handler, values));
}

std::string UrlFor(Controller& controller, std::string_view handlerName, const ValueMap& values,
                   std::string_view base) {
  FunctionPtr handler = controller.routes().handler(handlerName);
  if (!handler) {
    throw UrlForError("no handler named '" + std::string(handlerName) + "'");
  }
  return UrlFor(controller, *handler, values, base);
}

}  // namespace pathforge
