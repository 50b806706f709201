#include "pathforge/route-table.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "pathforge/binding.hpp"
#include "pathforge/element.hpp"
#include "pathforge/log.hpp"
#include "pathforge/method.hpp"
#include "pathforge/path.hpp"
#include "pathforge/root.hpp"
#include "pathforge/router-config.hpp"

namespace pathforge {

RouteTable::RouteTable(RouterConfig config) : _root(MakeRoot()), _config(std::move(config)) {}

RouteTable& RouteTable::extend(const RouteTable& base) {
  checkNotSealed();
  _root->addElement(base.root()->clone());
  return *this;
}

RouteTable& RouteTable::add(const std::shared_ptr<Element>& elem, std::optional<std::string> ident) {
  checkNotSealed();
  _root->addElement(elem, std::move(ident));
  return *this;
}

void RouteTable::seal() {
  checkNotSealed();
  _config.validate();
  index(_root);
  _sealed = true;
  log::debug("Sealed routing table with {} handler(s) and {} delegation(s)", _handlers.size(), _delegations.size());
}

std::shared_ptr<Element> RouteTable::handlerElement(const Function& handler) const {
  auto it = _handlerElements.find(&handler);
  return it == _handlerElements.end() ? nullptr : it->second;
}

FunctionPtr RouteTable::handler(std::string_view name) const {
  auto it = _handlers.find(name);
  return it == _handlers.end() ? nullptr : it->second;
}

void RouteTable::index(const std::shared_ptr<Element>& node) {
  auto addDelegation = [this](const DelegationPtr& delegation) {
    if (delegation && std::ranges::find(_delegations, delegation) == _delegations.end()) {
      _delegations.push_back(delegation);
    }
  };

  addDelegation(node->delegation());
  const ChildMaps& children = node->children();
  for (const auto& [ident, path] : children.paths) {
    index(path);
  }
  for (const auto& binding : children.bindings.ordered()) {
    index(binding);
  }
  for (const auto& [verb, method] : children.methods) {
    addDelegation(method->delegation());
    const FunctionPtr& fn = method->handler();
    if (!fn) {
      continue;
    }
    _handlerElements.emplace(fn.get(), node);
    auto [it, inserted] = _handlers.emplace(std::string(fn->name()), fn);
    if (!inserted && it->second != fn) {
      log::warn("Two handlers are named '{}', only the first one can be looked up by name", fn->name());
    }
  }
}

void RouteTable::checkNotSealed() const {
  if (_sealed) {
    throw std::logic_error("routing table is sealed");
  }
}

}  // namespace pathforge
