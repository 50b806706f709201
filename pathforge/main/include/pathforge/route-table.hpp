#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pathforge/controller.hpp"
#include "pathforge/delegation.hpp"
#include "pathforge/element.hpp"
#include "pathforge/function.hpp"
#include "pathforge/root.hpp"
#include "pathforge/router-config.hpp"

namespace pathforge {

// Routing tree of a router type, with its configuration.
// Built once, then sealed: a sealed table is only read, and can be shared by concurrent dispatches.
class RouteTable {
 public:
  explicit RouteTable(RouterConfig config = {});

  [[nodiscard]] const std::shared_ptr<Root>& root() const noexcept { return _root; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Merges a copy of the routes of 'base' into this table. The routes of 'base' are left untouched.
  RouteTable& extend(const RouteTable& base);

  // Registers a free-standing element. See Root::addElement.
  RouteTable& add(const std::shared_ptr<Element>& elem, std::optional<std::string> ident = std::nullopt);

  // Validates the configuration, computes the try order of all bindings, and indexes delegations and handlers.
  // Throws std::invalid_argument for an invalid configuration, RouteDefinitionError for an invalid tree.
  void seal();

  [[nodiscard]] bool sealed() const noexcept { return _sealed; }

  // Every delegation mounted in the tree. Available once sealed.
  [[nodiscard]] const std::vector<DelegationPtr>& delegations() const noexcept { return _delegations; }

  // Element whose methods route to 'handler', or nullptr. Available once sealed.
  [[nodiscard]] std::shared_ptr<Element> handlerElement(const Function& handler) const;

  // Handler registered under 'name', or nullptr. Available once sealed.
  [[nodiscard]] FunctionPtr handler(std::string_view name) const;

 private:
  void index(const std::shared_ptr<Element>& node);

  void checkNotSealed() const;

  std::shared_ptr<Root> _root;
  RouterConfig _config;
  std::vector<DelegationPtr> _delegations;
  std::unordered_map<const Function*, std::shared_ptr<Element>> _handlerElements;
  std::map<std::string, FunctionPtr, std::less<>> _handlers;
  bool _sealed{false};
};

// Base of controller types, holding the RouteTable of Derived, built on first use from:
//  - static void Derived::DefineRoutes(RouteTable &)
//  - static RouterConfig Derived::Config(), if declared
template <class Derived>
class RoutedController : public Controller {
 public:
  static const RouteTable& Routes() {
    static const RouteTable table = [] {
      RouteTable ret = MakeTable();
      Derived::DefineRoutes(ret);
      ret.seal();
      return ret;
    }();
    return table;
  }

  [[nodiscard]] const RouteTable& routes() const override { return Routes(); }

 private:
  static RouteTable MakeTable() {
    if constexpr (requires { Derived::Config(); }) {
      return RouteTable(Derived::Config());
    } else {
      return RouteTable();
    }
  }
};

}  // namespace pathforge
