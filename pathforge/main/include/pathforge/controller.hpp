#pragma once

#include <any>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/delegation.hpp"
#include "pathforge/dispatch-result.hpp"
#include "pathforge/element.hpp"
#include "pathforge/function.hpp"
#include "pathforge/injection-error.hpp"
#include "pathforge/injector.hpp"
#include "pathforge/path-info.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

class RouteTable;

// Instance of a router type. The routing tree is shared by all instances of a type (see RouteTable), while
// delegated controllers are owned per instance.
// Handlers and validators are invoked with the controller (as a Controller*) as first positional argument.
class Controller {
 public:
  Controller(const Controller&) = delete;
  Controller(Controller&&) noexcept = delete;
  Controller& operator=(const Controller&) = delete;
  Controller& operator=(Controller&&) noexcept = delete;

  virtual ~Controller();

  [[nodiscard]] virtual const RouteTable& routes() const = 0;

  // Entry point of a request: dispatches 'path' within a cleanup scope of 'injector', after having seeded it with
  // this controller (as root controller) and with the values already present in 'bindings'.
  // Variables bound while walking the path are added to 'bindings'.
  DispatchResult handle(std::string_view path, std::string_view verb, Injector& injector, ValueMap& bindings);

  DispatchResult handle(std::string_view path, std::string_view verb, Injector& injector);

  // Walks the routing tree from its root, consuming 'pathInfo', and invokes the selected handler or recurses into
  // the selected delegation.
  DispatchResult dispatch(PathInfo& pathInfo, std::string_view verb, Injector& injector, ValueMap& bindings);

  // Controller this one is mounted on, or nullptr for a top-level controller.
  [[nodiscard]] Controller* parent() const noexcept { return _parent; }

  // Element of the parent routing tree this controller is mounted at, or nullptr for a top-level controller.
  [[nodiscard]] const std::shared_ptr<Element>& mountElement() const noexcept { return _mountElement; }

  // Constructs the delegated controllers of this instance (recursively) for every delegation of its routing tree.
  void attachDelegates();

  // Builds the controller 'delegation' hands dispatch over to on behalf of this instance.
  // Defaults to the delegation factory.
  [[nodiscard]] virtual std::unique_ptr<Controller> constructDelegate(const Delegation& delegation);

 protected:
  Controller() noexcept = default;

 private:
  friend class Delegation;

  void registerDelegation(const DelegationPtr& delegation);

  Controller* _parent{nullptr};
  std::shared_ptr<Element> _mountElement;
  std::mutex _delegationsMutex;
  std::vector<DelegationPtr> _delegations;
};

// Creates a controller with its delegated controllers already constructed, so that concurrent dispatches never
// have to construct them.
template <class T, class... Args>
std::unique_ptr<T> MakeController(Args&&... args) {
  auto ret = std::make_unique<T>(std::forward<Args>(args)...);
  ret->attachDelegates();
  return ret;
}

// Controller bound to a handler or validator invocation.
// Throws InjectionError (BadArgumentType) if it is not an instance of T.
template <class T>
T& ControllerOf(const CallArgs& args) {
  Controller* const* ptr = nullptr;
  if (!args.positional().empty()) {
    ptr = std::any_cast<Controller*>(&args.positional().front());
  }
  T* ret = ptr == nullptr ? nullptr : dynamic_cast<T*>(*ptr);
  if (ret == nullptr) {
    throw InjectionError(InjectionError::Kind::BadArgumentType, "first argument is not the expected controller");
  }
  return *ret;
}

}  // namespace pathforge
