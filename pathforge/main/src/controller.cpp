#include "pathforge/controller.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/ascii-upper.hpp"
#include "pathforge/binding.hpp"
#include "pathforge/delegation.hpp"
#include "pathforge/dispatch-result.hpp"
#include "pathforge/element.hpp"
#include "pathforge/injector.hpp"
#include "pathforge/log.hpp"
#include "pathforge/method.hpp"
#include "pathforge/path-info.hpp"
#include "pathforge/path.hpp"
#include "pathforge/route-table.hpp"
#include "pathforge/router-config.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

namespace {

constexpr std::string_view kGet = "GET";
constexpr std::string_view kHead = "HEAD";
constexpr std::string_view kOptions = "OPTIONS";

std::shared_ptr<Method> SelectMethod(const ChildMaps& children, const std::string& verb, const RouterConfig& config) {
  const auto& methods = children.methods;
  // HEAD is looked up as GET unless configured otherwise
  const std::string_view lookup = verb == kHead && config.headFallsBackToGet ? kGet : std::string_view(verb);
  if (auto method = methods.find(std::optional<std::string>(lookup))) {
    return method;
  }
  return methods.find(std::optional<std::string>());
}

std::vector<std::string> AvailableVerbs(const ChildMaps& children, const RouterConfig& config) {
  std::set<std::string, std::less<>> verbs;
  for (const auto& [verb, method] : children.methods) {
    if (verb) {
      verbs.insert(*verb);
    } else {
      verbs.insert(config.fallbackVerbs.begin(), config.fallbackVerbs.end());
    }
  }
  if (verbs.contains(kGet)) {
    verbs.emplace(kHead);
  }
  verbs.emplace(kOptions);
  return {verbs.begin(), verbs.end()};
}

}  // namespace

Controller::~Controller() {
  for (const auto& delegation : _delegations) {
    delegation->reset(*this);
  }
}

DispatchResult Controller::handle(std::string_view path, std::string_view verb, Injector& injector,
                                  ValueMap& bindings) {
  auto scope = injector.cleanup();
  injector.set(routes().config().rootControllerKey, Value(this));
  for (const auto& [name, value] : bindings) {
    if (!injector.contains(name)) {
      injector.set(name, value);
    }
  }
  PathInfo pathInfo{std::string(path)};
  return dispatch(pathInfo, verb, injector, bindings);
}

DispatchResult Controller::handle(std::string_view path, std::string_view verb, Injector& injector) {
  ValueMap bindings;
  return handle(path, verb, injector, bindings);
}

DispatchResult Controller::dispatch(PathInfo& pathInfo, std::string_view verb, Injector& injector,
                                    ValueMap& bindings) {
  const RouteTable& table = routes();
  const RouterConfig& config = table.config();
  const Value self(this);
  const std::string canonicalVerb = ToUpperAscii(verb);

  std::shared_ptr<const Element> node = table.root();
  bool exhausted = true;
  for (std::string_view segment = pathInfo.peek(); !segment.empty(); segment = pathInfo.peek()) {
    if (auto path = node->children().paths.find(segment)) {
      node = std::move(path);
      pathInfo.pop();
      continue;
    }
    std::shared_ptr<const Element> matched;
    for (const auto& binding : node->children().bindings.ordered()) {
      auto value = binding->validate(self, injector, segment);
      if (!value) {
        log::trace("Binding \"{}\" skipped segment '{}'", binding->ident().value_or(""), segment);
        continue;
      }
      const std::string& name = *binding->ident();
      if (!injector.contains(name)) {
        injector.set(name, *value);
      }
      bindings.insert_or_assign(name, std::move(*value));
      matched = binding;
      break;
    }
    if (!matched) {
      exhausted = false;
      break;
    }
    node = std::move(matched);
    pathInfo.pop();
  }

  const ChildMaps& children = node->children();
  auto method = SelectMethod(children, canonicalVerb, config);
  FunctionPtr handler = method ? method->handler() : nullptr;
  DelegationPtr target = method ? method->delegation() : nullptr;
  if (!target) {
    target = node->delegation();
  }

  if (handler) {
    const bool wantsPathInfo = handler->signature().wants(config.pathInfoKey);
    if (exhausted || wantsPathInfo) {
      log::debug("Dispatching {} '{}' to handler {}", canonicalVerb, pathInfo.consumed(), handler->name());
      ValueMap overrides;
      if (wantsPathInfo) {
        overrides.emplace(config.pathInfoKey, std::string(pathInfo.remaining()));
      }
      return DispatchResult::Handled(injector.call(*handler, {self}, overrides));
    }
  }
  if (target) {
    log::debug("Delegating {} '{}' to {}", canonicalVerb, pathInfo.remaining(), target->targetName());
    return target->get(*this).dispatch(pathInfo, canonicalVerb, injector, bindings);
  }
  if (!exhausted || children.methods.empty()) {
    log::debug("No route for {} '{}'", canonicalVerb, pathInfo.path());
    return DispatchResult::NotFound();
  }
  if (canonicalVerb == kOptions && config.synthesizeOptions) {
    return DispatchResult::Options(AvailableVerbs(children, config));
  }
  return DispatchResult::NotImplemented(canonicalVerb);
}

void Controller::attachDelegates() {
  for (const auto& delegation : routes().delegations()) {
    delegation->get(*this);
  }
}

std::unique_ptr<Controller> Controller::constructDelegate(const Delegation& delegation) {
  return delegation.makeTarget();
}

void Controller::registerDelegation(const DelegationPtr& delegation) {
  std::scoped_lock lock(_delegationsMutex);
  if (std::ranges::find(_delegations, delegation) == _delegations.end()) {
    _delegations.push_back(delegation);
  }
}

}  // namespace pathforge
