#include "pathforge/delegation.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "pathforge/controller.hpp"
#include "pathforge/log.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

Delegation::Delegation(std::string targetName, Factory factory, ValueMap kwargs)
    : _targetName(std::move(targetName)), _factory(std::move(factory)), _kwargs(std::move(kwargs)) {
  if (!_factory) {
    throw std::invalid_argument("delegation to " + _targetName + " requires a factory");
  }
}

Delegation::~Delegation() = default;

std::unique_ptr<Controller> Delegation::makeTarget() const { return _factory(_kwargs); }

Controller& Delegation::get(Controller& owner) {
  {
    std::scoped_lock lock(_mutex);
    if (auto it = _instances.find(&owner); it != _instances.end()) {
      return *it->second;
    }
  }
  log::debug("Constructing delegate {} for controller {}", _targetName, static_cast<const void*>(&owner));
  return install(owner, owner.constructDelegate(*this), false);
}

Controller& Delegation::set(Controller& owner, std::unique_ptr<Controller> delegate) {
  return install(owner, std::move(delegate), true);
}

bool Delegation::reset(const Controller& owner) {
  std::unique_ptr<Controller> dropped;
  {
    std::scoped_lock lock(_mutex);
    auto it = _instances.find(&owner);
    if (it == _instances.end()) {
      return false;
    }
    dropped = std::move(it->second);
    _instances.erase(it);
  }
  // 'dropped' releases its own delegates on destruction, outside of the lock
  return true;
}

bool Delegation::contains(const Controller& owner) const {
  std::scoped_lock lock(_mutex);
  return _instances.contains(&owner);
}

std::shared_ptr<Delegation> Delegation::clone() const {
  auto ret = std::make_shared<Delegation>(_targetName, _factory, _kwargs);
  ret->_element = _element;
  return ret;
}

Controller& Delegation::install(Controller& owner, std::unique_ptr<Controller> delegate, bool replace) {
  if (!delegate) {
    throw std::logic_error("construction of delegate " + _targetName + " did not return a controller");
  }
  delegate->_parent = &owner;
  delegate->_mountElement = element();
  delegate->attachDelegates();

  std::unique_ptr<Controller> previous;
  Controller* ret;
  {
    std::scoped_lock lock(_mutex);
    auto [it, inserted] = _instances.try_emplace(&owner);
    if (inserted || replace) {
      previous = std::exchange(it->second, std::move(delegate));
    }
    ret = it->second.get();
  }
  owner.registerDelegation(shared_from_this());
  return *ret;
}

}  // namespace pathforge
