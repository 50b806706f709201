#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "pathforge/value.hpp"

namespace pathforge {

class Controller;
class Element;

// Mount point handing the remaining dispatch over to another controller.
// Each owning controller instance gets its own instance of the target controller, built once and kept until
// the owner is destroyed.
class Delegation : public std::enable_shared_from_this<Delegation> {
 public:
  using Factory = std::function<std::unique_ptr<Controller>(const ValueMap& kwargs)>;

  Delegation(std::string targetName, Factory factory, ValueMap kwargs = {});

  Delegation(const Delegation&) = delete;
  Delegation(Delegation&&) noexcept = delete;
  Delegation& operator=(const Delegation&) = delete;
  Delegation& operator=(Delegation&&) noexcept = delete;

  ~Delegation();

  [[nodiscard]] const std::string& targetName() const noexcept { return _targetName; }

  // Arguments given to the factory of the target controller.
  [[nodiscard]] const ValueMap& kwargs() const noexcept { return _kwargs; }

  // New target controller built by the factory, not attached to any owner.
  [[nodiscard]] std::unique_ptr<Controller> makeTarget() const;

  // Target controller of 'owner', constructed through Controller::constructDelegate on first access.
  Controller& get(Controller& owner);

  // Replaces the target controller of 'owner'.
  Controller& set(Controller& owner, std::unique_ptr<Controller> delegate);

  // Drops the target controller of 'owner'. Returns false if there was none.
  bool reset(const Controller& owner);

  [[nodiscard]] bool contains(const Controller& owner) const;

  // Element this delegation is mounted at, or nullptr.
  [[nodiscard]] std::shared_ptr<Element> element() const { return _element.lock(); }

  void setElement(const std::shared_ptr<Element>& element) { _element = element; }

  // New delegation with the same target and arguments, and an empty instance cache.
  [[nodiscard]] std::shared_ptr<Delegation> clone() const;

 private:
  Controller& install(Controller& owner, std::unique_ptr<Controller> delegate, bool replace);

  std::string _targetName;
  Factory _factory;
  ValueMap _kwargs;
  std::weak_ptr<Element> _element;
  mutable std::mutex _mutex;
  std::unordered_map<const Controller*, std::unique_ptr<Controller>> _instances;
};

using DelegationPtr = std::shared_ptr<Delegation>;

// Delegation to a new instance of T, built from the mount arguments if T is constructible from a ValueMap,
// default constructed otherwise.
template <class T>
DelegationPtr Mount(ValueMap kwargs = {}, std::string targetName = typeid(T).name()) {
  static_assert(std::is_base_of_v<Controller, T>, "T should be a Controller");
  return std::make_shared<Delegation>(
      std::move(targetName),
      [](const ValueMap& args) -> std::unique_ptr<Controller> {
        if constexpr (std::is_constructible_v<T, const ValueMap&>) {
          return std::make_unique<T>(args);
        } else {
          return std::make_unique<T>();
        }
      },
      std::move(kwargs));
}

}  // namespace pathforge
