#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pathforge/element.hpp"
#include "pathforge/function.hpp"

namespace pathforge {

// Leaf binding a verb (or, without verb, any verb lacking its own Method) to a handler.
// A Method without handler carries the delegation its verb is routed to.
class Method : public Element {
 public:
  // 'verb' is canonicalized to uppercase.
  Method(std::optional<std::string> verb, FunctionPtr handler);

  [[nodiscard]] const std::optional<std::string>& verb() const noexcept { return ident(); }

  [[nodiscard]] const FunctionPtr& handler() const noexcept { return _handler; }

  void setIdent(std::string ident) override;

  std::shared_ptr<Path> addPath(std::optional<std::string> ident = std::nullopt) override;

  std::shared_ptr<Binding> addBinding(std::optional<std::string> ident = std::nullopt, NameSet before = {},
                                      NameSet after = {}) override;

  std::shared_ptr<Method> addMethod(std::optional<std::string> verb, FunctionPtr handler) override;

  FunctionPtr route(std::vector<std::string> verbs, FunctionPtr handler) override;

  DelegationPtr mount(DelegationPtr delegation, std::vector<std::string> verbs = {}) override;

 protected:
  void checkMergeable(const Element& other) const override;

  [[nodiscard]] std::shared_ptr<Element> cloneDetached() const override;

 private:
  FunctionPtr _handler;
};

}  // namespace pathforge
