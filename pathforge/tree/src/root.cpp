#include "pathforge/root.hpp"

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "pathforge/delegation.hpp"
#include "pathforge/route-definition-error.hpp"

namespace pathforge {

Root::Root() : Element(Kind::Root, std::nullopt) {}

void Root::setIdent([[maybe_unused]] std::string ident) {
  throw RouteDefinitionError(RouteDefinitionError::Kind::IdentAlreadySet, "a root element has no ident");
}

void Root::addElement(const std::shared_ptr<Element>& elem, std::optional<std::string> ident) {
  std::unordered_set<const Element*> seen;
  std::shared_ptr<Element> top = elem;
  while (true) {
    if (!seen.insert(top.get()).second) {
      throw std::logic_error("loop detected while walking up the routing tree");
    }
    if (top.get() == this) {
      // already registered
      return;
    }
    if (top->kind() == Kind::Root) {
      merge(*top);
      return;
    }
    if (top->kind() != Kind::Method && !top->ident() && ident) {
      top->setIdent(std::move(*ident));
      ident.reset();
    }
    auto parentElem = top->parent();
    if (!parentElem) {
      break;
    }
    top = std::move(parentElem);
  }

  if (!top->ident() && top->kind() != Kind::Method) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::MissingIdent,
                               "cannot register a " + std::string(ElementKindName(top->kind())) +
                                   " without ident");
  }
  attach(top);
}

std::shared_ptr<Root> Root::clone() const {
  ElementCopies copies;
  auto copy = std::static_pointer_cast<Root>(cloneTree(copies));

  // Copies refer to the original delegations so far: give them their own, mounted on the copied elements.
  std::map<const Delegation*, DelegationPtr> delegations;
  for (const auto& [original, elemCopy] : copies) {
    if (!elemCopy->_delegation) {
      continue;
    }
    DelegationPtr& delegationCopy = delegations[elemCopy->_delegation.get()];
    if (!delegationCopy) {
      delegationCopy = elemCopy->_delegation->clone();
      if (auto mountedAt = elemCopy->_delegation->element()) {
        if (auto it = copies.find(mountedAt.get()); it != copies.end()) {
          delegationCopy->setElement(it->second);
        }
      }
    }
    elemCopy->_delegation = delegationCopy;
  }
  return copy;
}

std::shared_ptr<Element> Root::cloneDetached() const { return std::make_shared<Root>(); }

std::shared_ptr<Root> MakeRoot() { return std::make_shared<Root>(); }

}  // namespace pathforge
