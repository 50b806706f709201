#include "pathforge/element.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/binding.hpp"
#include "pathforge/delegation.hpp"
#include "pathforge/function.hpp"
#include "pathforge/log.hpp"
#include "pathforge/method.hpp"
#include "pathforge/path.hpp"
#include "pathforge/route-definition-error.hpp"

namespace pathforge {

namespace {

std::string Describe(const std::optional<std::string>& ident) { return ident ? '"' + *ident + '"' : "<none>"; }

template <class Map>
auto Snapshot(const Map& map) {
  std::vector<typename Map::Map::mapped_type> ret;
  ret.reserve(map.size());
  for (const auto& [key, elem] : map) {
    ret.push_back(elem);
  }
  return ret;
}

}  // namespace

std::string_view ElementKindName(Element::Kind kind) noexcept {
  switch (kind) {
    case Element::Kind::Root:
      return "Root";
    case Element::Kind::Path:
      return "Path";
    case Element::Kind::Binding:
      return "Binding";
    case Element::Kind::Method:
      return "Method";
  }
  return "Unknown";
}

Element::Element(Kind kind, std::optional<std::string> ident)
    : _kind(kind), _ident(std::move(ident)), _children(std::make_shared<ChildMaps>()) {}

Element::~Element() = default;

void Element::setIdent(std::string ident) {
  if (_ident) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::IdentAlreadySet,
                               "ident has already been set to " + Describe(_ident));
  }
  _ident = std::move(ident);
  if (auto parentElem = parent()) {
    parentElem->insertChild(shared_from_this());
  }
}

DelegationPtr Element::delegation() const { return _leader ? _leader->delegation() : _delegation; }

Element& Element::authoritative() noexcept {
  Element* elem = this;
  while (elem->_leader) {
    elem = elem->_leader.get();
  }
  return *elem;
}

std::shared_ptr<Path> Element::addPath(std::optional<std::string> ident) {
  if (_leader) {
    return _leader->addPath(std::move(ident));
  }
  auto path = std::make_shared<Path>(std::move(ident));
  attach(path);
  return path;
}

std::shared_ptr<Binding> Element::addBinding(std::optional<std::string> ident, NameSet before, NameSet after) {
  if (_leader) {
    return _leader->addBinding(std::move(ident), std::move(before), std::move(after));
  }
  auto binding = std::make_shared<Binding>(std::move(ident), std::move(before), std::move(after));
  attach(binding);
  return binding;
}

std::shared_ptr<Method> Element::addMethod(std::optional<std::string> verb, FunctionPtr handler) {
  if (_leader) {
    return _leader->addMethod(std::move(verb), std::move(handler));
  }
  if (!handler) {
    throw std::invalid_argument("cannot route " + Describe(verb) + " to an empty handler");
  }
  auto method = std::make_shared<Method>(std::move(verb), std::move(handler));
  attach(method);
  return method;
}

FunctionPtr Element::route(std::vector<std::string> verbs, FunctionPtr handler) {
  if (verbs.empty()) {
    addMethod(std::nullopt, handler);
  }
  for (auto& verb : verbs) {
    addMethod(std::move(verb), handler);
  }
  return handler;
}

DelegationPtr Element::mount(DelegationPtr delegation, std::vector<std::string> verbs) {
  if (_leader) {
    return _leader->mount(std::move(delegation), std::move(verbs));
  }
  if (!delegation) {
    throw std::invalid_argument("cannot mount an empty delegation");
  }
  if (_delegation) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::ConflictingDelegation,
                               "delegation has already been set on " + Describe(_ident));
  }
  delegation->setElement(shared_from_this());
  if (verbs.empty()) {
    _delegation = delegation;
  }
  for (auto& verb : verbs) {
    auto method = std::make_shared<Method>(std::move(verb), nullptr);
    method->_delegation = delegation;
    attach(method);
  }
  return delegation;
}

void Element::attach(const std::shared_ptr<Element>& child) {
  child->_parent = weak_from_this();
  if (child->_ident || child->_kind == Kind::Method) {
    insertChild(child);
  }
}

void Element::insertChild(const std::shared_ptr<Element>& child) {
  switch (child->_kind) {
    case Kind::Path:
      _children->paths.insert(std::static_pointer_cast<Path>(child));
      break;
    case Kind::Binding:
      _children->bindings.insert(std::static_pointer_cast<Binding>(child));
      break;
    case Kind::Method:
      _children->methods.insert(std::static_pointer_cast<Method>(child));
      break;
    default:
      throw RouteDefinitionError(RouteDefinitionError::Kind::InvalidAttachment,
                                 "cannot attach a " + std::string(ElementKindName(child->_kind)) + " to an element");
  }
}

void Element::checkMerge(const Element& other) const {
  if (other._kind != _kind) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::TypeMismatch,
                               "cannot merge " + std::string(ElementKindName(_kind)) + " and " +
                                   std::string(ElementKindName(other._kind)));
  }
  if (other._ident != _ident) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::IdentMismatch,
                               "cannot merge with unequal idents " + Describe(_ident) + " and " +
                                   Describe(other._ident));
  }
  if (_delegation && other._delegation && _delegation != other._delegation) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::ConflictingDelegation,
                               "cannot merge " + Describe(_ident) + " due to conflicting delegations");
  }
  checkMergeable(other);
  if (_children == other._children) {
    return;
  }

  // children of 'other' colliding with ours will be merged as well
  auto checkCollisions = [](const auto& mine, const auto& theirs) {
    for (const auto& [key, theirElem] : theirs) {
      auto myElem = mine.find(key);
      if (!myElem || myElem == theirElem) {
        continue;
      }
      Element& myLeader = static_cast<Element&>(*myElem).authoritative();
      Element& theirLeader = static_cast<Element&>(*theirElem).authoritative();
      if (&myLeader != &theirLeader) {
        myLeader.checkMerge(theirLeader);
      }
    }
  };
  checkCollisions(_children->paths, other._children->paths);
  checkCollisions(_children->bindings, other._children->bindings);
  checkCollisions(_children->methods, other._children->methods);
}

void Element::merge(Element& other) {
  if (_leader) {
    _leader->merge(other);
    return;
  }
  Element& otherLeader = other.authoritative();
  if (&otherLeader == this) {
    // already merged: only shortcut the leader chain of 'other'
    auto self = shared_from_this();
    for (auto elem = other.shared_from_this(); elem != self;) {
      auto next = elem->_leader;
      elem->_leader = self;
      elem = std::move(next);
    }
    return;
  }
  // nothing is modified before the whole merge is known to succeed
  checkMerge(otherLeader);

  auto myParent = parent();
  auto otherParent = other.parent();
  if (myParent && otherParent) {
    Element& myParentLeader = myParent->authoritative();
    Element& otherParentLeader = otherParent->authoritative();
    if (&myParentLeader != &otherParentLeader) {
      // merging the parents re-inserts 'other' next to this element, merging both
      myParentLeader.merge(otherParentLeader);
      return;
    }
  } else if (myParent || otherParent) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::StructuralMismatch,
                               "cannot merge elements " + Describe(_ident) + " at different places in the tree");
  }

  auto self = shared_from_this();
  std::shared_ptr<Element> target = other.shared_from_this();
  while (target->_leader) {
    auto next = target->_leader;
    target->_leader = self;
    target = std::move(next);
  }

  log::trace("Merging {} {}", ElementKindName(_kind), Describe(_ident));

  std::shared_ptr<ChildMaps> theirs = target->_children;
  if (theirs != _children) {
    const std::weak_ptr<Element> weakSelf = self;
    for (const auto& path : Snapshot(theirs->paths)) {
      path->_parent = weakSelf;
      _children->paths.insert(path);
    }
    for (const auto& binding : Snapshot(theirs->bindings)) {
      binding->_parent = weakSelf;
      _children->bindings.insert(binding);
    }
    for (const auto& method : Snapshot(theirs->methods)) {
      method->_parent = weakSelf;
      _children->methods.insert(method);
    }
    target->_children = _children;
  }

  absorb(*target);
  if (target->_delegation) {
    _delegation = std::move(target->_delegation);
  }
  repointMounts(*target);
  target->_leader = std::move(self);
}

void Element::repointMounts(const Element& alias) {
  auto repoint = [this, &alias](const DelegationPtr& delegation) {
    if (delegation && delegation->element().get() == &alias) {
      delegation->setElement(shared_from_this());
    }
  };
  repoint(_delegation);
  // verb restricted mounts are held by the methods of the mount element
  for (const auto& [verb, method] : _children->methods) {
    repoint(static_cast<const Element&>(*method)._delegation);
  }
}

std::shared_ptr<Element> Element::cloneTree(ElementCopies& copies) const {
  auto copy = cloneDetached();
  copy->_delegation = _delegation;
  copies.emplace(this, copy);
  for (const auto& [ident, path] : _children->paths) {
    copy->attach(path->cloneTree(copies));
  }
  for (const auto& [ident, binding] : _children->bindings) {
    copy->attach(binding->cloneTree(copies));
  }
  for (const auto& [verb, method] : _children->methods) {
    copy->attach(method->cloneTree(copies));
  }
  return copy;
}

}  // namespace pathforge
