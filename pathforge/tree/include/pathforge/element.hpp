#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pathforge/binding-map.hpp"
#include "pathforge/function.hpp"
#include "pathforge/merging-map.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

class Binding;
class Delegation;
class Element;
class Method;
class Path;

using DelegationPtr = std::shared_ptr<Delegation>;

// Children of a routing node. Shared between a node and the nodes merged into it.
struct ChildMaps {
  MergingMap<std::string, Path> paths;
  BindingMap bindings;
  // std::nullopt is the fallback method, used for any verb without a dedicated entry.
  MergingMap<std::optional<std::string>, Method> methods;
};

// Node of a routing tree.
// Parents are referenced weakly and own their children. A node merged into another one (see merge()) stays
// valid as an alias: it shares the children of its leader and forwards building operations to it.
class Element : public std::enable_shared_from_this<Element> {
 public:
  enum class Kind : std::uint8_t { Root, Path, Binding, Method };

  Element(const Element&) = delete;
  Element(Element&&) noexcept = delete;
  Element& operator=(const Element&) = delete;
  Element& operator=(Element&&) noexcept = delete;

  virtual ~Element();

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  // Segment text for a Path, variable name for a Binding, verb for a Method.
  // Empty for a Root, for the fallback Method and for elements whose ident has not been set yet.
  [[nodiscard]] const std::optional<std::string>& ident() const noexcept { return _ident; }

  // Sets the ident of an element created without one, and registers it in its parent if any.
  // Throws RouteDefinitionError (IdentAlreadySet) if already set.
  virtual void setIdent(std::string ident);

  [[nodiscard]] std::shared_ptr<Element> parent() const { return _parent.lock(); }

  [[nodiscard]] const ChildMaps& children() const noexcept { return *_children; }

  [[nodiscard]] DelegationPtr delegation() const;

  // Element this one has been merged into, or nullptr.
  [[nodiscard]] const std::shared_ptr<Element>& leader() const noexcept { return _leader; }

  virtual std::shared_ptr<Path> addPath(std::optional<std::string> ident = std::nullopt);

  virtual std::shared_ptr<Binding> addBinding(std::optional<std::string> ident = std::nullopt, NameSet before = {},
                                              NameSet after = {});

  // Registers 'handler' for 'verb' (canonicalized to uppercase), or as fallback method if 'verb' is empty.
  virtual std::shared_ptr<Method> addMethod(std::optional<std::string> verb, FunctionPtr handler);

  // Registers 'handler' for each of 'verbs', or as fallback method if 'verbs' is empty. Returns 'handler'.
  virtual FunctionPtr route(std::vector<std::string> verbs, FunctionPtr handler);

  // Hands the dispatch of this node over to 'delegation'. If 'verbs' are given, only these verbs are delegated.
  // Throws RouteDefinitionError (ConflictingDelegation) if a delegation was already mounted here.
  virtual DelegationPtr mount(DelegationPtr delegation, std::vector<std::string> verbs = {});

  // Merges 'other' into this element: children of 'other' are re-inserted here (recursively merging on collisions)
  // and 'other' becomes an alias of this element. Elements with different parents get their parents merged first.
  void merge(Element& other);

 protected:
  Element(Kind kind, std::optional<std::string> ident);

  // Type specific validation of a merge of 'other' (same kind as this) into this element.
  virtual void checkMergeable([[maybe_unused]] const Element& other) const {}

  // Takes over the type specific payload of 'other' (same kind as this) being merged into this element.
  virtual void absorb([[maybe_unused]] Element& other) {}

  // Returns a new element of the same kind and payload, without parent nor children.
  [[nodiscard]] virtual std::shared_ptr<Element> cloneDetached() const = 0;

  // Parents 'child' to this element and registers it in the children maps, unless its ident is not yet known.
  void attach(const std::shared_ptr<Element>& child);

  // Element at the end of the leader chain.
  [[nodiscard]] Element& authoritative() noexcept;

 private:
  friend class Root;

  using ElementCopies = std::map<const Element*, std::shared_ptr<Element>>;

  void insertChild(const std::shared_ptr<Element>& child);

  // Throws the RouteDefinitionError merge(other) would throw, for this element and all colliding descendants.
  void checkMerge(const Element& other) const;

  // Mounts still referring to 'alias', merged into this element, are moved here.
  void repointMounts(const Element& alias);

  std::shared_ptr<Element> cloneTree(ElementCopies& copies) const;

  Kind _kind;
  std::optional<std::string> _ident;
  std::weak_ptr<Element> _parent;
  std::shared_ptr<ChildMaps> _children;
  DelegationPtr _delegation;
  std::shared_ptr<Element> _leader;
};

std::string_view ElementKindName(Element::Kind kind) noexcept;

}  // namespace pathforge
