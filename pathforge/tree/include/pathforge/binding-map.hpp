#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pathforge/merging-map.hpp"

namespace pathforge {

class Binding;

// Bindings of a node, iterated in the order they should be tried against a path segment.
// The order satisfies every 'before' / 'after' constraint between siblings; unconstrained bindings
// are tried in ascending ident order.
class BindingMap : public MergingMap<std::string, Binding> {
 public:
  void insert(const std::shared_ptr<Binding>& binding);

  // Computed on first call after an insertion.
  // Throws RouteDefinitionError (CyclicBindingOrder) if the constraints cannot be satisfied.
  [[nodiscard]] const std::vector<std::shared_ptr<Binding>>& ordered() const;

 private:
  mutable std::optional<std::vector<std::shared_ptr<Binding>>> _order;
};

}  // namespace pathforge
