#pragma once

#include <memory>
#include <optional>
#include <string>

#include "pathforge/element.hpp"

namespace pathforge {

// Top of a routing tree, matching the empty path.
class Root : public Element {
 public:
  Root();

  void setIdent(std::string ident) override;

  // Registers a free-standing element (and the branch it belongs to) in this tree.
  // Walking up from 'elem', the first element without ident receives 'ident'. The top-most ancestor is then
  // inserted as a child of this root, or merged into it if it is a Root itself.
  // Throws RouteDefinitionError (MissingIdent) if that ancestor still has no ident.
  void addElement(const std::shared_ptr<Element>& elem, std::optional<std::string> ident = std::nullopt);

  // Deep copy of this tree. Mounted delegations are copied as well, with their own instance cache.
  [[nodiscard]] std::shared_ptr<Root> clone() const;

 protected:
  [[nodiscard]] std::shared_ptr<Element> cloneDetached() const override;
};

std::shared_ptr<Root> MakeRoot();

}  // namespace pathforge
