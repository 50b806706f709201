#pragma once

#include <memory>
#include <optional>
#include <string>

#include "pathforge/element.hpp"

namespace pathforge {

// Static segment, matching a path segment equal to its ident.
class Path : public Element {
 public:
  explicit Path(std::optional<std::string> ident = std::nullopt);

 protected:
  [[nodiscard]] std::shared_ptr<Element> cloneDetached() const override;
};

std::shared_ptr<Path> MakePath(std::optional<std::string> ident = std::nullopt);

}  // namespace pathforge
