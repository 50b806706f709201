#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pathforge {

// Raised while building a routing tree. These always denote a programming error in a route definition.
class RouteDefinitionError : public std::logic_error {
 public:
  enum class Kind : std::uint8_t {
    IdentMismatch,
    TypeMismatch,
    ConflictingDelegation,
    StructuralMismatch,
    DuplicateDeclaration,
    IdentAlreadySet,
    InvalidAttachment,
    CyclicBindingOrder,
    MissingIdent,
  };

  RouteDefinitionError(Kind kind, const std::string& msg) : std::logic_error(msg), _kind(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  Kind _kind;
};

}  // namespace pathforge
