#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pathforge {

// Raised when a Function cannot be invoked with the values at hand.
class InjectionError : public std::invalid_argument {
 public:
  enum class Kind : std::uint8_t {
    TooManyPositional,
    MissingRequired,
    SignatureOverlap,
    DeferredCycle,
    BadArgumentType,
  };

  InjectionError(Kind kind, const std::string& msg) : std::invalid_argument(msg), _kind(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  Kind _kind;
};

}  // namespace pathforge
