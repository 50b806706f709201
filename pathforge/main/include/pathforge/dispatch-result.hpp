#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pathforge/value.hpp"

namespace pathforge {

// Outcome of the dispatch of a request. Only 'Handled' carries a handler result; the other kinds are left to the
// transport layer to turn into responses.
struct DispatchResult {
  enum class Kind : std::uint8_t { Handled, NotFound, NotImplemented, Options };

  static DispatchResult Handled(Value value) {
    DispatchResult ret(Kind::Handled);
    ret.value = std::move(value);
    return ret;
  }

  static DispatchResult NotFound() { return DispatchResult(Kind::NotFound); }

  static DispatchResult NotImplemented(std::string verb) {
    DispatchResult ret(Kind::NotImplemented);
    ret.verb = std::move(verb);
    return ret;
  }

  static DispatchResult Options(std::vector<std::string> verbs) {
    DispatchResult ret(Kind::Options);
    ret.verbs = std::move(verbs);
    return ret;
  }

  // Comma separated list of 'verbs', as expected in an Allow header.
  [[nodiscard]] std::string allowHeader() const;

  Kind kind;
  // Result of the handler, for 'Handled'
  Value value;
  // Requested verb, for 'NotImplemented'
  std::string verb;
  // Available verbs in ascending order, for 'Options'
  std::vector<std::string> verbs;

 private:
  explicit DispatchResult(Kind kind) : kind(kind) {}
};

}  // namespace pathforge
