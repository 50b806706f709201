#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "pathforge/value.hpp"

namespace pathforge {

class Function;

using NameSet = std::set<std::string, std::less<>>;

// Describes which named arguments a Function wants, and invokes it with exactly those.
//  - order        : names of the parameters that can be passed positionally, in declaration order
//  - required     : keyword-capable parameters without a default
//  - optional     : keyword-capable parameters with a default
//  - allPositional: the Function accepts any number of extra positional values
//  - allKeywords  : the Function accepts any named value
class WantSignature {
 public:
  // Throws InjectionError (SignatureOverlap) if 'required' and 'optional' share a name.
  WantSignature(std::vector<std::string> order, NameSet required, NameSet optional, bool allPositional,
                bool allKeywords);

  // Computes the signature of 'fn' from its parameter list and its SignatureOverrides.
  // Prefer Function::signature(), which memoizes the result.
  static WantSignature Of(const Function& fn);

  [[nodiscard]] const std::vector<std::string>& order() const noexcept { return _order; }
  [[nodiscard]] const NameSet& required() const noexcept { return _required; }
  [[nodiscard]] const NameSet& optional() const noexcept { return _optional; }
  [[nodiscard]] bool allPositional() const noexcept { return _allPositional; }
  [[nodiscard]] bool allKeywords() const noexcept { return _allKeywords; }

  // Tells whether the Function would receive a value named 'name' if one were available.
  [[nodiscard]] bool wants(std::string_view name) const;

  // Calls 'fn' with 'positional' followed by the named values it wants, looked up in 'overrides' first
  // and then in 'available'. Names already covered by a positional value are not looked up.
  // Throws InjectionError (TooManyPositional, MissingRequired).
  Value invoke(const Function& fn, std::vector<Value> positional, ValueSource& available,
               const ValueMap& overrides = {}) const;

 private:
  std::vector<std::string> _order;
  NameSet _required;
  NameSet _optional;
  bool _allPositional;
  bool _allKeywords;
};

}  // namespace pathforge
