#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pathforge/function.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

// Tells whether 'fn' wants a value named 'name'.
bool Wants(const Function& fn, std::string_view name);

// Calls a wrapped Function from within its wrapper, passing only the values of 'values' it wants.
// Values the wrapper declared to provide must be present in 'values'.
Value CallWrapped(const Function& fn, std::vector<Value> positional, const ValueMap& values);

// Overrides restricting a Function taking VarKeywords to the given names.
SignatureOverrides Narrowed(std::vector<std::string> required, std::vector<std::string> optional = {});

// Overrides for a Function wrapping 'wrapped' and supplying it with the 'provides' names.
// The wrapper gets the wanted names of 'wrapped' (except the provided ones), and no longer every available value.
SignatureOverrides Wraps(FunctionPtr wrapped, std::vector<std::string> provides = {});

}  // namespace pathforge
