#include "pathforge/inject.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/function.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

bool Wants(const Function& fn, std::string_view name) { return fn.signature().wants(name); }

Value CallWrapped(const Function& fn, std::vector<Value> positional, const ValueMap& values) {
  ValueMapSource source(values);
  return fn.signature().invoke(fn, std::move(positional), source);
}

SignatureOverrides Narrowed(std::vector<std::string> required, std::vector<std::string> optional) {
  SignatureOverrides ret;
  ret.required = std::move(required);
  ret.optional = std::move(optional);
  return ret;
}

SignatureOverrides Wraps(FunctionPtr wrapped, std::vector<std::string> provides) {
  SignatureOverrides ret = Narrowed({}, {});
  ret.wrapped = std::move(wrapped);
  ret.provides = std::move(provides);
  return ret;
}

}  // namespace pathforge
