#include "pathforge/function.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <string_view>
#include <utility>

#include "pathforge/want-signature.hpp"

namespace pathforge {

const Value* CallArgs::find(std::string_view name) const {
  const auto orderIt = std::ranges::find(_order, name);
  if (orderIt != _order.end()) {
    const auto pos = static_cast<std::size_t>(std::distance(_order.begin(), orderIt));
    if (pos < _positional.size()) {
      return &_positional[pos];
    }
  }
  auto it = _keywords.find(name);
  return it == _keywords.end() ? nullptr : &it->second;
}

Function::Function(std::string name, std::vector<Param> params, Body body, SignatureOverrides overrides)
    : _name(std::move(name)), _params(std::move(params)), _body(std::move(body)), _overrides(std::move(overrides)) {}

const WantSignature& Function::signature() const {
  std::call_once(_signatureOnce, [this] { _signature.emplace(WantSignature::Of(*this)); });
  return *_signature;
}

}  // namespace pathforge
