#include "pathforge/binding.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

#include "pathforge/function.hpp"
#include "pathforge/injector.hpp"
#include "pathforge/route-definition-error.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

Binding::Binding(std::optional<std::string> ident, NameSet before, NameSet after)
    : Element(Kind::Binding, std::move(ident)), _before(std::move(before)), _after(std::move(after)) {}

void Binding::setValidator(FunctionPtr validator) {
  if (leader()) {
    static_cast<Binding&>(authoritative()).setValidator(std::move(validator));
    return;
  }
  if (_validator) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::DuplicateDeclaration, "validator has already been set");
  }
  _validator = std::move(validator);
}

void Binding::setFormatter(Formatter formatter) {
  if (leader()) {
    static_cast<Binding&>(authoritative()).setFormatter(std::move(formatter));
    return;
  }
  if (_formatter) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::DuplicateDeclaration, "formatter has already been set");
  }
  _formatter = std::make_shared<const Formatter>(std::move(formatter));
}

std::optional<Value> Binding::validate(const Value& owner, Injector& injector, std::string_view segment) const {
  if (!_validator) {
    return Value(std::string(segment));
  }
  ValueMap overrides;
  overrides.emplace("value", std::string(segment));
  Value ret = injector.call(*_validator, {owner}, overrides);
  if (ret.type() == typeid(SkipBinding)) {
    return std::nullopt;
  }
  return ret;
}

std::optional<std::string> Binding::format(const Value& owner, const Value& value) const {
  if (_formatter) {
    return (*_formatter)(owner, value);
  }
  return ValueToString(value);
}

void Binding::checkMergeable(const Element& other) const {
  const auto& binding = static_cast<const Binding&>(other);
  if (_validator && binding._validator && _validator != binding._validator) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::DuplicateDeclaration,
                               "cannot merge binding \"" + ident().value_or("") + "\" with another validator");
  }
  if (_formatter && binding._formatter && _formatter != binding._formatter) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::DuplicateDeclaration,
                               "cannot merge binding \"" + ident().value_or("") + "\" with another formatter");
  }
}

void Binding::absorb(Element& other) {
  auto& binding = static_cast<Binding&>(other);
  _before.merge(binding._before);
  _after.merge(binding._after);
  if (!_validator) {
    _validator = std::move(binding._validator);
  }
  if (!_formatter) {
    _formatter = std::move(binding._formatter);
  }
}

std::shared_ptr<Element> Binding::cloneDetached() const {
  auto copy = std::make_shared<Binding>(ident(), _before, _after);
  copy->_validator = _validator;
  copy->_formatter = _formatter;
  return copy;
}

std::shared_ptr<Binding> MakeBinding(std::optional<std::string> ident, NameSet before, NameSet after) {
  return std::make_shared<Binding>(std::move(ident), std::move(before), std::move(after));
}

}  // namespace pathforge
