#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pathforge/element.hpp"
#include "pathforge/function.hpp"
#include "pathforge/injector.hpp"
#include "pathforge/value.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

// Returned (held in a Value) by a Binding validator to decline a path segment, letting the next Binding try it.
struct SkipBinding {};

// Converts the value of a Binding back into a path segment. Receives the owning controller and the value.
using Formatter = std::function<std::string(const Value& owner, const Value& value)>;

// Variable segment. Its value is the raw segment text, or the result of its validator if one is set.
// Two Bindings compare by ident only.
class Binding : public Element {
 public:
  explicit Binding(std::optional<std::string> ident = std::nullopt, NameSet before = {}, NameSet after = {});

  // Idents of sibling bindings to try after this one.
  [[nodiscard]] const NameSet& before() const noexcept { return _before; }

  // Idents of sibling bindings to try before this one.
  [[nodiscard]] const NameSet& after() const noexcept { return _after; }

  [[nodiscard]] const FunctionPtr& validator() const noexcept { return _validator; }

  [[nodiscard]] bool hasFormatter() const noexcept { return _formatter != nullptr; }

  // The validator is invoked with the owning controller as first positional argument and the raw segment
  // under the name 'value'. Throws RouteDefinitionError (DuplicateDeclaration) if already set.
  void setValidator(FunctionPtr validator);

  // Throws RouteDefinitionError (DuplicateDeclaration) if already set.
  void setFormatter(Formatter formatter);

  // Returns the value bound to 'segment', or std::nullopt if the validator declined it.
  [[nodiscard]] std::optional<Value> validate(const Value& owner, Injector& injector, std::string_view segment) const;

  // Returns the path segment for 'value', or std::nullopt if there is no formatter and 'value' is neither a string
  // nor an integral.
  [[nodiscard]] std::optional<std::string> format(const Value& owner, const Value& value) const;

  bool operator==(const Binding& other) const noexcept { return ident() == other.ident(); }
  auto operator<=>(const Binding& other) const noexcept { return ident() <=> other.ident(); }

 protected:
  void checkMergeable(const Element& other) const override;

  void absorb(Element& other) override;

  [[nodiscard]] std::shared_ptr<Element> cloneDetached() const override;

 private:
  NameSet _before;
  NameSet _after;
  FunctionPtr _validator;
  std::shared_ptr<const Formatter> _formatter;
};

std::shared_ptr<Binding> MakeBinding(std::optional<std::string> ident = std::nullopt, NameSet before = {},
                                     NameSet after = {});

}  // namespace pathforge
