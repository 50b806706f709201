#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/injection-error.hpp"
#include "pathforge/value.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

class Function;

using FunctionPtr = std::shared_ptr<const Function>;

// Declared parameter of a Function, the unit from which its WantSignature is computed.
struct Param {
  enum class Kind : std::uint8_t { PositionalOnly, PositionalOrKeyword, KeywordOnly, VarPositional, VarKeyword };

  static Param Positional(std::string name) { return {std::move(name), Kind::PositionalOrKeyword, false}; }
  static Param Defaulted(std::string name) { return {std::move(name), Kind::PositionalOrKeyword, true}; }
  static Param PositionalOnly(std::string name) { return {std::move(name), Kind::PositionalOnly, false}; }
  static Param Keyword(std::string name, bool hasDefault = false) {
    return {std::move(name), Kind::KeywordOnly, hasDefault};
  }
  static Param VarArgs(std::string name = "args") { return {std::move(name), Kind::VarPositional, false}; }
  static Param VarKeywords(std::string name = "kwargs") { return {std::move(name), Kind::VarKeyword, false}; }

  std::string name;
  Kind kind{Kind::PositionalOrKeyword};
  bool hasDefault{false};
};

// Adjustments applied on top of the signature derived from the parameter list.
struct SignatureOverrides {
  // Function this one wraps: its required and optional names are added to ours.
  FunctionPtr wrapped;
  // Names supplied by the wrapper itself to 'wrapped', removed from the resulting signature.
  std::vector<std::string> provides;
  // Only meaningful with a VarKeywords parameter: when set, the names are added to the required (resp. optional)
  // set and the Function no longer receives every available value.
  std::optional<std::vector<std::string>> required;
  std::optional<std::vector<std::string>> optional;
};

// Arguments as received by a Function body.
class CallArgs {
 public:
  CallArgs(std::span<const std::string> order, std::vector<Value> positional, ValueMap keywords)
      : _order(order), _positional(std::move(positional)), _keywords(std::move(keywords)) {}

  [[nodiscard]] const std::vector<Value>& positional() const noexcept { return _positional; }

  [[nodiscard]] const ValueMap& keywords() const noexcept { return _keywords; }

  // Looks for the named argument, either passed positionally or by name. Returns nullptr if absent.
  [[nodiscard]] const Value* find(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

  // Throws InjectionError (MissingRequired) if absent, (BadArgumentType) if held type is not T.
  template <class T>
  [[nodiscard]] T get(std::string_view name) const {
    const Value* value = find(name);
    if (value == nullptr) {
      throw InjectionError(InjectionError::Kind::MissingRequired,
                           "argument '" + std::string(name) + "' was not supplied");
    }
    return cast<T>(name, *value);
  }

  template <class T>
  [[nodiscard]] T getOr(std::string_view name, T defaultValue) const {
    const Value* value = find(name);
    if (value == nullptr) {
      return defaultValue;
    }
    return cast<T>(name, *value);
  }

 private:
  template <class T>
  static T cast(std::string_view name, const Value& value) {
    const T* ptr = std::any_cast<T>(&value);
    if (ptr == nullptr) {
      throw InjectionError(InjectionError::Kind::BadArgumentType,
                           "argument '" + std::string(name) + "' does not hold the requested type");
    }
    return *ptr;
  }

  std::span<const std::string> _order;
  std::vector<Value> _positional;
  ValueMap _keywords;
};

// Injectable callable: a body together with its declared parameters.
// The WantSignature is computed once, on first use, and kept for the lifetime of the Function.
class Function {
 public:
  using Body = std::function<Value(const CallArgs&)>;

  Function(std::string name, std::vector<Param> params, Body body, SignatureOverrides overrides = {});

  Function(const Function&) = delete;
  Function(Function&&) noexcept = delete;
  Function& operator=(const Function&) = delete;
  Function& operator=(Function&&) noexcept = delete;

  ~Function() = default;

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::span<const Param> params() const noexcept { return _params; }

  [[nodiscard]] const SignatureOverrides& overrides() const noexcept { return _overrides; }

  [[nodiscard]] const WantSignature& signature() const;

  Value operator()(const CallArgs& args) const { return _body(args); }

 private:
  std::string _name;
  std::vector<Param> _params;
  Body _body;
  SignatureOverrides _overrides;
  mutable std::once_flag _signatureOnce;
  mutable std::optional<WantSignature> _signature;
};

inline FunctionPtr MakeFunction(std::string name, std::vector<Param> params, Function::Body body,
                                SignatureOverrides overrides = {}) {
  return std::make_shared<const Function>(std::move(name), std::move(params), std::move(body),
                                          std::move(overrides));
}

}  // namespace pathforge
