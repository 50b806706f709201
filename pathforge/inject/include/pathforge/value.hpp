#pragma once

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathforge {

// Type-erased value flowing through injection (bound URL variables, request objects, handler results).
using Value = std::any;

using ValueMap = std::map<std::string, Value, std::less<>>;

// Read access to a set of named values available for injection.
// 'at' is non-const because some sources produce values on first access.
class ValueSource {
 public:
  ValueSource() noexcept = default;

  ValueSource(const ValueSource&) = default;
  ValueSource& operator=(const ValueSource&) = default;

  virtual ~ValueSource() = default;

  [[nodiscard]] virtual bool contains(std::string_view key) const = 0;

  // Throws std::out_of_range if 'key' is not contained.
  virtual const Value& at(std::string_view key) = 0;

  [[nodiscard]] virtual std::vector<std::string> keys() const = 0;
};

// Adapts a plain ValueMap to the ValueSource interface.
class ValueMapSource : public ValueSource {
 public:
  explicit ValueMapSource(const ValueMap& values) noexcept : _values(&values) {}

  [[nodiscard]] bool contains(std::string_view key) const override { return _values->contains(key); }

  const Value& at(std::string_view key) override;

  [[nodiscard]] std::vector<std::string> keys() const override;

 private:
  const ValueMap* _values;
};

// Textual conversion of strings and integral values. Returns std::nullopt for any other held type.
std::optional<std::string> ValueToString(const Value& value);

}  // namespace pathforge
