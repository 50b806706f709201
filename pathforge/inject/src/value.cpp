#include "pathforge/value.hpp"

#include <any>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pathforge {

namespace {

template <class T>
bool FormatIntegral(const Value& value, std::optional<std::string>& out) {
  if (const T* ptr = std::any_cast<T>(&value)) {
    out = std::to_string(*ptr);
    return true;
  }
  return false;
}

}  // namespace

const Value& ValueMapSource::at(std::string_view key) {
  auto it = _values->find(key);
  if (it == _values->end()) {
    throw std::out_of_range("no value named '" + std::string(key) + "'");
  }
  return it->second;
}

std::vector<std::string> ValueMapSource::keys() const {
  std::vector<std::string> ret;
  ret.reserve(_values->size());
  for (const auto& [key, value] : *_values) {
    ret.push_back(key);
  }
  return ret;
}

std::optional<std::string> ValueToString(const Value& value) {
  if (const auto* str = std::any_cast<std::string>(&value)) {
    return *str;
  }
  if (const auto* sv = std::any_cast<std::string_view>(&value)) {
    return std::string(*sv);
  }
  if (const auto* cstr = std::any_cast<const char*>(&value)) {
    return std::string(*cstr);
  }
  std::optional<std::string> ret;
  if (FormatIntegral<int>(value, ret) || FormatIntegral<long>(value, ret) || FormatIntegral<long long>(value, ret) ||
      FormatIntegral<unsigned>(value, ret) || FormatIntegral<unsigned long>(value, ret)) {
    return ret;
  }
  FormatIntegral<unsigned long long>(value, ret);
  return ret;
}

}  // namespace pathforge
