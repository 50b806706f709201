#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "pathforge/function.hpp"
#include "pathforge/value.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

// Request scoped store of the values available for injection.
// A key is either set eagerly, or bound to a deferred producer which is invoked (itself through injection)
// the first time the key is read, its result being kept for subsequent reads.
class Injector : public ValueSource {
 public:
  // Deletes, on destruction, every key added to the Injector after the Scope was opened.
  class Scope {
   public:
    explicit Scope(Injector& injector);

    Scope(const Scope&) = delete;
    Scope(Scope&& other) noexcept;
    Scope& operator=(const Scope&) = delete;
    Scope& operator=(Scope&&) noexcept = delete;

    ~Scope();

   private:
    Injector* _injector;
    NameSet _keep;
  };

  Injector() = default;

  // Sets a value, masking any deferred producer for the same key.
  void set(std::string key, Value value);

  void setDeferred(std::string key, FunctionPtr producer);

  // Convenience for producers that do not need injection.
  void setDeferred(std::string key, std::function<Value()> producer);

  [[nodiscard]] bool contains(std::string_view key) const override { return _keys.contains(key); }

  // Returns the value of 'key', producing it first if needed.
  // Throws std::out_of_range if 'key' is unknown, InjectionError (DeferredCycle) if the producer of 'key'
  // transitively wants 'key' itself.
  const Value& at(std::string_view key) override;

  // Removes the value and the deferred producer of 'key'. Returns false if 'key' was unknown.
  bool erase(std::string_view key);

  [[nodiscard]] std::size_t size() const noexcept { return _keys.size(); }

  [[nodiscard]] bool empty() const noexcept { return _keys.empty(); }

  [[nodiscard]] std::vector<std::string> keys() const override;

  // Invokes 'fn' with 'positional' and the values of this Injector it wants, 'overrides' taking precedence.
  Value call(const Function& fn, std::vector<Value> positional = {}, const ValueMap& overrides = {});

  [[nodiscard]] Scope cleanup() { return Scope(*this); }

 private:
  std::map<std::string, Value, std::less<>> _available;
  std::map<std::string, FunctionPtr, std::less<>> _deferred;
  NameSet _keys;
  NameSet _producing;
};

}  // namespace pathforge
