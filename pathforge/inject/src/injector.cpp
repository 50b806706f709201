#include "pathforge/injector.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/function.hpp"
#include "pathforge/injection-error.hpp"
#include "pathforge/log.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

namespace {

// Marks a key as being produced for the lifetime of the object.
class ProducingMark {
 public:
  ProducingMark(NameSet& producing, std::string_view key) : _producing(producing), _key(key) {
    if (!_producing.insert(_key).second) {
      throw InjectionError(InjectionError::Kind::DeferredCycle,
                           "deferred value '" + _key + "' transitively depends on itself");
    }
  }

  ProducingMark(const ProducingMark&) = delete;
  ProducingMark(ProducingMark&&) noexcept = delete;
  ProducingMark& operator=(const ProducingMark&) = delete;
  ProducingMark& operator=(ProducingMark&&) noexcept = delete;

  ~ProducingMark() { _producing.erase(_key); }

 private:
  NameSet& _producing;
  std::string _key;
};

}  // namespace

Injector::Scope::Scope(Injector& injector) : _injector(&injector), _keep(injector._keys) {}

Injector::Scope::Scope(Scope&& other) noexcept
    : _injector(std::exchange(other._injector, nullptr)), _keep(std::move(other._keep)) {}

Injector::Scope::~Scope() {
  if (_injector == nullptr) {
    return;
  }
  std::vector<std::string> added;
  for (const auto& key : _injector->_keys) {
    if (!_keep.contains(key)) {
      added.push_back(key);
    }
  }
  for (const auto& key : added) {
    _injector->erase(key);
  }
}

void Injector::set(std::string key, Value value) {
  _keys.insert(key);
  _available.insert_or_assign(std::move(key), std::move(value));
}

void Injector::setDeferred(std::string key, FunctionPtr producer) {
  if (!producer) {
    throw std::invalid_argument("deferred producer for '" + key + "' cannot be empty");
  }
  _keys.insert(key);
  _deferred.insert_or_assign(std::move(key), std::move(producer));
}

void Injector::setDeferred(std::string key, std::function<Value()> producer) {
  if (!producer) {
    throw std::invalid_argument("deferred producer for '" + key + "' cannot be empty");
  }
  std::string name = key;
  setDeferred(std::move(key), MakeFunction(std::move(name), {}, [producer = std::move(producer)](const CallArgs&) {
                return producer();
              }));
}

const Value& Injector::at(std::string_view key) {
  if (!_keys.contains(key)) {
    throw std::out_of_range("no value for key '" + std::string(key) + "'");
  }
  if (auto it = _available.find(key); it != _available.end()) {
    return it->second;
  }

  // keep the producer alive even if the key gets erased while producing
  FunctionPtr producer = _deferred.find(key)->second;
  Value produced;
  {
    ProducingMark mark(_producing, key);
    log::trace("Producing deferred value '{}'", key);
    produced = call(*producer);
  }
  return _available.insert_or_assign(std::string(key), std::move(produced)).first->second;
}

bool Injector::erase(std::string_view key) {
  auto it = _keys.find(key);
  if (it == _keys.end()) {
    return false;
  }
  if (auto availableIt = _available.find(key); availableIt != _available.end()) {
    _available.erase(availableIt);
  }
  if (auto deferredIt = _deferred.find(key); deferredIt != _deferred.end()) {
    _deferred.erase(deferredIt);
  }
  _keys.erase(it);
  return true;
}

std::vector<std::string> Injector::keys() const { return {_keys.begin(), _keys.end()}; }

Value Injector::call(const Function& fn, std::vector<Value> positional, const ValueMap& overrides) {
  return fn.signature().invoke(fn, std::move(positional), *this, overrides);
}

}  // namespace pathforge
