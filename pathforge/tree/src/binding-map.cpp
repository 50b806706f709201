#include "pathforge/binding-map.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/binding.hpp"
#include "pathforge/log.hpp"
#include "pathforge/route-definition-error.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

namespace {

enum class VisitState : std::uint8_t { InProgress, Done };

using Successors = std::map<std::string, NameSet, std::less<>>;

// Depth first visit appending 'ident' after everything that has to be tried after it.
// Successors are explored in reverse ident order so that the final reversed sequence falls back to ascending order.
void Visit(const Successors& successors, const std::string& ident, std::map<std::string_view, VisitState>& states,
           std::vector<std::string_view>& postOrder) {
  auto [it, inserted] = states.try_emplace(ident, VisitState::InProgress);
  if (!inserted) {
    if (it->second == VisitState::InProgress) {
      throw RouteDefinitionError(RouteDefinitionError::Kind::CyclicBindingOrder,
                                 "cyclic ordering constraints around binding \"" + ident + "\"");
    }
    return;
  }
  const NameSet& next = successors.find(ident)->second;
  for (auto succIt = next.rbegin(); succIt != next.rend(); ++succIt) {
    Visit(successors, *succIt, states, postOrder);
  }
  it->second = VisitState::Done;
  postOrder.push_back(it->first);
}

}  // namespace

void BindingMap::insert(const std::shared_ptr<Binding>& binding) {
  MergingMap::insert(binding);
  _order.reset();
}

const std::vector<std::shared_ptr<Binding>>& BindingMap::ordered() const {
  if (_order) {
    return *_order;
  }

  Successors successors;
  for (const auto& [ident, binding] : _map) {
    successors[ident];
  }
  for (const auto& [ident, binding] : _map) {
    for (const auto& other : binding->before()) {
      if (!_map.contains(other)) {
        log::warn("Binding \"{}\" is ordered before unknown sibling \"{}\", ignoring", ident, other);
        continue;
      }
      successors[ident].insert(other);
    }
    for (const auto& other : binding->after()) {
      if (!_map.contains(other)) {
        log::warn("Binding \"{}\" is ordered after unknown sibling \"{}\", ignoring", ident, other);
        continue;
      }
      successors.find(other)->second.insert(ident);
    }
  }

  std::map<std::string_view, VisitState> states;
  std::vector<std::string_view> postOrder;
  postOrder.reserve(_map.size());
  for (auto it = successors.rbegin(); it != successors.rend(); ++it) {
    Visit(successors, it->first, states, postOrder);
  }

  std::vector<std::shared_ptr<Binding>> order;
  order.reserve(postOrder.size());
  std::ranges::transform(postOrder.rbegin(), postOrder.rend(), std::back_inserter(order),
                         [this](std::string_view ident) { return _map.find(ident)->second; });
  _order = std::move(order);
  return *_order;
}

}  // namespace pathforge
