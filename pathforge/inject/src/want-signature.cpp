#include "pathforge/want-signature.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/function.hpp"
#include "pathforge/injection-error.hpp"
#include "pathforge/value.hpp"

namespace pathforge {

namespace {

NameSet Difference(const NameSet& lhs, const NameSet& rhs) {
  NameSet ret;
  std::ranges::set_difference(lhs, rhs, std::inserter(ret, ret.end()));
  return ret;
}

std::string JoinQuoted(const NameSet& names) {
  std::string ret;
  for (const auto& name : names) {
    if (!ret.empty()) {
      ret.append(", ");
    }
    ret.push_back('"');
    ret.append(name);
    ret.push_back('"');
  }
  return ret;
}

}  // namespace

WantSignature::WantSignature(std::vector<std::string> order, NameSet required, NameSet optional, bool allPositional,
                             bool allKeywords)
    : _order(std::move(order)),
      _required(std::move(required)),
      _optional(std::move(optional)),
      _allPositional(allPositional),
      _allKeywords(allKeywords) {
  for (const auto& name : _required) {
    if (_optional.contains(name)) {
      throw InjectionError(InjectionError::Kind::SignatureOverlap,
                           "overlap between required and optional arguments on '" + name + "'");
    }
  }
}

WantSignature WantSignature::Of(const Function& fn) {
  std::vector<std::string> order;
  NameSet required;
  NameSet optional;
  bool allPositional = false;
  bool allKeywords = false;

  for (const Param& param : fn.params()) {
    switch (param.kind) {
      case Param::Kind::PositionalOnly:
        order.push_back(param.name);
        break;
      case Param::Kind::PositionalOrKeyword:
        order.push_back(param.name);
        [[fallthrough]];
      case Param::Kind::KeywordOnly:
        if (param.hasDefault) {
          optional.insert(param.name);
        } else {
          required.insert(param.name);
        }
        break;
      case Param::Kind::VarPositional:
        allPositional = true;
        break;
      case Param::Kind::VarKeyword:
        allKeywords = true;
        break;
    }
  }

  const SignatureOverrides& overrides = fn.overrides();
  if (overrides.wrapped) {
    const WantSignature& wrappedSig = overrides.wrapped->signature();

    NameSet mergedOptional = Difference(optional, wrappedSig.required());
    mergedOptional.merge(Difference(wrappedSig.optional(), required));
    optional = std::move(mergedOptional);
    required.insert(wrappedSig.required().begin(), wrappedSig.required().end());

    for (const auto& provided : overrides.provides) {
      required.erase(provided);
      optional.erase(provided);
    }
  }

  if (allKeywords) {
    if (overrides.required) {
      required.insert(overrides.required->begin(), overrides.required->end());
      allKeywords = false;
    }
    if (overrides.optional) {
      optional.insert(overrides.optional->begin(), overrides.optional->end());
      allKeywords = false;
    }
  }

  return {std::move(order), std::move(required), std::move(optional), allPositional, allKeywords};
}

bool WantSignature::wants(std::string_view name) const {
  return _allKeywords || _required.contains(name) || _optional.contains(name);
}

Value WantSignature::invoke(const Function& fn, std::vector<Value> positional, ValueSource& available,
                            const ValueMap& overrides) const {
  if (!_allPositional && positional.size() > _order.size()) {
    throw InjectionError(InjectionError::Kind::TooManyPositional,
                         "too many positional arguments for '" + std::string(fn.name()) + "': got " +
                             std::to_string(positional.size()) + ", can handle at most " +
                             std::to_string(_order.size()));
  }

  NameSet satisfied;
  const std::size_t nbSatisfied = std::min(positional.size(), _order.size());
  for (std::size_t pos = 0; pos < nbSatisfied; ++pos) {
    satisfied.insert(_order[pos]);
  }

  NameSet desired = _required;
  desired.insert(_optional.begin(), _optional.end());
  if (_allKeywords) {
    for (const auto& [key, value] : overrides) {
      desired.insert(key);
    }
    for (auto& key : available.keys()) {
      desired.insert(std::move(key));
    }
  }

  ValueMap keywords;
  for (const auto& name : desired) {
    if (satisfied.contains(name)) {
      continue;
    }
    if (auto it = overrides.find(name); it != overrides.end()) {
      keywords.emplace(name, it->second);
    } else if (available.contains(name)) {
      keywords.emplace(name, available.at(name));
    }
  }

  NameSet missing;
  for (const auto& name : _required) {
    if (!satisfied.contains(name) && !keywords.contains(name)) {
      missing.insert(name);
    }
  }
  if (!missing.empty()) {
    throw InjectionError(InjectionError::Kind::MissingRequired, "missing required keyword arguments for '" +
                                                                    std::string(fn.name()) + "': " +
                                                                    JoinQuoted(missing));
  }

  return fn(CallArgs(_order, std::move(positional), std::move(keywords)));
}

}  // namespace pathforge
