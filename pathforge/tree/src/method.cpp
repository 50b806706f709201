#include "pathforge/method.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pathforge/ascii-upper.hpp"
#include "pathforge/function.hpp"
#include "pathforge/route-definition-error.hpp"

namespace pathforge {

namespace {

std::optional<std::string> CanonicalVerb(std::optional<std::string> verb) {
  if (verb) {
    return ToUpperAscii(*verb);
  }
  return verb;
}

[[noreturn]] void ThrowInvalidAttachment(const char* what) {
  throw RouteDefinitionError(RouteDefinitionError::Kind::InvalidAttachment,
                             std::string("cannot attach a ") + what + " to a method");
}

}  // namespace

Method::Method(std::optional<std::string> verb, FunctionPtr handler)
    : Element(Kind::Method, CanonicalVerb(std::move(verb))), _handler(std::move(handler)) {}

void Method::setIdent([[maybe_unused]] std::string ident) {
  throw RouteDefinitionError(RouteDefinitionError::Kind::IdentAlreadySet, "the verb of a method cannot be changed");
}

std::shared_ptr<Path> Method::addPath([[maybe_unused]] std::optional<std::string> ident) {
  ThrowInvalidAttachment("path");
}

std::shared_ptr<Binding> Method::addBinding([[maybe_unused]] std::optional<std::string> ident,
                                            [[maybe_unused]] NameSet before, [[maybe_unused]] NameSet after) {
  ThrowInvalidAttachment("binding");
}

std::shared_ptr<Method> Method::addMethod([[maybe_unused]] std::optional<std::string> verb,
                                          [[maybe_unused]] FunctionPtr handler) {
  ThrowInvalidAttachment("method");
}

FunctionPtr Method::route([[maybe_unused]] std::vector<std::string> verbs, [[maybe_unused]] FunctionPtr handler) {
  ThrowInvalidAttachment("method");
}

DelegationPtr Method::mount(DelegationPtr delegation, std::vector<std::string> verbs) {
  if (!verbs.empty()) {
    ThrowInvalidAttachment("method");
  }
  return Element::mount(std::move(delegation));
}

void Method::checkMergeable(const Element& other) const {
  if (_handler != static_cast<const Method&>(other)._handler) {
    throw RouteDefinitionError(RouteDefinitionError::Kind::DuplicateDeclaration,
                               "method " + verb().value_or("<fallback>") + " is declared with two different handlers");
  }
}

std::shared_ptr<Element> Method::cloneDetached() const { return std::make_shared<Method>(verb(), _handler); }

}  // namespace pathforge
