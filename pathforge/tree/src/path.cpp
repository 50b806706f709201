#include "pathforge/path.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace pathforge {

Path::Path(std::optional<std::string> ident) : Element(Kind::Path, std::move(ident)) {}

std::shared_ptr<Element> Path::cloneDetached() const { return std::make_shared<Path>(ident()); }

std::shared_ptr<Path> MakePath(std::optional<std::string> ident) { return std::make_shared<Path>(std::move(ident)); }

}  // namespace pathforge
