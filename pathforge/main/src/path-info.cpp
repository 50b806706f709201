#include "pathforge/path-info.hpp"

#include <cstddef>
#include <string_view>

namespace pathforge {

std::size_t PathInfo::segmentBegin() const noexcept {
  std::size_t begin = _pos;
  if (begin < _path.size() && _path[begin] == '/') {
    ++begin;
  }
  return begin;
}

std::string_view PathInfo::peek() const noexcept {
  const std::string_view path(_path);
  const std::size_t begin = segmentBegin();
  const std::size_t end = path.find('/', begin);
  return path.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

std::string_view PathInfo::pop() noexcept {
  std::string_view segment = peek();
  _pos = segmentBegin() + segment.size();
  return segment;
}

}  // namespace pathforge
