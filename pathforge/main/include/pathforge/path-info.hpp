#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace pathforge {

// Request path consumed segment by segment, from left to right.
class PathInfo {
 public:
  explicit PathInfo(std::string path) : _path(std::move(path)) {}

  // Next segment, without its leading slash. Empty once the path is exhausted, and on an empty segment
  // (trailing slash, or two consecutive slashes).
  [[nodiscard]] std::string_view peek() const noexcept;

  // Consumes the next segment and returns it.
  std::string_view pop() noexcept;

  // Part of the path not consumed yet, with its leading slash.
  [[nodiscard]] std::string_view remaining() const noexcept { return std::string_view(_path).substr(_pos); }

  // Consumed part of the path.
  [[nodiscard]] std::string_view consumed() const noexcept { return std::string_view(_path).substr(0, _pos); }

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

 private:
  [[nodiscard]] std::size_t segmentBegin() const noexcept;

  std::string _path;
  std::size_t _pos{0};
};

}  // namespace pathforge
