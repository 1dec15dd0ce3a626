/* Vertex: immutable identity wrapper used as the key of every graph. */
#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace flownet::core {

// A Vertex wraps one immutable value. Equality, ordering and hashing are
// structural on that value, so two Vertex objects built from the same string
// are the same vertex. The value is also the vertex's serialized form.
class Vertex {
public:
  explicit Vertex(std::string value) : value_(std::move(value)) {}

  [[nodiscard]] const std::string& value() const noexcept { return value_; }

  friend bool operator==(const Vertex& a, const Vertex& b) noexcept = default;
  friend std::strong_ordering operator<=>(const Vertex& a, const Vertex& b) noexcept = default;

private:
  std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const Vertex& v) {
  return os << "Vertex(" << v.value() << ")";
}

} // namespace flownet::core

template <>
struct std::hash<flownet::core::Vertex> {
  std::size_t operator()(const flownet::core::Vertex& v) const noexcept {
    return std::hash<std::string>{}(v.value());
  }
};
