#pragma once
#include <remit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace remit::schema::encoding {

// Encoder selection is a build-time setting: call sites name the library
// through a tag type and never touch the library API directly.
template <typename Library>
struct encoder {
  template <typename T>
  remit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, remit::schema::bytes_t& out);

  template <typename T>
  T decode(const remit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const remit::schema::bytes_view_t& bytes);
};

}  // namespace remit::schema::encoding
