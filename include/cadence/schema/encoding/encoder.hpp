#pragma once
#include <cadence/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cadence::schema::encoding {

// Build-time selection of the wire codec. Callers name the library through a
// tag type (see scale/encoder.hpp); hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  cadence::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cadence::schema::bytes_t& out);

  template <typename T>
  T decode(const cadence::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cadence::schema::bytes_view_t& bytes);
};

}  // namespace cadence::schema::encoding
