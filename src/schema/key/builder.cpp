#include <algorithm>
#include <cadence/schema/key/builder.hpp>
#include <iterator>

using namespace cadence::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& value) {
  return write(std::span<const uint8_t>{value.data(), value.size()});
}
