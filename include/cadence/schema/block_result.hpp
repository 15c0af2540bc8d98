#pragma once

#include <cadence/schema/call_result.hpp>
#include <cadence/schema/primitives.hpp>
#include <vector>

namespace cadence::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t timestamp{};
  std::vector<call_result_t> call_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace cadence::schema
