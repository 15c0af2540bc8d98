#pragma once

#include <cadence/schema/event_record.hpp>
#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cadence::schema {

template <uint16_t Version>
struct call_result;

template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  // Id of the transaction or subscription the call created or addressed.
  std::optional<uint64_t> record_id;
  std::vector<event_record_t> events;
};

using call_result_t = call_result<1>;

}  // namespace cadence::schema
