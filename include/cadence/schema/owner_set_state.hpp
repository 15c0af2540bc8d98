#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: owner set state.
// Quorum membership: ordered owner list plus required confirmation count.
namespace cadence::schema {

template <uint16_t Version>
struct owner_set_state;

template <>
struct owner_set_state<1> final {
  uint16_t version{1};
  std::vector<account_id_t> owners;
  uint32_t required{};
};

using owner_set_state_t = owner_set_state<1>;

}  // namespace cadence::schema
