#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: deposit.
// Credits the attached value to the vault balance.
namespace cadence::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
};

using deposit_t = deposit<1>;

}  // namespace cadence::schema
