#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: pause subscription.
// Suspends or resumes executions without touching the schedule.
namespace cadence::schema {

template <uint16_t Version>
struct pause_subscription;

template <>
struct pause_subscription<1> final {
  uint16_t version{1};
  uint64_t subscription_id{};
  bool paused{};
};

using pause_subscription_t = pause_subscription<1>;

}  // namespace cadence::schema
