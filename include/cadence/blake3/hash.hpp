#pragma once
#include <cadence/schema/primitives.hpp>
#include <string_view>

namespace cadence::blake3 {

cadence::schema::hash32_t hash(const std::string_view& str);
cadence::schema::hash32_t hash(const cadence::schema::bytes_view_t& bytes);

}  // namespace cadence::blake3
