#pragma once
#include <cadence/schema/primitives.hpp>
#include <variant>

// Schema type: vault call.
// Owner management payloads. They are only honoured when the vault calls
// itself, i.e. as the payload of an executed transaction whose destination is
// the vault's own account.
namespace cadence::schema {

template <uint16_t Version>
struct add_owner;

template <>
struct add_owner<1> final {
  uint16_t version{1};
  account_id_t owner{};
};

template <uint16_t Version>
struct remove_owner;

template <>
struct remove_owner<1> final {
  uint16_t version{1};
  account_id_t owner{};
};

template <uint16_t Version>
struct replace_owner;

template <>
struct replace_owner<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t new_owner{};
};

template <uint16_t Version>
struct change_requirement;

template <>
struct change_requirement<1> final {
  uint16_t version{1};
  uint32_t required{};
};

using add_owner_t = add_owner<1>;
using remove_owner_t = remove_owner<1>;
using replace_owner_t = replace_owner<1>;
using change_requirement_t = change_requirement<1>;

using vault_call_t = std::variant<add_owner_t,
                                  remove_owner_t,
                                  replace_owner_t,
                                  change_requirement_t>;

}  // namespace cadence::schema
