#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <cstdint>

namespace dson
{

using slot_t = std::uint32_t;

enum class unary_operator : std::int_fast8_t
{
  plus,        // +
  minus,       // -
  bit_not,     // ~
  logical_not, // !
};

// Precedence and associativity are resolved into nesting by the parser,
// nothing here orders the operators.
enum class binary_operator : std::int_fast8_t
{
  mul,         // *
  div,         // /
  mod,         // %
  add,         // +
  sub,         // -
  shl,         // <<
  shr,         // >>
  lt,          // <
  gt,          // >
  le,          // <=
  ge,          // >=
  in,          // in
  eq,          // ==
  ne,          // !=
  bit_and,     // &
  bit_xor,     // ^
  bit_or,      // |
  logical_and, // &&
  logical_or,  // ||
};

enum class visibility : std::int_fast8_t
{
  normal, // :
  hidden, // ::
  unhide, // :::
};

std::string_view to_string(unary_operator op);
std::string_view to_string(binary_operator op);
std::string_view to_string(visibility vis);

std::optional<unary_operator> unary_operator_from(std::string_view spelling);
std::optional<binary_operator> binary_operator_from(std::string_view spelling);

// hidden fields are left out when an object is enumerated or serialized
constexpr bool is_visible(visibility vis)
{ return vis != visibility::hidden; }

NLOHMANN_JSON_SERIALIZE_ENUM( visibility, {
  { visibility::normal, "normal" },
  { visibility::hidden, "hidden" },
  { visibility::unhide, "unhide" },
})

}
