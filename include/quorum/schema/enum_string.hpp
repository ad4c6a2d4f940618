#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

// Name tables for schema enums. Specialize `enum_strings` with a constexpr
// `values` array of {name, enumerator} pairs to get `to_string` and
// `try_from_string` for that enum.
namespace quorum::schema {

template <typename Enum>
struct enum_strings;

template <typename Enum>
concept string_mapped_enum = std::is_enum_v<Enum> && requires {
  { enum_strings<Enum>::values.size() } -> std::convertible_to<std::size_t>;
};

template <string_mapped_enum Enum>
constexpr std::string_view to_string(const Enum value) {
  for (const auto& [name, candidate] : enum_strings<Enum>::values) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

template <string_mapped_enum Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, candidate] : enum_strings<Enum>::values) {
    if (name == value) {
      return candidate;
    }
  }
  return std::nullopt;
}

}  // namespace quorum::schema
