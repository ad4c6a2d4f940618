#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: query error code.
namespace quorum::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

template <>
struct enum_strings<query_error_code> final {
  static constexpr auto values = std::array{
      std::pair<std::string_view, query_error_code>{
          "invalid_key", query_error_code::invalid_key},
      std::pair<std::string_view, query_error_code>{
          "not_found", query_error_code::not_found},
      std::pair<std::string_view, query_error_code>{
          "unsupported_path", query_error_code::unsupported_path}};
};

}  // namespace quorum::schema
