#pragma once

#include <quorum/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace quorum::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"quorum-multisig"};
  std::string version{"0.1.0"};
  program_id_t program_id{};
  hash32_t chain_id{};
};

using app_info_t = app_info<1>;

}  // namespace quorum::schema
