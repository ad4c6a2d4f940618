#include <openssl/evp.h>
#include <quorum/common/critical.hpp>
#include <quorum/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace quorum::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};

std::optional<uint8_t> hex_value(const char c) {
  auto position = kHexDigits.find(
      static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    quorum::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::ranges::copy(*decoded, std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (auto i = size_t{0}; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    quorum::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  // EVP_EncodeBlock writes 4 characters per 3-byte group plus a terminator.
  auto out = std::string(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                      bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) == 0;
  });
  if (compact.size() % 4 != 0) {
    return std::nullopt;
  }
  auto padding = compact.ends_with("==") ? size_t{2}
                 : compact.ends_with('=') ? size_t{1}
                                          : size_t{0};
  if (compact.find('=') < compact.size() - padding) {
    return std::nullopt;
  }

  auto out = bytes_t(compact.size() / 4 * 3);
  auto decoded = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
      static_cast<int>(compact.size()));
  if (decoded < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts the zero bytes that padding stands for.
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded) {
    quorum::common::critical("invalid base64 input");
  }
  return *decoded;
}

}  // namespace quorum::schema
