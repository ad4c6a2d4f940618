#include <quorum/schema/key/builder.hpp>

namespace quorum::schema::key {

builder& builder::write(const quorum::schema::bytes_view_t& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write_sized(const quorum::schema::bytes_view_t& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  return write(bytes);
}

}  // namespace quorum::schema::key
