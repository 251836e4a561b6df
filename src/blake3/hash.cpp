#include <blake3.h>
#include <remit/blake3/hash.hpp>

namespace remit::blake3 {

namespace {

remit::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = remit::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

remit::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

remit::schema::hash32_t hash(const remit::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace remit::blake3
