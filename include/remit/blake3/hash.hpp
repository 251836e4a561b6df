#pragma once
#include <remit/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace remit::blake3 {

remit::schema::hash32_t hash(const std::string_view& str);
remit::schema::hash32_t hash(const remit::schema::bytes_view_t& bytes);

}  // namespace remit::blake3
