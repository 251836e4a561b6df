#pragma once
#include <remit/schema/primitives.hpp>

// Schema type: signature transfer data.
// Settlement workflow: pre-signed transfer authorization used instead of a
// standing token allowance. The authorization service owns validation of
// every field; the engine only forwards them.
namespace remit::schema {

template <uint16_t Version>
struct token_permissions;

template <>
struct token_permissions<1> final {
  uint16_t version{1};
  address_t token{};
  amount_t amount{};
};

using token_permissions_t = token_permissions<1>;

template <uint16_t Version>
struct permit_transfer_from;

template <>
struct permit_transfer_from<1> final {
  uint16_t version{1};
  token_permissions_t permitted{};
  amount_t nonce{};
  timestamp_seconds_t deadline{};
};

using permit_transfer_from_t = permit_transfer_from<1>;

template <uint16_t Version>
struct signature_transfer_details;

template <>
struct signature_transfer_details<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t requested_amount{};
};

using signature_transfer_details_t = signature_transfer_details<1>;

template <uint16_t Version>
struct signature_transfer_data;

template <>
struct signature_transfer_data<1> final {
  uint16_t version{1};
  bool use_signature_transfer{};
  permit_transfer_from_t permit{};
  signature_transfer_details_t transfer_details{};
  bytes_t signature;
};

using signature_transfer_data_t = signature_transfer_data<1>;

}  // namespace remit::schema
