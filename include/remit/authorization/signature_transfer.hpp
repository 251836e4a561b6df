#pragma once
#include <remit/schema/primitives.hpp>
#include <remit/schema/signature_transfer_data.hpp>

namespace remit::authorization {

/// Signature-authorized transfer: moves tokens out of `owner` on the strength
/// of a pre-signed permit instead of a standing allowance.
class signature_transfer {
 public:
  virtual ~signature_transfer() = default;

  virtual void permit_transfer_from(
      const remit::schema::address_t& spender,
      const remit::schema::permit_transfer_from_t& permit,
      const remit::schema::signature_transfer_details_t& details,
      const remit::schema::address_t& owner,
      const remit::schema::bytes_view_t& signature) = 0;
};

}  // namespace remit::authorization
