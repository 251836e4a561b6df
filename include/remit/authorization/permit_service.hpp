#pragma once
#include <remit/authorization/signature_transfer.hpp>
#include <remit/ledger/contract.hpp>
#include <remit/ledger/host.hpp>
#include <remit/schema/primitives.hpp>
#include <string_view>

namespace remit::authorization {

inline constexpr auto kPermitDomainTag = std::string_view{"remit.permit.v1"};

/// Permit-based transfer service with unordered nonces.
///
/// A permit is valid once: its nonce selects a bit in a 256-bit word
/// (`nonce >> 8` picks the word, the low byte picks the bit). The owner must
/// have approved this service on the permitted token.
class permit_service final : public ledger::contract, public signature_transfer {
 public:
  permit_service(ledger::host& host, const remit::schema::address_t& self);

  const remit::schema::address_t& address() const;

  /// Reverts with SignatureExpired, InvalidAmount, InvalidNonce,
  /// InvalidSignature or InvalidSigner; otherwise transfers
  /// `details.requested_amount` from `owner` to `details.to`.
  void permit_transfer_from(
      const remit::schema::address_t& spender,
      const remit::schema::permit_transfer_from_t& permit,
      const remit::schema::signature_transfer_details_t& details,
      const remit::schema::address_t& owner,
      const remit::schema::bytes_view_t& signature) override;

  /// Burn the nonce bits in `mask` for the caller.
  void invalidate_unordered_nonces(const remit::schema::address_t& owner,
                                   const remit::schema::amount_t& word_position,
                                   const remit::schema::amount_t& mask);

  remit::schema::amount_t nonce_bitmap(
      const remit::schema::address_t& owner,
      const remit::schema::amount_t& word_position) const;

  /// Message a payer signs to authorize `spender` to use `permit`.
  static remit::schema::hash32_t permit_digest(
      const remit::schema::address_t& service,
      const remit::schema::permit_transfer_from_t& permit,
      const remit::schema::address_t& spender);

  /// Signature blob accepted by `permit_transfer_from`.
  static remit::schema::bytes_t encode_signature(
      const remit::schema::signer_id_t& signer,
      const remit::schema::signature_t& signature);

 private:
  void use_unordered_nonce(const remit::schema::address_t& owner,
                           const remit::schema::amount_t& nonce);

  ledger::host& host_;
  remit::schema::address_t self_;
};

}  // namespace remit::authorization
