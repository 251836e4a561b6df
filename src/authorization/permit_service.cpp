#include <spdlog/spdlog.h>
#include <remit/authorization/permit_service.hpp>
#include <remit/blake3/hash.hpp>
#include <remit/crypto/verify.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/token/fungible_token.hpp>

#include <string>
#include <tuple>

namespace remit::authorization {

namespace {

using encoder_t =
    remit::schema::encoding::encoder<remit::schema::encoding::scale_encoder_tag>;

}  // namespace

permit_service::permit_service(ledger::host& host,
                               const remit::schema::address_t& self)
    : host_{host}, self_{self} {}

const remit::schema::address_t& permit_service::address() const {
  return self_;
}

void permit_service::permit_transfer_from(
    const remit::schema::address_t& spender,
    const remit::schema::permit_transfer_from_t& permit,
    const remit::schema::signature_transfer_details_t& details,
    const remit::schema::address_t& owner,
    const remit::schema::bytes_view_t& signature) {
  if (host_.now() > permit.deadline) {
    throw ledger::execution_reverted{"SignatureExpired"};
  }
  if (details.requested_amount > permit.permitted.amount) {
    throw ledger::execution_reverted{"InvalidAmount"};
  }
  use_unordered_nonce(owner, permit.nonce);

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<remit::schema::signer_id_t,
                                    remit::schema::signature_t>>(signature);
  if (!decoded.has_value()) {
    throw ledger::execution_reverted{"InvalidSignature"};
  }
  const auto& [signer, raw_signature] = decoded.value();
  if (remit::crypto::derive_address(signer) != owner) {
    throw ledger::execution_reverted{"InvalidSigner"};
  }
  auto digest = permit_digest(self_, permit, spender);
  if (!remit::crypto::verify_signature(
          remit::schema::bytes_view_t{digest.data(), digest.size()}, signer,
          raw_signature)) {
    throw ledger::execution_reverted{"InvalidSigner"};
  }

  spdlog::debug("permit {} -> {} amount {} spender {}",
                remit::schema::to_string(owner),
                remit::schema::to_string(details.to),
                remit::schema::to_string(details.requested_amount),
                remit::schema::to_string(spender));
  auto& token = host_.resolve<remit::token::fungible_token>(
      permit.permitted.token);
  token.transfer_from(self_, owner, details.to, details.requested_amount);
}

void permit_service::invalidate_unordered_nonces(
    const remit::schema::address_t& owner,
    const remit::schema::amount_t& word_position,
    const remit::schema::amount_t& mask) {
  auto& state = host_.state();
  state.set_nonce_word(owner, word_position,
                       state.nonce_word(owner, word_position) | mask);
  host_.emit(remit::schema::transaction_event_t{
      .type = "UnorderedNonceInvalidation",
      .attributes = {
          {.key = "owner",
           .value = remit::schema::to_string(owner),
           .index = true},
          {.key = "word", .value = remit::schema::to_string(word_position)},
          {.key = "mask", .value = remit::schema::to_string(mask)}}});
}

remit::schema::amount_t permit_service::nonce_bitmap(
    const remit::schema::address_t& owner,
    const remit::schema::amount_t& word_position) const {
  return host_.state().nonce_word(owner, word_position);
}

remit::schema::hash32_t permit_service::permit_digest(
    const remit::schema::address_t& service,
    const remit::schema::permit_transfer_from_t& permit,
    const remit::schema::address_t& spender) {
  auto encoder = encoder_t{};
  auto message = encoder.encode(
      std::tuple{std::string{kPermitDomainTag}, service, permit, spender});
  return remit::blake3::hash(remit::schema::make_bytes_view(message));
}

remit::schema::bytes_t permit_service::encode_signature(
    const remit::schema::signer_id_t& signer,
    const remit::schema::signature_t& signature) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{signer, signature});
}

void permit_service::use_unordered_nonce(const remit::schema::address_t& owner,
                                         const remit::schema::amount_t& nonce) {
  auto word_position = remit::schema::amount_t{nonce >> 8};
  auto bit = remit::schema::amount_t{1} << static_cast<unsigned>(nonce & 0xFF);
  auto& state = host_.state();
  auto flipped = state.nonce_word(owner, word_position) ^ bit;
  if ((flipped & bit) == 0) {
    throw ledger::execution_reverted{"InvalidNonce"};
  }
  state.set_nonce_word(owner, word_position, flipped);
}

}  // namespace remit::authorization
