#pragma once
#include <remit/common/critical.hpp>
#include <remit/schema/encoding/encoder.hpp>
#include <remit/schema/encoding/scale/exchange_type.hpp>
#include <remit/schema/encoding/scale/ledger_snapshot.hpp>
#include <remit/schema/encoding/scale/pause.hpp>
#include <remit/schema/encoding/scale/payment_intent.hpp>
#include <remit/schema/encoding/scale/primitives.hpp>
#include <remit/schema/encoding/scale/set_fee_receiver.hpp>
#include <remit/schema/encoding/scale/set_service_fee.hpp>
#include <remit/schema/encoding/scale/set_special_fee.hpp>
#include <remit/schema/encoding/scale/settle_payment.hpp>
#include <remit/schema/encoding/scale/settlement_config.hpp>
#include <remit/schema/encoding/scale/signature_transfer_data.hpp>
#include <remit/schema/encoding/scale/transaction.hpp>
#include <remit/schema/encoding/scale/transaction_event.hpp>
#include <remit/schema/encoding/scale/transaction_event_attribute.hpp>
#include <remit/schema/encoding/scale/transaction_result.hpp>
#include <remit/schema/encoding/scale/transfer_ownership.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace remit::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  remit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, remit::schema::bytes_t& out);

  template <typename T>
  T decode(const remit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const remit::schema::bytes_view_t& bytes);
};

template <typename T>
remit::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    remit::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        remit::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const remit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    remit::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const remit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace remit::schema::encoding
