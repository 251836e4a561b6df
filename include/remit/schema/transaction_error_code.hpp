#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace remit::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 6,
  non_payable_operation = 7,
  invalid_payment_amount = 10,
  invalid_native_payment_amount = 11,
  payment_expired = 12,
  invalid_exchange_address = 13,
  exchange_call_failed = 14,
  sweep_excess_native_failed = 15,
  service_fee_native_payment_failed = 16,
  receiver_native_payment_failed = 17,
  receiver_call_failed = 18,
  insufficient_settlement_amount = 19,
  exchange_accounting_mismatch = 20,
  invalid_service_fee_percent = 30,
  invalid_address = 31,
  unauthorized_account = 40,
  invalid_owner = 41,
  enforced_pause = 42,
  expected_pause = 43,
  reentrant_call = 44,
  collaborator_reverted = 50,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "non_payable_operation", transaction_error_code::non_payable_operation},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_payment_amount",
        transaction_error_code::invalid_payment_amount},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_native_payment_amount",
        transaction_error_code::invalid_native_payment_amount},
    std::pair<std::string_view, transaction_error_code>{
        "payment_expired", transaction_error_code::payment_expired},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_exchange_address",
        transaction_error_code::invalid_exchange_address},
    std::pair<std::string_view, transaction_error_code>{
        "exchange_call_failed", transaction_error_code::exchange_call_failed},
    std::pair<std::string_view, transaction_error_code>{
        "sweep_excess_native_failed",
        transaction_error_code::sweep_excess_native_failed},
    std::pair<std::string_view, transaction_error_code>{
        "service_fee_native_payment_failed",
        transaction_error_code::service_fee_native_payment_failed},
    std::pair<std::string_view, transaction_error_code>{
        "receiver_native_payment_failed",
        transaction_error_code::receiver_native_payment_failed},
    std::pair<std::string_view, transaction_error_code>{
        "receiver_call_failed", transaction_error_code::receiver_call_failed},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_settlement_amount",
        transaction_error_code::insufficient_settlement_amount},
    std::pair<std::string_view, transaction_error_code>{
        "exchange_accounting_mismatch",
        transaction_error_code::exchange_accounting_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_service_fee_percent",
        transaction_error_code::invalid_service_fee_percent},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_address", transaction_error_code::invalid_address},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized_account", transaction_error_code::unauthorized_account},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_owner", transaction_error_code::invalid_owner},
    std::pair<std::string_view, transaction_error_code>{
        "enforced_pause", transaction_error_code::enforced_pause},
    std::pair<std::string_view, transaction_error_code>{
        "expected_pause", transaction_error_code::expected_pause},
    std::pair<std::string_view, transaction_error_code>{
        "reentrant_call", transaction_error_code::reentrant_call},
    std::pair<std::string_view, transaction_error_code>{
        "collaborator_reverted", transaction_error_code::collaborator_reverted},
};

template <>
inline std::optional<transaction_error_code>
try_from_string<transaction_error_code>(const std::string_view value) {
  return from_string(value, kTransactionErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace remit::schema
