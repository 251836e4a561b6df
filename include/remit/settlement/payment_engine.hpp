#pragma once
#include <remit/ledger/call.hpp>
#include <remit/ledger/contract.hpp>
#include <remit/ledger/host.hpp>
#include <remit/schema/funding_path.hpp>
#include <remit/schema/payment_intent.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/settlement_config.hpp>
#include <remit/schema/transaction_error_code.hpp>
#include <remit/settlement/access_control.hpp>
#include <remit/settlement/circuit_breaker.hpp>
#include <remit/settlement/fee_governance.hpp>
#include <remit/settlement/reentrancy_guard.hpp>

namespace remit::settlement {

/// Construction-time wiring of the settlement engine.
struct payment_engine_config final {
  remit::schema::address_t self{};
  remit::schema::address_t owner{};
  remit::schema::address_t signature_transfer{};
  remit::schema::address_t wrapped_native{};
  remit::schema::address_t fee_receiver{};
  remit::schema::basis_points_t standard_fee_bps{};
};

/// Funding path taken for `intent`: native wrap when the input token is the
/// native sentinel, else the signature-authorized transfer when declared,
/// else an allowance-based transfer.
remit::schema::funding_path_t select_funding_path(
    const remit::schema::payment_intent_t& intent);

/// Non-custodial payment settlement.
///
/// One `settle` call acquires the payer's funds, optionally routes them
/// through an exchange, reconciles any unspent input, pays the fee and the
/// merchant, and emits PaymentSuccess. Every failure throws; the caller is
/// expected to roll the host back to the checkpoint taken before the call.
/// Nothing is held by the engine once a call completes.
///
/// As a contract, empty call data accepts native currency (needed for
/// unwrapping) and non-empty call data is decoded as a payment intent.
class payment_engine final : public ledger::contract {
 public:
  /// Fails with invalid_address, invalid_owner or
  /// invalid_service_fee_percent on bad configuration.
  payment_engine(ledger::host& host, const payment_engine_config& config);

  /// Settle one intent. `context.value` is the native amount the caller
  /// attached; it must already be credited to this engine.
  void settle(const ledger::call_context& context,
              const remit::schema::payment_intent_t& intent);

  void set_service_fee_percent(const remit::schema::address_t& caller,
                               remit::schema::basis_points_t rate);
  void set_special_fee(const remit::schema::address_t& caller,
                       const remit::schema::address_t& account,
                       remit::schema::basis_points_t rate);
  void set_fee_receiver(const remit::schema::address_t& caller,
                        const remit::schema::address_t& fee_receiver);
  void pause(const remit::schema::address_t& caller);
  void unpause(const remit::schema::address_t& caller);
  void transfer_ownership(const remit::schema::address_t& caller,
                          const remit::schema::address_t& new_owner);
  void renounce_ownership(const remit::schema::address_t& caller);

  remit::schema::basis_points_t get_service_fee(
      const remit::schema::address_t& account) const;
  remit::schema::basis_points_t standard_fee() const;
  const remit::schema::address_t& owner() const;
  bool paused() const;
  const remit::schema::address_t& fee_receiver() const;
  const remit::schema::address_t& address() const;
  const remit::schema::address_t& signature_transfer_address() const;
  const remit::schema::address_t& wrapped_native_address() const;

  /// Governance state for persistence.
  remit::schema::settlement_config_t config() const;
  void restore(const remit::schema::settlement_config_t& config);

  remit::schema::bytes_t on_call(
      ledger::host& host,
      const ledger::call_context& context,
      const remit::schema::bytes_view_t& data) override;

 private:
  void validate(const ledger::call_context& context,
                const remit::schema::payment_intent_t& intent) const;
  void acquire_funds(const ledger::call_context& context,
                     const remit::schema::payment_intent_t& intent,
                     remit::schema::funding_path_t path);
  void execute_exchange(const ledger::call_context& context,
                        const remit::schema::payment_intent_t& intent,
                        const remit::schema::address_t& held_token);
  void refund(const ledger::call_context& context,
              const remit::schema::address_t& token,
              bool as_native,
              const remit::schema::amount_t& amount);
  remit::schema::amount_t pay_out(const remit::schema::payment_intent_t& intent,
                                  const remit::schema::address_t& output_token);
  void send_native(const remit::schema::address_t& to,
                   const remit::schema::amount_t& amount,
                   const remit::schema::bytes_view_t& data,
                   remit::schema::transaction_error_code failure);

  ledger::host& host_;
  remit::schema::address_t self_;
  remit::schema::address_t signature_transfer_;
  remit::schema::address_t wrapped_native_;
  access_control access_;
  circuit_breaker breaker_;
  fee_governance fees_;
  reentrancy_guard guard_;
};

}  // namespace remit::settlement
