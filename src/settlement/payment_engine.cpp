#include <spdlog/spdlog.h>
#include <remit/authorization/signature_transfer.hpp>
#include <remit/blake3/hash.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/settlement/events.hpp>
#include <remit/settlement/payment_engine.hpp>
#include <remit/settlement/settlement_error.hpp>
#include <remit/token/fungible_token.hpp>
#include <remit/token/wrapped_native.hpp>

#include <string>
#include <string_view>

namespace remit::settlement {

namespace {

using encoder_t =
    remit::schema::encoding::encoder<remit::schema::encoding::scale_encoder_tag>;
using remit::schema::transaction_error_code;

const remit::schema::address_t& require_address(
    const remit::schema::address_t& address,
    const std::string_view name) {
  if (remit::schema::is_zero(address)) {
    throw settlement_error{transaction_error_code::invalid_address, name};
  }
  return address;
}

}  // namespace

remit::schema::funding_path_t select_funding_path(
    const remit::schema::payment_intent_t& intent) {
  if (remit::schema::is_native(intent.token_in)) {
    return remit::schema::funding_path_t::native_wrap;
  }
  if (intent.signature_transfer_data.use_signature_transfer) {
    return remit::schema::funding_path_t::signature_transfer;
  }
  return remit::schema::funding_path_t::allowance_transfer;
}

payment_engine::payment_engine(ledger::host& host,
                               const payment_engine_config& config)
    : host_{host},
      self_{require_address(config.self, "engine")},
      signature_transfer_{
          require_address(config.signature_transfer, "signature transfer")},
      wrapped_native_{require_address(config.wrapped_native, "wrapped native")},
      access_{host, config.owner},
      breaker_{host, access_},
      fees_{host, access_, config.fee_receiver, config.standard_fee_bps} {
  if (config.fee_receiver == self_) {
    throw settlement_error{transaction_error_code::invalid_address,
                           "fee receiver is the settlement engine"};
  }
}

void payment_engine::settle(const ledger::call_context& context,
                            const remit::schema::payment_intent_t& intent) {
  auto guard = reentrancy_guard::scope{guard_};
  breaker_.require_not_paused();
  validate(context, intent);

  auto path = select_funding_path(intent);
  auto native_in = remit::schema::is_native(intent.token_in);
  auto native_out = remit::schema::is_native(intent.receipt_token);
  const auto& held_token = native_in ? wrapped_native_ : intent.token_in;
  const auto& output_token =
      native_out ? wrapped_native_ : intent.receipt_token;

  auto& output = host_.resolve<remit::token::fungible_token>(output_token);
  auto baseline = output.balance_of(self_);

  acquire_funds(context, intent, path);

  if (intent.exchange_type == remit::schema::exchange_type_t::exchange) {
    execute_exchange(context, intent, held_token);
  }

  auto held = output.balance_of(self_);
  auto gained = held > baseline ? remit::schema::amount_t{held - baseline}
                                : remit::schema::amount_t{0};
  if (gained < intent.receipt_amount) {
    throw settlement_error{transaction_error_code::insufficient_settlement_amount,
                           "gained " + remit::schema::to_string(gained) +
                               " of " +
                               remit::schema::to_string(intent.receipt_amount)};
  }
  if (gained > intent.receipt_amount) {
    refund(context, output_token, native_in && output_token == wrapped_native_,
           gained - intent.receipt_amount);
  }

  auto fee = pay_out(intent, output_token);

  auto encoder = encoder_t{};
  auto encoded_intent = encoder.encode(intent);
  host_.emit(events::payment_success(events::payment_success_t{
      .recipient = intent.payment_receiver,
      .net_amount = intent.receipt_amount - fee,
      .receipt_amount = intent.receipt_amount,
      .receipt_token = intent.receipt_token,
      .fee_amount = fee,
      .payer = context.caller,
      .funding_path = path,
      .intent_digest =
          remit::blake3::hash(remit::schema::make_bytes_view(encoded_intent))}));
  spdlog::debug("settled {} {} to {} via {} (fee {})",
                remit::schema::to_string(intent.receipt_amount),
                remit::schema::to_string(intent.receipt_token),
                remit::schema::to_string(intent.payment_receiver),
                remit::schema::to_string(path), remit::schema::to_string(fee));
}

void payment_engine::validate(
    const ledger::call_context& context,
    const remit::schema::payment_intent_t& intent) const {
  if (intent.amount_in == 0) {
    throw settlement_error{transaction_error_code::invalid_payment_amount};
  }
  if (remit::schema::is_native(intent.token_in)) {
    if (context.value != intent.amount_in) {
      throw settlement_error{
          transaction_error_code::invalid_native_payment_amount,
          "attached " + remit::schema::to_string(context.value) +
              ", expected " + remit::schema::to_string(intent.amount_in)};
    }
  } else if (context.value != 0) {
    throw settlement_error{
        transaction_error_code::invalid_native_payment_amount,
        "native value attached to a token payment"};
  }
  if (host_.now() > intent.deadline) {
    throw settlement_error{transaction_error_code::payment_expired};
  }
  if (intent.payment_receiver == self_) {
    throw settlement_error{transaction_error_code::invalid_address,
                           "payment receiver is the settlement engine"};
  }
}

void payment_engine::acquire_funds(
    const ledger::call_context& context,
    const remit::schema::payment_intent_t& intent,
    const remit::schema::funding_path_t path) {
  switch (path) {
    case remit::schema::funding_path_t::native_wrap:
      host_.resolve<remit::token::wrapped_native>(wrapped_native_)
          .deposit(self_, intent.amount_in);
      break;
    case remit::schema::funding_path_t::signature_transfer: {
      const auto& data = intent.signature_transfer_data;
      host_
          .resolve<remit::authorization::signature_transfer>(
              signature_transfer_)
          .permit_transfer_from(self_, data.permit, data.transfer_details,
                                context.caller,
                                remit::schema::make_bytes_view(data.signature));
      break;
    }
    case remit::schema::funding_path_t::allowance_transfer:
      host_.resolve<remit::token::fungible_token>(intent.token_in)
          .transfer_from(self_, context.caller, self_, intent.amount_in);
      break;
  }
}

void payment_engine::execute_exchange(
    const ledger::call_context& context,
    const remit::schema::payment_intent_t& intent,
    const remit::schema::address_t& held_token) {
  if (remit::schema::is_zero(intent.exchange_address)) {
    throw settlement_error{transaction_error_code::invalid_exchange_address};
  }
  auto& input = host_.resolve<remit::token::fungible_token>(held_token);
  auto before = input.balance_of(self_);
  input.increase_allowance(self_, intent.exchange_address, intent.amount_in);

  auto result = host_.call(self_, intent.exchange_address, 0,
                           remit::schema::make_bytes_view(
                               intent.exchange_call_data));
  if (!result.success) {
    throw settlement_error{transaction_error_code::exchange_call_failed,
                           result.reason};
  }

  auto after = input.balance_of(self_);
  if (after > before || before - after > intent.amount_in) {
    throw settlement_error{transaction_error_code::exchange_accounting_mismatch,
                           "balance " + remit::schema::to_string(before) +
                               " -> " + remit::schema::to_string(after)};
  }
  auto spent = remit::schema::amount_t{before - after};
  auto excess = remit::schema::amount_t{intent.amount_in - spent};
  if (excess > 0) {
    refund(context, held_token, remit::schema::is_native(intent.token_in),
           excess);
  }
}

void payment_engine::refund(const ledger::call_context& context,
                            const remit::schema::address_t& token,
                            const bool as_native,
                            const remit::schema::amount_t& amount) {
  spdlog::debug("returning {} of {} to {}", remit::schema::to_string(amount),
                as_native ? std::string{"native"}
                          : remit::schema::to_string(token),
                remit::schema::to_string(context.caller));
  if (as_native) {
    host_.resolve<remit::token::wrapped_native>(wrapped_native_)
        .withdraw(self_, amount);
    send_native(context.caller, amount, {},
                transaction_error_code::sweep_excess_native_failed);
    return;
  }
  host_.resolve<remit::token::fungible_token>(token).transfer(
      self_, context.caller, amount);
}

remit::schema::amount_t payment_engine::pay_out(
    const remit::schema::payment_intent_t& intent,
    const remit::schema::address_t& output_token) {
  auto rate = fees_.resolve(intent.payment_receiver);
  auto fee = fee_governance::compute_fee(intent.receipt_amount, rate);
  auto net = remit::schema::amount_t{intent.receipt_amount - fee};
  const auto& fee_receiver = fees_.fee_receiver();
  auto receiver_data = remit::schema::make_bytes_view(intent.receiver_call_data);

  if (remit::schema::is_native(intent.receipt_token)) {
    host_.resolve<remit::token::wrapped_native>(wrapped_native_)
        .withdraw(self_, intent.receipt_amount);
    if (fee > 0) {
      send_native(fee_receiver, fee, {},
                  transaction_error_code::service_fee_native_payment_failed);
    }
    send_native(intent.payment_receiver, net, receiver_data,
                transaction_error_code::receiver_native_payment_failed);
    return fee;
  }

  auto& output = host_.resolve<remit::token::fungible_token>(output_token);
  if (fee > 0) {
    output.transfer(self_, fee_receiver, fee);
  }
  output.transfer(self_, intent.payment_receiver, net);
  if (!intent.receiver_call_data.empty()) {
    auto result = host_.call(self_, intent.payment_receiver, 0, receiver_data);
    if (!result.success) {
      throw settlement_error{transaction_error_code::receiver_call_failed,
                             result.reason};
    }
  }
  return fee;
}

void payment_engine::send_native(const remit::schema::address_t& to,
                                 const remit::schema::amount_t& amount,
                                 const remit::schema::bytes_view_t& data,
                                 const transaction_error_code failure) {
  auto result = host_.call(self_, to, amount, data);
  if (!result.success) {
    throw settlement_error{failure, result.reason};
  }
}

void payment_engine::set_service_fee_percent(
    const remit::schema::address_t& caller,
    const remit::schema::basis_points_t rate) {
  fees_.set_standard_fee(caller, rate);
}

void payment_engine::set_special_fee(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& account,
    const remit::schema::basis_points_t rate) {
  fees_.set_special_fee(caller, account, rate);
}

void payment_engine::set_fee_receiver(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& fee_receiver) {
  access_.require_owner(caller);
  if (fee_receiver == self_) {
    throw settlement_error{transaction_error_code::invalid_address,
                           "fee receiver is the settlement engine"};
  }
  fees_.set_fee_receiver(caller, fee_receiver);
}

void payment_engine::pause(const remit::schema::address_t& caller) {
  breaker_.pause(caller);
}

void payment_engine::unpause(const remit::schema::address_t& caller) {
  breaker_.unpause(caller);
}

void payment_engine::transfer_ownership(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& new_owner) {
  access_.transfer_ownership(caller, new_owner);
}

void payment_engine::renounce_ownership(
    const remit::schema::address_t& caller) {
  access_.renounce_ownership(caller);
}

remit::schema::basis_points_t payment_engine::get_service_fee(
    const remit::schema::address_t& account) const {
  return fees_.resolve(account);
}

remit::schema::basis_points_t payment_engine::standard_fee() const {
  return fees_.standard_fee();
}

const remit::schema::address_t& payment_engine::owner() const {
  return access_.owner();
}

bool payment_engine::paused() const {
  return breaker_.paused();
}

const remit::schema::address_t& payment_engine::fee_receiver() const {
  return fees_.fee_receiver();
}

const remit::schema::address_t& payment_engine::address() const {
  return self_;
}

const remit::schema::address_t& payment_engine::signature_transfer_address()
    const {
  return signature_transfer_;
}

const remit::schema::address_t& payment_engine::wrapped_native_address() const {
  return wrapped_native_;
}

remit::schema::settlement_config_t payment_engine::config() const {
  auto out = remit::schema::settlement_config_t{};
  out.owner = access_.owner();
  out.paused = breaker_.paused();
  out.standard_fee_bps = fees_.standard_fee();
  out.fee_receiver = fees_.fee_receiver();
  out.special_fees = fees_.special_fees();
  return out;
}

void payment_engine::restore(const remit::schema::settlement_config_t& config) {
  fees_.restore(config.standard_fee_bps, config.fee_receiver,
                config.special_fees);
  access_.restore(config.owner);
  breaker_.restore(config.paused);
}

remit::schema::bytes_t payment_engine::on_call(
    ledger::host&,
    const ledger::call_context& context,
    const remit::schema::bytes_view_t& data) {
  if (data.empty()) {
    return {};
  }
  auto encoder = encoder_t{};
  auto intent = encoder.try_decode<remit::schema::payment_intent_t>(data);
  if (!intent.has_value()) {
    throw ledger::execution_reverted{"unsupported call data"};
  }
  settle(context, intent.value());
  return {};
}

}  // namespace remit::settlement
