#include <remit/token/ledger_wrapped_native.hpp>

namespace remit::token {

ledger_wrapped_native::ledger_wrapped_native(
    ledger::host& host,
    const remit::schema::address_t& self)
    : ledger_token{host, self, "WNATIVE"} {}

void ledger_wrapped_native::deposit(const remit::schema::address_t& sender,
                                    const remit::schema::amount_t& value) {
  host_.transfer_native(sender, self_, value);
  mint_deposit(sender, value);
}

void ledger_wrapped_native::withdraw(const remit::schema::address_t& sender,
                                     const remit::schema::amount_t& amount) {
  burn(sender, amount);
  host_.emit(remit::schema::transaction_event_t{
      .type = "Withdrawal",
      .attributes = {
          {.key = "src",
           .value = remit::schema::to_string(sender),
           .index = true},
          {.key = "value", .value = remit::schema::to_string(amount)}}});
  auto sent = host_.call(self_, sender, amount, {});
  if (!sent.success) {
    throw ledger::execution_reverted{"native transfer failed: " + sent.reason};
  }
}

remit::schema::bytes_t ledger_wrapped_native::on_call(
    ledger::host&,
    const ledger::call_context& context,
    const remit::schema::bytes_view_t& data) {
  if (!data.empty()) {
    throw ledger::execution_reverted{"unsupported call data"};
  }
  mint_deposit(context.caller, context.value);
  return {};
}

void ledger_wrapped_native::mint_deposit(const remit::schema::address_t& to,
                                         const remit::schema::amount_t& value) {
  mint(to, value);
  host_.emit(remit::schema::transaction_event_t{
      .type = "Deposit",
      .attributes = {
          {.key = "dst", .value = remit::schema::to_string(to), .index = true},
          {.key = "value", .value = remit::schema::to_string(value)}}});
}

}  // namespace remit::token
