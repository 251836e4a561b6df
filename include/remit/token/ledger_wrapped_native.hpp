#pragma once
#include <remit/token/ledger_token.hpp>
#include <remit/token/wrapped_native.hpp>

namespace remit::token {

/// Wrapped native currency. A plain value transfer to its address (empty
/// call data) is treated as a deposit.
class ledger_wrapped_native final : public ledger_token, public wrapped_native {
 public:
  ledger_wrapped_native(ledger::host& host,
                        const remit::schema::address_t& self);

  void deposit(const remit::schema::address_t& sender,
               const remit::schema::amount_t& value) override;
  void withdraw(const remit::schema::address_t& sender,
                const remit::schema::amount_t& amount) override;

  remit::schema::bytes_t on_call(
      ledger::host& host,
      const ledger::call_context& context,
      const remit::schema::bytes_view_t& data) override;

 private:
  void mint_deposit(const remit::schema::address_t& to,
                    const remit::schema::amount_t& value);
};

}  // namespace remit::token
