#pragma once
#include <remit/ledger/contract.hpp>
#include <remit/ledger/host.hpp>
#include <remit/token/fungible_token.hpp>
#include <string>

namespace remit::token {

/// Fungible token whose balances live in the host's world state.
class ledger_token : public ledger::contract, public virtual fungible_token {
 public:
  ledger_token(ledger::host& host,
               const remit::schema::address_t& self,
               std::string symbol);

  const remit::schema::address_t& address() const;
  const std::string& symbol() const;

  remit::schema::amount_t total_supply() const override;
  remit::schema::amount_t balance_of(
      const remit::schema::address_t& account) const override;
  remit::schema::amount_t allowance(
      const remit::schema::address_t& owner,
      const remit::schema::address_t& spender) const override;

  void transfer(const remit::schema::address_t& sender,
                const remit::schema::address_t& to,
                const remit::schema::amount_t& amount) override;
  void transfer_from(const remit::schema::address_t& spender,
                     const remit::schema::address_t& from,
                     const remit::schema::address_t& to,
                     const remit::schema::amount_t& amount) override;
  void approve(const remit::schema::address_t& owner,
               const remit::schema::address_t& spender,
               const remit::schema::amount_t& amount) override;
  void increase_allowance(const remit::schema::address_t& owner,
                          const remit::schema::address_t& spender,
                          const remit::schema::amount_t& added) override;

  void mint(const remit::schema::address_t& to,
            const remit::schema::amount_t& amount);
  void burn(const remit::schema::address_t& from,
            const remit::schema::amount_t& amount);

 protected:
  void move(const remit::schema::address_t& from,
            const remit::schema::address_t& to,
            const remit::schema::amount_t& amount);

  ledger::host& host_;
  remit::schema::address_t self_;

 private:
  void spend_allowance(const remit::schema::address_t& owner,
                       const remit::schema::address_t& spender,
                       const remit::schema::amount_t& amount);
  void emit_transfer(const remit::schema::address_t& from,
                     const remit::schema::address_t& to,
                     const remit::schema::amount_t& amount);

  std::string symbol_;
};

}  // namespace remit::token
