#pragma once
#include <remit/schema/primitives.hpp>

namespace remit::token {

/// Standard fungible-token surface. The acting account is passed
/// explicitly; failures throw ledger::execution_reverted.
class fungible_token {
 public:
  virtual ~fungible_token() = default;

  virtual remit::schema::amount_t total_supply() const = 0;
  virtual remit::schema::amount_t balance_of(
      const remit::schema::address_t& account) const = 0;
  virtual remit::schema::amount_t allowance(
      const remit::schema::address_t& owner,
      const remit::schema::address_t& spender) const = 0;

  virtual void transfer(const remit::schema::address_t& sender,
                        const remit::schema::address_t& to,
                        const remit::schema::amount_t& amount) = 0;
  virtual void transfer_from(const remit::schema::address_t& spender,
                             const remit::schema::address_t& from,
                             const remit::schema::address_t& to,
                             const remit::schema::amount_t& amount) = 0;
  virtual void approve(const remit::schema::address_t& owner,
                       const remit::schema::address_t& spender,
                       const remit::schema::amount_t& amount) = 0;
  virtual void increase_allowance(const remit::schema::address_t& owner,
                                  const remit::schema::address_t& spender,
                                  const remit::schema::amount_t& added) = 0;
};

}  // namespace remit::token
