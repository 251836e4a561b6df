#pragma once
#include <remit/token/fungible_token.hpp>

namespace remit::token {

/// Token backed one-to-one by native currency held at its own address.
class wrapped_native : public virtual fungible_token {
 public:
  /// Move `value` native units from `sender` and mint the same amount.
  virtual void deposit(const remit::schema::address_t& sender,
                       const remit::schema::amount_t& value) = 0;

  /// Burn `amount` from `sender` and send the native units back to it.
  virtual void withdraw(const remit::schema::address_t& sender,
                        const remit::schema::amount_t& amount) = 0;
};

}  // namespace remit::token
