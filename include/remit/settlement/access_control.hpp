#pragma once
#include <remit/ledger/host.hpp>
#include <remit/schema/primitives.hpp>

namespace remit::settlement {

/// Single-owner access control for governance and pause operations.
class access_control final {
 public:
  /// Fails with invalid_owner when `initial_owner` is the zero address.
  access_control(ledger::host& host,
                 const remit::schema::address_t& initial_owner);

  const remit::schema::address_t& owner() const;

  /// Fails with unauthorized_account unless `account` is the owner.
  void require_owner(const remit::schema::address_t& account) const;

  void transfer_ownership(const remit::schema::address_t& caller,
                          const remit::schema::address_t& new_owner);

  /// Leaves the engine without an owner; governance becomes unreachable.
  void renounce_ownership(const remit::schema::address_t& caller);

  void restore(const remit::schema::address_t& owner);

 private:
  void set_owner(const remit::schema::address_t& new_owner);

  ledger::host& host_;
  remit::schema::address_t owner_;
};

}  // namespace remit::settlement
