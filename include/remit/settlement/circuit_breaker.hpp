#pragma once
#include <remit/ledger/host.hpp>
#include <remit/settlement/access_control.hpp>

namespace remit::settlement {

/// Owner-controlled switch that disables the settlement entry point.
class circuit_breaker final {
 public:
  circuit_breaker(ledger::host& host, const access_control& access);

  bool paused() const;

  /// Owner only; fails with enforced_pause when already paused.
  void pause(const remit::schema::address_t& caller);
  /// Owner only; fails with expected_pause when not paused.
  void unpause(const remit::schema::address_t& caller);

  /// Fails with enforced_pause while paused.
  void require_not_paused() const;

  void restore(bool paused);

 private:
  ledger::host& host_;
  const access_control& access_;
  bool paused_{};
};

}  // namespace remit::settlement
