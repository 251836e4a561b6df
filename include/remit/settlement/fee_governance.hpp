#pragma once
#include <remit/ledger/host.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/settlement/access_control.hpp>
#include <map>
#include <tuple>
#include <vector>

namespace remit::settlement {

/// Standard fee rate, per-payee overrides and the fee receiver.
///
/// Rates are basis points capped at kMaxFeeBasisPoints. An override of zero
/// is the same as no override: `resolve` falls back to the standard rate.
class fee_governance final {
 public:
  /// Fails with invalid_address for a zero receiver and
  /// invalid_service_fee_percent for a rate above the cap.
  fee_governance(ledger::host& host,
                 const access_control& access,
                 const remit::schema::address_t& fee_receiver,
                 remit::schema::basis_points_t standard_fee_bps);

  void set_standard_fee(const remit::schema::address_t& caller,
                        remit::schema::basis_points_t rate);
  void set_special_fee(const remit::schema::address_t& caller,
                       const remit::schema::address_t& account,
                       remit::schema::basis_points_t rate);
  void set_fee_receiver(const remit::schema::address_t& caller,
                        const remit::schema::address_t& fee_receiver);

  /// Rate that applies to payouts to `account`.
  remit::schema::basis_points_t resolve(
      const remit::schema::address_t& account) const;

  remit::schema::basis_points_t standard_fee() const;
  remit::schema::basis_points_t special_fee(
      const remit::schema::address_t& account) const;
  const remit::schema::address_t& fee_receiver() const;
  std::vector<std::tuple<remit::schema::address_t, remit::schema::basis_points_t>>
  special_fees() const;

  void restore(
      remit::schema::basis_points_t standard_fee_bps,
      const remit::schema::address_t& fee_receiver,
      const std::vector<std::tuple<remit::schema::address_t,
                                   remit::schema::basis_points_t>>& special_fees);

  /// floor(amount * rate / 10000).
  static remit::schema::amount_t compute_fee(
      const remit::schema::amount_t& amount,
      remit::schema::basis_points_t rate);

 private:
  ledger::host& host_;
  const access_control& access_;
  remit::schema::address_t fee_receiver_;
  remit::schema::basis_points_t standard_fee_bps_{};
  std::map<remit::schema::address_t, remit::schema::basis_points_t>
      special_fees_;
};

}  // namespace remit::settlement
