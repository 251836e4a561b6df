#include <spdlog/spdlog.h>
#include <remit/settlement/events.hpp>
#include <remit/settlement/fee_governance.hpp>
#include <remit/settlement/settlement_error.hpp>

#include <iterator>
#include <string>

namespace remit::settlement {

namespace {

void require_valid_rate(const remit::schema::basis_points_t rate) {
  if (rate > remit::schema::kMaxFeeBasisPoints) {
    throw settlement_error{
        remit::schema::transaction_error_code::invalid_service_fee_percent,
        std::to_string(rate)};
  }
}

void require_address(const remit::schema::address_t& address) {
  if (remit::schema::is_zero(address)) {
    throw settlement_error{
        remit::schema::transaction_error_code::invalid_address};
  }
}

}  // namespace

fee_governance::fee_governance(ledger::host& host,
                               const access_control& access,
                               const remit::schema::address_t& fee_receiver,
                               const remit::schema::basis_points_t
                                   standard_fee_bps)
    : host_{host},
      access_{access},
      fee_receiver_{fee_receiver},
      standard_fee_bps_{standard_fee_bps} {
  require_address(fee_receiver);
  require_valid_rate(standard_fee_bps);
}

void fee_governance::set_standard_fee(
    const remit::schema::address_t& caller,
    const remit::schema::basis_points_t rate) {
  access_.require_owner(caller);
  require_valid_rate(rate);
  standard_fee_bps_ = rate;
  spdlog::info("standard fee set to {} bps", rate);
  host_.emit(events::fee_changed(rate));
}

void fee_governance::set_special_fee(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& account,
    const remit::schema::basis_points_t rate) {
  access_.require_owner(caller);
  require_address(account);
  require_valid_rate(rate);
  if (rate == 0) {
    special_fees_.erase(account);
  } else {
    special_fees_.insert_or_assign(account, rate);
  }
  spdlog::info("special fee for {} set to {} bps",
               remit::schema::to_string(account), rate);
  host_.emit(events::special_fee_changed(account, rate));
}

void fee_governance::set_fee_receiver(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& fee_receiver) {
  access_.require_owner(caller);
  require_address(fee_receiver);
  fee_receiver_ = fee_receiver;
  spdlog::info("fee receiver set to {}",
               remit::schema::to_string(fee_receiver));
  host_.emit(events::fee_receiver_changed(fee_receiver));
}

remit::schema::basis_points_t fee_governance::resolve(
    const remit::schema::address_t& account) const {
  auto special = special_fee(account);
  if (special != 0) {
    return special;
  }
  return standard_fee_bps_;
}

remit::schema::basis_points_t fee_governance::standard_fee() const {
  return standard_fee_bps_;
}

remit::schema::basis_points_t fee_governance::special_fee(
    const remit::schema::address_t& account) const {
  auto it = special_fees_.find(account);
  if (it == std::end(special_fees_)) {
    return 0;
  }
  return it->second;
}

const remit::schema::address_t& fee_governance::fee_receiver() const {
  return fee_receiver_;
}

std::vector<std::tuple<remit::schema::address_t, remit::schema::basis_points_t>>
fee_governance::special_fees() const {
  auto out = std::vector<
      std::tuple<remit::schema::address_t, remit::schema::basis_points_t>>{};
  out.reserve(special_fees_.size());
  for (const auto& [account, rate] : special_fees_) {
    out.emplace_back(account, rate);
  }
  return out;
}

void fee_governance::restore(
    const remit::schema::basis_points_t standard_fee_bps,
    const remit::schema::address_t& fee_receiver,
    const std::vector<std::tuple<remit::schema::address_t,
                                 remit::schema::basis_points_t>>& special_fees) {
  require_address(fee_receiver);
  require_valid_rate(standard_fee_bps);
  standard_fee_bps_ = standard_fee_bps;
  fee_receiver_ = fee_receiver;
  special_fees_.clear();
  for (const auto& [account, rate] : special_fees) {
    require_valid_rate(rate);
    if (rate != 0) {
      special_fees_.insert_or_assign(account, rate);
    }
  }
}

remit::schema::amount_t fee_governance::compute_fee(
    const remit::schema::amount_t& amount,
    const remit::schema::basis_points_t rate) {
  // Widen so amount * rate cannot wrap for amounts near the 256-bit limit.
  auto wide = boost::multiprecision::uint512_t{amount} * rate /
              remit::schema::kBasisPointsDenominator;
  return static_cast<remit::schema::amount_t>(wide);
}

}  // namespace remit::settlement
