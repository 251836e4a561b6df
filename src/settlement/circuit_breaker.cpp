#include <spdlog/spdlog.h>
#include <remit/settlement/circuit_breaker.hpp>
#include <remit/settlement/events.hpp>
#include <remit/settlement/settlement_error.hpp>

namespace remit::settlement {

circuit_breaker::circuit_breaker(ledger::host& host,
                                 const access_control& access)
    : host_{host}, access_{access} {}

bool circuit_breaker::paused() const {
  return paused_;
}

void circuit_breaker::pause(const remit::schema::address_t& caller) {
  access_.require_owner(caller);
  require_not_paused();
  paused_ = true;
  spdlog::warn("settlement paused by {}", remit::schema::to_string(caller));
  host_.emit(events::paused(caller));
}

void circuit_breaker::unpause(const remit::schema::address_t& caller) {
  access_.require_owner(caller);
  if (!paused_) {
    throw settlement_error{
        remit::schema::transaction_error_code::expected_pause};
  }
  paused_ = false;
  spdlog::info("settlement unpaused by {}", remit::schema::to_string(caller));
  host_.emit(events::unpaused(caller));
}

void circuit_breaker::require_not_paused() const {
  if (paused_) {
    throw settlement_error{
        remit::schema::transaction_error_code::enforced_pause};
  }
}

void circuit_breaker::restore(const bool paused) {
  paused_ = paused;
}

}  // namespace remit::settlement
