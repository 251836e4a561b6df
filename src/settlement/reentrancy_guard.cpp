#include <remit/settlement/reentrancy_guard.hpp>
#include <remit/settlement/settlement_error.hpp>

namespace remit::settlement {

reentrancy_guard::scope::scope(reentrancy_guard& guard) : guard_{guard} {
  if (guard_.entered_) {
    throw settlement_error{
        remit::schema::transaction_error_code::reentrant_call};
  }
  guard_.entered_ = true;
}

reentrancy_guard::scope::~scope() {
  guard_.entered_ = false;
}

bool reentrancy_guard::entered() const {
  return entered_;
}

}  // namespace remit::settlement
