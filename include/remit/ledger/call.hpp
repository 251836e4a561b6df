#pragma once
#include <remit/schema/primitives.hpp>
#include <stdexcept>
#include <string>

namespace remit::ledger {

/// Failure raised by a contract; the message is the revert reason. Any
/// effect made since the enclosing call started is rolled back by the host.
class execution_reverted final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Identity of one invocation: who called, which contract runs, and the
/// native value that was moved to it before the body started.
struct call_context final {
  remit::schema::address_t caller{};
  remit::schema::address_t self{};
  remit::schema::amount_t value{};
};

struct call_result final {
  bool success{};
  remit::schema::bytes_t return_data;
  std::string reason;
};

}  // namespace remit::ledger
