#pragma once
#include <remit/ledger/call.hpp>

namespace remit::ledger {

class host;

/// Code deployed at an address. Typed collaborators derive from this and
/// expose their interface directly; `on_call` is the opaque-payload entry
/// used for exchanges, receivers and plain value transfers.
class contract {
 public:
  virtual ~contract() = default;

  /// Handle a low-level call. Throw execution_reverted to fail it.
  virtual remit::schema::bytes_t on_call(
      host& host,
      const call_context& context,
      const remit::schema::bytes_view_t& data);
};

}  // namespace remit::ledger
