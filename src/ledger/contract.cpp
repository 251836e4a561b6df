#include <remit/ledger/contract.hpp>

namespace remit::ledger {

remit::schema::bytes_t contract::on_call(host&,
                                         const call_context& context,
                                         const remit::schema::bytes_view_t&) {
  throw execution_reverted{"contract " +
                           remit::schema::to_string(context.self) +
                           " does not accept calls"};
}

}  // namespace remit::ledger
