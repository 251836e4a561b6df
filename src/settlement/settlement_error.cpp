#include <remit/settlement/settlement_error.hpp>

namespace remit::settlement {

namespace {

std::string make_message(const remit::schema::transaction_error_code code,
                         const std::string_view detail) {
  auto message = std::string{remit::schema::to_string(code)};
  if (!detail.empty()) {
    message.append(": ");
    message.append(detail);
  }
  return message;
}

}  // namespace

settlement_error::settlement_error(
    const remit::schema::transaction_error_code code,
    const std::string_view detail)
    : std::runtime_error{make_message(code, detail)},
      code_{code},
      detail_{detail} {}

remit::schema::transaction_error_code settlement_error::code() const noexcept {
  return code_;
}

const std::string& settlement_error::detail() const noexcept {
  return detail_;
}

}  // namespace remit::settlement
