#pragma once
#include <remit/schema/transaction_error_code.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace remit::settlement {

/// Failure of a settlement or governance operation. The whole invocation is
/// rolled back by the caller; `code()` names the failure kind.
class settlement_error final : public std::runtime_error {
 public:
  explicit settlement_error(remit::schema::transaction_error_code code,
                            std::string_view detail = {});

  remit::schema::transaction_error_code code() const noexcept;
  const std::string& detail() const noexcept;

 private:
  remit::schema::transaction_error_code code_;
  std::string detail_;
};

}  // namespace remit::settlement
