#pragma once

namespace remit::settlement {

/// Mutual-exclusion flag around the settlement entry point.
class reentrancy_guard final {
 public:
  /// Holds the guard for its lifetime; construction fails with
  /// reentrant_call when the guard is already held.
  class scope final {
   public:
    explicit scope(reentrancy_guard& guard);
    ~scope();
    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;

   private:
    reentrancy_guard& guard_;
  };

  bool entered() const;

 private:
  bool entered_{};
};

}  // namespace remit::settlement
