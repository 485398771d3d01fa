#pragma once

#include <cstdint>

namespace streamledger::ledger {

/*
  Native-currency accumulator.

  The value is unsigned and every mutation is checked: Deposit throws
  util::Overflow instead of wrapping, Withdraw throws util::InsufficientFunds
  instead of going below zero. A throwing call leaves the value untouched.
*/
class Balance {
 public:
  Balance() = default;
  explicit Balance(uint64_t value) : value_(value) {
  }

  uint64_t Value() const {
    return value_;
  }

  bool IsZero() const {
    return value_ == 0;
  }

  void Deposit(uint64_t amount);

  void Withdraw(uint64_t amount);

  // Empties the balance and returns what it held.
  uint64_t WithdrawAll();

 private:
  uint64_t value_ = 0;
};

// Checked a + b for counters that share the accumulator's overflow rule.
uint64_t CheckedAdd(uint64_t a, uint64_t b, const char* what);

} // namespace streamledger::ledger
