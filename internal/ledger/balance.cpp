#include "balance.hpp"

#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace streamledger::ledger {

uint64_t CheckedAdd(uint64_t a, uint64_t b, const char* what) {
  if (b > std::numeric_limits<uint64_t>::max() - a) {
    throw streamledger::util::Overflow(std::string(what) + ": adding " + std::to_string(b) + " to " + std::to_string(a) +
                                       " overflows");
  }
  return a + b;
}

void Balance::Deposit(uint64_t amount) {
  value_ = CheckedAdd(value_, amount, "deposit");
}

void Balance::Withdraw(uint64_t amount) {
  if (amount > value_) {
    throw streamledger::util::InsufficientFunds("withdraw: requested " + std::to_string(amount) + " but balance holds " +
                                                std::to_string(value_));
  }
  value_ -= amount;
}

uint64_t Balance::WithdrawAll() {
  const auto amount = value_;
  value_            = 0;
  return amount;
}

} // namespace streamledger::ledger
