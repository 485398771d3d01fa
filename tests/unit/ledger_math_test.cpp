#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "internal/ledger/balance.hpp"
#include "internal/ledger/quality.hpp"
#include "internal/ledger/revenue_split.hpp"
#include "internal/model/stream_status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/object_id.hpp"

namespace {

using streamledger::ledger::Balance;
using streamledger::ledger::BuildRevenueSplits;
using streamledger::ledger::NormalizeTiers;
using streamledger::ledger::QualityPolicy;
using streamledger::ledger::ValidateTier;
using streamledger::model::CanTransition;
using streamledger::model::StreamStatus;

void TestBalanceDepositAndWithdraw() {
  Balance balance;
  assert(balance.IsZero());

  balance.Deposit(15);
  balance.Deposit(5);
  assert(balance.Value() == 20);

  balance.Withdraw(7);
  assert(balance.Value() == 13);

  assert(balance.WithdrawAll() == 13);
  assert(balance.IsZero());
}

void TestBalanceOverflowLeavesValueUntouched() {
  Balance balance(std::numeric_limits<uint64_t>::max() - 1);

  bool threw = false;
  try {
    balance.Deposit(2);
  } catch (const streamledger::util::Overflow&) {
    threw = true;
  }
  assert(threw);
  assert(balance.Value() == std::numeric_limits<uint64_t>::max() - 1);

  balance.Deposit(1);
  assert(balance.Value() == std::numeric_limits<uint64_t>::max());
}

void TestBalanceWithdrawBeyondValueIsRejected() {
  Balance balance(10);

  bool threw = false;
  try {
    balance.Withdraw(11);
  } catch (const streamledger::util::InsufficientFunds&) {
    threw = true;
  }
  assert(threw);
  assert(balance.Value() == 10);
}

void TestStatusTransitionsOnlyMoveForwardOneStep() {
  assert(CanTransition(StreamStatus::kCreated, StreamStatus::kLive));
  assert(CanTransition(StreamStatus::kLive, StreamStatus::kEnded));
  assert(CanTransition(StreamStatus::kEnded, StreamStatus::kArchived));

  assert(!CanTransition(StreamStatus::kCreated, StreamStatus::kCreated));
  assert(!CanTransition(StreamStatus::kCreated, StreamStatus::kEnded));
  assert(!CanTransition(StreamStatus::kLive, StreamStatus::kCreated));
  assert(!CanTransition(StreamStatus::kLive, StreamStatus::kLive));
  assert(!CanTransition(StreamStatus::kEnded, StreamStatus::kLive));
  assert(!CanTransition(StreamStatus::kArchived, StreamStatus::kCreated));
}

void TestQualityTierAtMaximumIsAccepted() {
  QualityPolicy policy;
  ValidateTier(policy, policy.max_tier);

  bool threw = false;
  try {
    ValidateTier(policy, policy.max_tier + 1);
  } catch (const streamledger::util::InvalidQuality&) {
    threw = true;
  }
  assert(threw);

  QualityPolicy capped{.max_tier = streamledger::ledger::kQuality720p, .session_tier = streamledger::ledger::kQuality480p};
  threw = false;
  try {
    ValidateTier(capped, streamledger::ledger::kQuality1080p);
  } catch (const streamledger::util::InvalidQuality&) {
    threw = true;
  }
  assert(threw);
}

void TestNormalizeTiersSortsAndDeduplicates() {
  const auto tiers = NormalizeTiers(QualityPolicy{}, {3, 2, 3, 0});
  assert((tiers == std::vector<uint32_t>{0, 2, 3}));

  bool threw = false;
  try {
    (void)NormalizeTiers(QualityPolicy{}, {});
  } catch (const streamledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRevenueSplitValidation() {
  const auto splits = BuildRevenueSplits({{"0xb", 2500}, {"0xa", 7500}});
  assert(splits.size() == 2);
  assert(streamledger::ledger::TotalBasisPoints(splits) == 10000);
  assert(splits.begin()->first == "0xa");

  auto rejects = [](const std::vector<std::pair<std::string, uint32_t>>& entries) {
    try {
      (void)BuildRevenueSplits(entries);
    } catch (const streamledger::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  assert(rejects({{"", 100}}));
  assert(rejects({{"0xa", 0}}));
  assert(rejects({{"0xa", 100}, {"0xa", 200}}));
  assert(rejects({{"0xa", 6000}, {"0xb", 4001}}));
  assert(BuildRevenueSplits({}).empty());
}

void TestObjectIdFormat() {
  const auto id = streamledger::util::ToString(streamledger::util::GenerateObjectID());
  assert(id.size() == 66);
  assert(id.rfind("0x", 0) == 0);
  for (size_t i = 2; i < id.size(); ++i) {
    assert((id[i] >= '0' && id[i] <= '9') || (id[i] >= 'a' && id[i] <= 'f'));
  }
  assert(streamledger::util::ToString(streamledger::util::GenerateObjectID()) != id);
}

} // namespace

int main() {
  TestBalanceDepositAndWithdraw();
  TestBalanceOverflowLeavesValueUntouched();
  TestBalanceWithdrawBeyondValueIsRejected();
  TestStatusTransitionsOnlyMoveForwardOneStep();
  TestQualityTierAtMaximumIsAccepted();
  TestNormalizeTiersSortsAndDeduplicates();
  TestRevenueSplitValidation();
  TestObjectIdFormat();

  std::cout << "streamledger_unit_ledger_math: pass\n";
  return 0;
}
