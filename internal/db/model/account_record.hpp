#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

struct AccountRecord {
  std::string address;
  uint64_t    balance = 0;
};

} // namespace streamledger::db::model
