#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace streamledger::util {

/*
  Ledger object ids.

  Streams and viewer sessions are addressed by 32 random bytes rendered as
  "0x" + 64 lowercase hex characters.
*/

using ObjectID = std::array<uint8_t, 32>;

ObjectID GenerateObjectID();

std::string ToString(const ObjectID& id);

} // namespace streamledger::util
