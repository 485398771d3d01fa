#include "object_id.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace streamledger::util {

ObjectID GenerateObjectID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  ObjectID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());
  return id;
}

std::string ToString(const ObjectID& id) {
  std::ostringstream oss;
  oss << "0x";
  for (auto b : id) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return oss.str();
}

} // namespace streamledger::util
