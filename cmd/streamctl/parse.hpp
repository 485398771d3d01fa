#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace streamledger::cli {

// Decimal digits only: no sign, no whitespace, and the value must fit in T.
template <typename T>
std::optional<T> ParseUnsigned(std::string_view text) {
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

// Comma separated tier list, e.g. "0,2,4". Empty items are skipped.
inline std::optional<std::vector<uint32_t>> ParseQualities(std::string_view csv) {
  std::vector<uint32_t> out;
  while (!csv.empty()) {
    const auto comma = csv.find(',');
    const auto item  = csv.substr(0, comma);
    if (!item.empty()) {
      const auto tier = ParseUnsigned<uint32_t>(item);
      if (!tier) return std::nullopt;
      out.push_back(*tier);
    }
    if (comma == std::string_view::npos) break;
    csv.remove_prefix(comma + 1);
  }
  return out;
}

} // namespace streamledger::cli
