#include "record_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace streamledger::db::sql {

namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode column: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;
  if (json.empty()) {
    return message;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("decode column: " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::string EncodeTags(const std::vector<std::string>& tags) {
  google::protobuf::ListValue list;
  for (const auto& tag : tags) {
    list.add_values()->set_string_value(tag);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeTags(const std::string& json) {
  const auto               list = FromJson<google::protobuf::ListValue>(json);
  std::vector<std::string> tags;
  tags.reserve(list.values_size());
  for (const auto& value : list.values()) {
    tags.push_back(value.string_value());
  }
  return tags;
}

std::string EncodeQualityLevels(const std::vector<uint32_t>& levels) {
  google::protobuf::ListValue list;
  for (const auto level : levels) {
    list.add_values()->set_number_value(level);
  }
  return ToJson(list);
}

std::vector<uint32_t> DecodeQualityLevels(const std::string& json) {
  const auto            list = FromJson<google::protobuf::ListValue>(json);
  std::vector<uint32_t> levels;
  levels.reserve(list.values_size());
  for (const auto& value : list.values()) {
    levels.push_back(static_cast<uint32_t>(value.number_value()));
  }
  return levels;
}

std::string EncodeRevenueSplits(const streamledger::ledger::RevenueSplits& splits) {
  google::protobuf::Struct as_struct;
  for (const auto& [recipient, bps] : splits) {
    (*as_struct.mutable_fields())[recipient].set_number_value(bps);
  }
  return ToJson(as_struct);
}

streamledger::ledger::RevenueSplits DecodeRevenueSplits(const std::string& json) {
  const auto                          as_struct = FromJson<google::protobuf::Struct>(json);
  streamledger::ledger::RevenueSplits splits;
  for (const auto& [recipient, value] : as_struct.fields()) {
    splits[recipient] = static_cast<uint32_t>(value.number_value());
  }
  return splits;
}

} // namespace streamledger::db::sql
