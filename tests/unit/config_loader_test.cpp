#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "streamledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/streamledger/ledger.db"
    wal_mode: true
logging:
  level: debug
  include_trace_context: false
observability:
  tracing_enabled: false
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
  metrics:
    collection_interval_ms: 5000
ledger:
  max_quality_tier: 3
  default_quality_tier: 1
  moderator_address: 0x00ff
)");

  auto config = streamledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/streamledger/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().metrics().collection_interval_ms() == 5000);
  assert(config.ledger().has_max_quality_tier());
  assert(config.ledger().max_quality_tier() == 3);
  assert(config.ledger().default_quality_tier() == 1);
  // 0x-prefixed scalars are addresses, not hex numbers
  assert(config.ledger().moderator_address() == "0x00ff");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = streamledger::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\ledger\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto config = streamledger::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "8080"
ledger:
  moderator_address: "12345"
)");
  assert(config.server().bind_address() == "8080");
  assert(config.ledger().moderator_address() == "12345");
}

void TestEmptyDocumentIsDefaultConfig() {
  const auto config = streamledger::config::ConfigLoader::LoadFromYamlString("");
  assert(!config.has_server());
  assert(config.database().backend_case() == streamledger::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
  assert(!config.ledger().has_max_quality_tier());

  const auto policy = streamledger::factory::ResolveQualityPolicy(config.ledger());
  assert(policy.max_tier == 4);
  assert(policy.session_tier == 2);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
database:
  memory: {}
)");

  bool threw = false;
  try {
    (void)streamledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)streamledger::config::ConfigLoader::LoadFromYaml("/nonexistent/streamledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSessionTierAboveMaximumIsRejected() {
  const auto config = streamledger::config::ConfigLoader::LoadFromYamlString(R"(ledger:
  max_quality_tier: 2
  default_quality_tier: 3
)");

  bool threw = false;
  try {
    (void)streamledger::factory::ResolveQualityPolicy(config.ledger());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestSessionTierAboveMaximumIsRejected();

  std::cout << "streamledger_unit_config_loader: pass\n";
  return 0;
}
