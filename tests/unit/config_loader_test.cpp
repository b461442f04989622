#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using vault::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  try {
    (void)ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml_content).string());
  } catch (const vault::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\vault\\\"quoted\"\\vault.db"
    busy_timeout: "2s"
identity:
  default_record_source: hris
sessions:
  default_ttl: "300s"
  max_ttl: "3600s"
  max_requests: 50
  max_bytes: 2048
  failure_window: "600s"
  token_bytes: 24
  lockout_threshold: 0
risk:
  weights:
    device: 2
    network: 1
    behavior: 1
    content: 0
  tiers:
    full_max: 10
    standard_max: 30
    elevated_max: 70
  restricted_categories:
    - category: medical
      sensitivity: 90
    - category: payroll
      sensitivity: 60
  blocked_networks:
    - "203.0.113."
audit:
  sink: log
  async: true
  queue_capacity: 64
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "C:\\vault\\\"quoted\"\\vault.db");
  assert(config.database().sqlite().busy_timeout().seconds() == 2);
  assert(config.identity().default_record_source() == "hris");
  assert(config.sessions().default_ttl().seconds() == 300);
  assert(config.sessions().max_requests() == 50);
  assert(config.sessions().token_bytes() == 24);
  assert(config.sessions().has_lockout_threshold() && config.sessions().lockout_threshold() == 0 && "explicit zero disables lockout");
  assert(config.risk().weights().device() == 2.0);
  assert(config.risk().weights().content() == 0.0);
  assert(config.risk().tiers().elevated_max() == 70.0);
  assert(config.risk().restricted_categories_size() == 2);
  assert(config.risk().restricted_categories(0).category() == "medical");
  assert(config.risk().blocked_networks(0) == "203.0.113.");
  assert(config.audit().async());
  assert(config.audit().queue_capacity() == 64);
  assert(config.audit().max_retries() == 3 && "unset fields take defaults");
}

void TestMissingSectionsTakeDefaults() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("minimal", "logging:\n  level: warn\n").string());
  assert(config.database().has_memory());
  assert(config.sessions().default_ttl().seconds() == 600);
  assert(config.sessions().max_ttl().seconds() == 8 * 3600);
  assert(config.sessions().max_requests() == 100);
  assert(config.sessions().lockout_threshold() == 5);
  assert(config.risk().weights().network() == 1.0);
  assert(config.risk().tiers().full_max() == 20.0);
  assert(config.risk().tiers().standard_max() == 40.0);
  assert(config.risk().tiers().elevated_max() == 80.0);
  assert(config.audit().sink() == "log");

  auto defaults = ConfigLoader::Defaults();
  ConfigLoader::Validate(defaults);
  assert(defaults.identity().default_record_source() == "vault");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", "unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("negative_weight", "risk:\n  weights:\n    device: -1\n    network: 1\n    behavior: 1\n    content: 1\n"));
  assert(Rejects("zero_weights", "risk:\n  weights:\n    device: 0\n"));
  assert(Rejects("tiers_order", "risk:\n  tiers:\n    full_max: 50\n    standard_max: 40\n    elevated_max: 80\n"));
  assert(Rejects("tiers_range", "risk:\n  tiers:\n    full_max: 20\n    standard_max: 40\n    elevated_max: 180\n"));
  assert(Rejects("ttl_order", "sessions:\n  default_ttl: \"7200s\"\n  max_ttl: \"3600s\"\n"));
  assert(Rejects("sensitivity", "risk:\n  restricted_categories:\n    - category: medical\n      sensitivity: 140\n"));
  assert(Rejects("audit_sink", "audit:\n  sink: kafka\n"));
  assert(Rejects("short_token", "sessions:\n  token_bytes: 8\n"));
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/vault.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestMissingSectionsTakeDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileFails();

  std::cout << "vault_unit_config_loader: pass\n";
  return 0;
}
