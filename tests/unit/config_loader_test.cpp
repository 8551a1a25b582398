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
  const auto base_dir = std::filesystem::temp_directory_path() / "millsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  try {
    (void)millsync::config::ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml_content).string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/millsync/mill.db"
    wal_mode: true
sync:
  batch_size: 25
  max_retries: 5
  max_records_per_pass: 200
  use_batch_endpoints: false
  purge_synced: true
  periodic_interval: "5m"
logging:
  level: debug
device:
  device_id: "0042"
)");

  const auto config = millsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/millsync/mill.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.sync().batch_size() == 25);
  assert(config.sync().max_retries() == 5);
  assert(config.sync().purge_synced());
  assert(config.sync().periodic_interval() == "5m");
  assert(config.logging().level() == "debug");
  assert(config.device().device_id() == "0042");

  const auto options = millsync::factory::SyncOptionsFrom(config.sync());
  assert(options.batch_size == 25);
  assert(options.max_records_per_pass == 200);
  assert(!options.use_batch_endpoints);
  assert(options.pull_enabled);
}

void TestDefaultsForOmittedSections() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(database:
  memory: {}
)");

  const auto config = millsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.sync().has_use_batch_endpoints());

  const auto options = millsync::factory::SyncOptionsFrom(config.sync());
  assert(options.batch_size == 50);
  assert(options.max_records_per_pass == 500);
  assert(options.use_batch_endpoints);
  assert(options.pull_enabled);
}

void TestScalarEscaping() {
  const auto yaml_path = WriteYaml("escaping",
                                   R"(database:
  sqlite:
    path: "C:\\mill\\\"quoted\"\\data.db"
device:
  device_id: "kiosk\nnorth☃"
)");

  const auto config = millsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\mill\\\"quoted\"\\data.db");
  assert(config.device().device_id() == std::string("kiosk\nnorth☃"));
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field", R"(database:
  memory: {}
unknown_field: 123
)"));

  assert(Rejects("unknown_nested", R"(sync:
  batch_size: 10
  retries: 3
)"));

  assert(Rejects("bad_interval", R"(sync:
  periodic_interval: "five minutes"
)"));

  assert(Rejects("bad_unit", R"(sync:
  periodic_interval: "5d"
)"));

  assert(Rejects("empty_sqlite_path", R"(database:
  sqlite:
    path: ""
)"));

  bool threw = false;
  try {
    (void)millsync::config::ConfigLoader::LoadFromYaml("/nonexistent/millsync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must fail on a missing file.");
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsForOmittedSections();
  TestScalarEscaping();
  TestInvalidConfigsAreRejected();

  std::cout << "millsync_unit_config_loader: pass\n";
  return 0;
}
