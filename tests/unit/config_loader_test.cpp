#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using warranty::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "warranty_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml, const std::string& needle) {
  try {
    ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

void TestFullConfigLoadsFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "0.0.0.0:50061"
  max_receive_message_bytes: 8388608
database:
  sqlite:
    path: "/var/lib/warranty/warranty.db"
logging:
  level: debug
batch:
  worker_threads: 8
  commit_chunk_size: 250
  max_retries: 0
  hard_failure_ratio: 0.05
  resume_interrupted: false
claims:
  bulk_update_limit: 50
repair:
  approval_overrun_ratio: 0.3
attachments:
  allowed_mime_types: ["image/png", "application/pdf"]
  max_image_bytes: 1048576
  builtin_scanner: true
  scan_workers: 2
coverage:
  excluded_issue_types: [water_damage]
  uncovered_estimated_cost_cents: 9900
public_api:
  product_cache_ttl_ms: 60000
  lookup_limit: 20
collaborators:
  products:
    - id: prod-phone
      sku: SKU-PHONE-1
      name: Smart Phone X
      warranty_period_months: 24
  customers:
    - id: cust-alice
      email: alice@example.com
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.server().max_receive_message_bytes() == 8388608);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/warranty/warranty.db");
  assert(config.logging().level() == "debug");

  // Explicit zeros survive on optional fields.
  assert(config.batch().has_max_retries());
  assert(config.batch().max_retries() == 0);
  assert(config.batch().hard_failure_ratio() == 0.05);
  assert(config.batch().has_resume_interrupted() && !config.batch().resume_interrupted());
  assert(config.batch().worker_threads() == 8);

  assert(config.claims().bulk_update_limit() == 50);
  assert(config.repair().approval_overrun_ratio() == 0.3);
  assert(config.attachments().allowed_mime_types_size() == 2);
  assert(config.attachments().builtin_scanner());
  assert(config.coverage().uncovered_estimated_cost_cents() == 9900);
  assert(config.public_api().lookup_limit() == 20);

  assert(config.collaborators().products_size() == 1);
  assert(config.collaborators().products(0).warranty_period_months() == 24);
  assert(config.collaborators().customers(0).email() == "alice@example.com");
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(!config.batch().has_hard_failure_ratio());
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "8080"
collaborators:
  products:
    - id: "0042"
      sku: "true"
)");
  assert(config.server().bind_address() == "8080");
  assert(config.collaborators().products(0).id() == "0042");
  assert(config.collaborators().products(0).sku() == "true");
}

void TestMemoryBackendSelected() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)",
                 "Invalid configuration"));
  assert(Rejects(R"(batch:
  workers: 4
)",
                 "Invalid configuration"));
}

void TestSemanticValidation() {
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n", "database.sqlite.path"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n", "database.postgres.connection_uri"));
  assert(Rejects("batch:\n  hard_failure_ratio: 1.5\n", "batch.hard_failure_ratio"));
  assert(Rejects("repair:\n  approval_overrun_ratio: -0.1\n", "repair.approval_overrun_ratio"));
  assert(Rejects("coverage:\n  uncovered_estimated_cost_cents: -1\n", "coverage.uncovered_estimated_cost_cents"));
  assert(Rejects("attachments:\n  allowed_mime_types: [pdf]\n", "attachments.allowed_mime_types"));
  assert(Rejects("collaborators:\n  products:\n    - sku: SKU-1\n", "collaborators.products"));
  assert(Rejects("collaborators:\n  customers:\n    - email: a@b.c\n", "collaborators.customers"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/warranty/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw && "missing config files must be reported");
}

} // namespace

int main() {
  TestFullConfigLoadsFromFile();
  TestEmptyDocumentIsAllDefaults();
  TestQuotedScalarsStayStrings();
  TestMemoryBackendSelected();
  TestUnknownFieldsAreRejected();
  TestSemanticValidation();
  TestMissingFileIsReported();

  std::cout << "warranty_config_loader: pass\n";
  return 0;
}
