#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using rulebook::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "rulebook_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(object_store:
  root_uri: "file:///tmp/rulebook-images"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  assert(config.queue().backend() == rulebook::runtime::config::QUEUE_BACKEND_MEMORY);
  assert(config.queue().list_name() == "image_processing_queue");
  assert(config.queue().job_ttl_sec() == 86400);
  assert(config.queue().dequeue_timeout_ms() == 30000);
  assert(config.queue().default_max_retries() == 3);

  assert(config.ai().enable_ocr());
  assert(config.ai().enable_description());
  assert(config.ai().enable_labels());
  assert(config.ai().embedding_dimensions() == 1536);
  assert(!config.ai().labeling_prompt().empty());

  assert(config.workers().threads() == 1);
  assert(config.batch().max_retries() == 3);
  assert(config.reconciliation().enabled());
  assert(config.reconciliation().interval_sec() == 300);
  assert(config.reconciliation().orphan_age_sec() == 900);
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/rulebook/rulebook.db"
queue:
  backend: QUEUE_BACKEND_SQLITE
  sqlite_path: "/var/lib/rulebook/queue.db"
  dequeue_timeout_ms: 500
object_store:
  root_uri: "s3://rulebooks/images"
  public_base_url: "https://cdn.example.com/images"
ai:
  endpoint: "https://api.openai.com/v1"
  vision_model: "gpt-4o"
  embedding_model: "text-embedding-3-small"
  embedding_dimensions: 256
  enable_description: false
workers:
  threads: 4
reconciliation:
  enabled: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "/var/lib/rulebook/rulebook.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.queue().backend() == rulebook::runtime::config::QUEUE_BACKEND_SQLITE);
  assert(config.queue().dequeue_timeout_ms() == 500);
  assert(config.object_store().public_base_url() == "https://cdn.example.com/images");
  assert(config.ai().embedding_dimensions() == 256);
  assert(config.ai().enable_ocr());
  assert(!config.ai().enable_description());
  assert(config.workers().threads() == 4);
  assert(!config.reconciliation().enabled());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\rulebook\\\"quoted\"\\db.sqlite"
    wal_mode: true
object_store:
  root_uri: "file:///tmp/rulebook-images"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\rulebook\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
object_store:
  root_uri: "file:///tmp/rulebook-images"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestApiKeyComesFromEnvironment() {
  const auto yaml_path = WriteYaml("env_key",
                                   R"(object_store:
  root_uri: "file:///tmp/rulebook-images"
ai:
  api_key: "from-file"
)");

  setenv("RULEBOOK_AI_API_KEY", "from-env", 1);
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  unsetenv("RULEBOOK_AI_API_KEY");

  assert(config.ai().api_key() == "from-env");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
object_store:
  root_uri: "file:///tmp/rulebook-images"
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("missing_object_store", R"(server:
  bind_address: "0.0.0.0:50051"
)"));

  assert(Rejects("sqlite_queue_without_path", R"(queue:
  backend: QUEUE_BACKEND_SQLITE
object_store:
  root_uri: "file:///tmp/rulebook-images"
)"));

  assert(Rejects("postgres_without_uri", R"(database:
  postgres:
    pool_size: 4
object_store:
  root_uri: "file:///tmp/rulebook-images"
)"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/rulebook.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestApiKeyComesFromEnvironment();
  TestUnknownFieldsAreRejected();
  TestInvalidConfigsAreRejected();

  std::cout << "rulebook_unit_config_loader: pass\n";
  return 0;
}
