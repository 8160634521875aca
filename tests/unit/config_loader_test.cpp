#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using doccache::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "doccache_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const doccache::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestSqliteConfigFromFile() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\cache\\\"quoted\"\\docs.sqlite"
    busy_timeout_ms: 250
cache:
  max_batch_keys: 500
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\cache\\\"quoted\"\\docs.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.cache().max_batch_keys() == 500);
}

void TestMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(config.cache().max_batch_keys() == 0);
}

void TestEmptyDocumentSelectsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_database());
  assert(config.logging().level().empty());
  assert(config.cache().max_batch_keys() == 0);
}

void TestEmptyAndQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: ""
  pattern: "12345"
database:
  sqlite:
    path: ""
)");
  assert(config.logging().level().empty());
  assert(config.logging().pattern() == "12345");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path().empty());
}

void TestUnknownFieldsAreRejected() {
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYamlString("unknown_field: 123\n"); }));
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYamlString("cache:\n  batch: 3\n"); }));
}

void TestBatchLimitIsEnforced() {
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYamlString("cache:\n  max_batch_keys: 1000\n"); }));
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYamlString("cache:\n  max_batch_keys: -1\n"); }));

  auto config = ConfigLoader::LoadFromYamlString("cache:\n  max_batch_keys: 999\n");
  assert(config.cache().max_batch_keys() == 999);
}

void TestMissingFileAndBadSyntax() {
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/doccache/config.yaml"); }));
  assert(ThrowsInvalidArgument([] { (void)ConfigLoader::LoadFromYamlString("database: [unterminated\n"); }));
}

} // namespace

int main() {
  TestSqliteConfigFromFile();
  TestMemoryBackend();
  TestEmptyDocumentSelectsDefaults();
  TestEmptyAndQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestBatchLimitIsEnforced();
  TestMissingFileAndBadSyntax();

  std::cout << "doccache_unit_config_loader: pass\n";
  return 0;
}
