#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vodbridge_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = vodbridge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50071");
  assert(config.host().action_method() == "Addons.ExecuteAddon");
  assert(config.backend().candidate_ids_size() == 3);
  assert(config.backend().strategies(0) == "direct");
  assert(config.backend().strategies(1) == "rpc");
  assert(config.cache().enabled());
  assert(config.cache().ttl_seconds() == 300);
  assert(config.cache().playable_ttl_seconds() == 60);
  assert(config.content().rail_limit() == 20);
  assert(config.content().search_limit() == 30);
  assert(config.preflight().enabled());
  assert(config.preflight().component_id() == "inputstream.adaptive");
  assert(config.diagnostics().home_cold_threshold_ms() == 1500.0);
  assert(config.diagnostics().rail_warm_threshold_ms() == 100.0);
  assert(config.direct().methods().playable_size() == 0);
}

void TestExplicitValuesSurviveDefaulting() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(server:
  bind_address: "0.0.0.0:6000"
backend:
  candidate_ids: ["ext.a", "ext.b"]
  strategies: [rpc]
cache:
  root_path: /var/cache/vodbridge
  enabled: false
  ttl_seconds: 120
preflight:
  enabled: false
direct:
  methods:
    playable: [resolve_stream]
)");

  auto config = vodbridge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:6000");
  assert(config.backend().candidate_ids_size() == 2);
  assert(config.backend().strategies_size() == 1);
  assert(config.backend().category() == "xbmc.python.pluginsource");
  assert(!config.cache().enabled());
  assert(config.cache().ttl_seconds() == 120);
  assert(config.cache().playable_ttl_seconds() == 60);
  assert(config.cache().root_path() == "/var/cache/vodbridge");
  assert(!config.preflight().enabled());
  assert(config.direct().methods().playable(0) == "resolve_stream");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(content:
  root_rail_id: "1234"
host:
  password: "true"
)");

  auto config = vodbridge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.content().root_rail_id() == "1234");
  assert(config.host().password() == "true");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = vodbridge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)vodbridge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)vodbridge::config::ConfigLoader::LoadFromYaml("/nonexistent/vodbridge.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestExplicitValuesSurviveDefaulting();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "vodbridge_unit_config_loader: pass\n";
  return 0;
}
