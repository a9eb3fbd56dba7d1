/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - multi-format key-value config reader.
 */

#include "rsb/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

#include <unistd.h>

namespace {

/// Write @p text to a fresh temp file with extension @p ext.
std::string WriteTemp(const char* ext, const char* text) {
  char tmpl[] = "/tmp/rsb_config_XXXXXX";
  int fd = ::mkstemp(tmpl);
  REQUIRE(fd >= 0);
  ::close(fd);
  std::string path = std::string(tmpl) + "." + ext;
  std::remove(tmpl);
  FILE* fp = std::fopen(path.c_str(), "wb");
  REQUIRE(fp != nullptr);
  std::fputs(text, fp);
  std::fclose(fp);
  return path;
}

}  // namespace

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set then typed getters", "[config]") {
  rsb::MultiConfig cfg;
  REQUIRE(cfg.Set("server", "port", "8001"));
  REQUIRE(cfg.Set("server", "database", "rs485.db"));
  REQUIRE(cfg.Set("simulator", "enabled", "yes"));
  REQUIRE(cfg.Set("backend", "failure_threshold", "-4"));

  REQUIRE(cfg.GetPort("server", "port") == 8001);
  REQUIRE(std::strcmp(cfg.GetString("server", "database"), "rs485.db") == 0);
  REQUIRE(cfg.GetBool("simulator", "enabled"));
  REQUIRE(cfg.GetUint("backend", "failure_threshold", 3) == 3);
  REQUIRE(cfg.GetInt("backend", "failure_threshold") == -4);
  REQUIRE(cfg.EntryCount() == 4);
}

TEST_CASE("ConfigStore Set overwrites existing key", "[config]") {
  rsb::MultiConfig cfg;
  cfg.Set("log", "level", "INFO");
  cfg.Set("LOG", "Level", "DEBUG");
  REQUIRE(cfg.EntryCount() == 1);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "DEBUG") == 0);
}

TEST_CASE("ConfigStore defaults and optional getters", "[config]") {
  rsb::MultiConfig cfg;
  cfg.Set("backend", "port", "not-a-number");
  REQUIRE(cfg.GetPort("backend", "port", 8000) == 8000);
  REQUIRE(cfg.GetDouble("backend", "missing", 1.5) == 1.5);
  REQUIRE(!cfg.FindInt("backend", "port").has_value());
  REQUIRE(!cfg.FindBool("backend", "autostart").has_value());
  REQUIRE(cfg.HasSection("backend"));
  REQUIRE(!cfg.HasSection("server"));
  REQUIRE(cfg.HasKey("backend", "port"));
}

TEST_CASE("ConfigStore GetPort clamps out-of-range values", "[config]") {
  rsb::MultiConfig cfg;
  cfg.Set("a", "hi", "70000");
  cfg.Set("a", "lo", "-1");
  REQUIRE(cfg.GetPort("a", "hi") == 65535);
  REQUIRE(cfg.GetPort("a", "lo") == 0);
}

// ============================================================================
// INI
// ============================================================================

#ifdef RSB_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer sections", "[config][ini]") {
  const char* ini =
      "[backend]\n"
      "program = python\n"
      "port = 8000\n"
      "[server]\n"
      "port = 9001\n";
  rsb::IniConfig cfg;
  auto r = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)),
                          rsb::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(std::strcmp(cfg.GetString("backend", "program"), "python") == 0);
  REQUIRE(cfg.GetPort("backend", "port") == 8000);
  REQUIRE(cfg.GetPort("server", "port") == 9001);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  rsb::IniConfig cfg;
  auto r = cfg.LoadFile("/nonexistent/rsb/bridge.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rsb::ConfigError::kFileNotFound);
}

TEST_CASE("INI rejects unsupported format", "[config][ini]") {
  rsb::IniConfig cfg;
  const char* data = "{}";
  auto r = cfg.LoadBuffer(data, 2, rsb::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rsb::ConfigError::kFormatNotSupported);
}

#endif

// ============================================================================
// JSON
// ============================================================================

#ifdef RSB_CONFIG_JSON_ENABLED

TEST_CASE("JSON nested sections and scalar types", "[config][json]") {
  const char* json = R"({
    "server": {"port": 8001, "database": "rs485.db"},
    "simulator": {"enabled": true, "interval_ms": 250},
    "backend": {"args": ["-m", "uvicorn", "app:app"]},
    "top": 1.25
  })";
  rsb::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                          rsb::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetPort("server", "port") == 8001);
  REQUIRE(cfg.GetBool("simulator", "enabled"));
  REQUIRE(cfg.GetUint("simulator", "interval_ms") == 250);
  REQUIRE(std::strcmp(cfg.GetString("backend", "args"), "-m uvicorn app:app") ==
          0);
  REQUIRE(cfg.GetDouble("", "top") == 1.25);
}

TEST_CASE("JSON parse error", "[config][json]") {
  rsb::JsonConfig cfg;
  const char* bad = "{\"server\": ";
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                          rsb::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rsb::ConfigError::kParseError);
}

TEST_CASE("JSON top-level array is rejected", "[config][json]") {
  rsb::JsonConfig cfg;
  const char* arr = "[1, 2]";
  auto r = cfg.LoadBuffer(arr, static_cast<uint32_t>(std::strlen(arr)),
                          rsb::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
}

#endif

// ============================================================================
// YAML
// ============================================================================

#ifdef RSB_CONFIG_YAML_ENABLED

TEST_CASE("YAML mapping and sequence", "[config][yaml]") {
  const char* yaml =
      "backend:\n"
      "  program: python\n"
      "  args: [\"-m\", \"uvicorn\"]\n"
      "  autostart: false\n"
      "server:\n"
      "  port: 8101\n";
  rsb::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)),
                          rsb::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(std::strcmp(cfg.GetString("backend", "args"), "-m uvicorn") == 0);
  REQUIRE(!cfg.GetBool("backend", "autostart", true));
  REQUIRE(cfg.GetPort("server", "port") == 8101);
}

#endif

// ============================================================================
// MultiConfig
// ============================================================================

#if defined(RSB_CONFIG_INI_ENABLED) && defined(RSB_CONFIG_JSON_ENABLED) && \
    defined(RSB_CONFIG_YAML_ENABLED)

TEST_CASE("MultiConfig picks backend from extension", "[config][multi]") {
  std::string ini = WriteTemp("ini", "[server]\nport = 7001\n");
  std::string json = WriteTemp("json", "{\"server\": {\"port\": 7002}}");
  std::string yaml = WriteTemp("yaml", "server:\n  port: 7003\n");

  rsb::MultiConfig a;
  REQUIRE(a.LoadFile(ini.c_str()).has_value());
  REQUIRE(a.GetPort("server", "port") == 7001);

  rsb::MultiConfig b;
  REQUIRE(b.LoadFile(json.c_str()).has_value());
  REQUIRE(b.GetPort("server", "port") == 7002);

  rsb::MultiConfig c;
  REQUIRE(c.LoadFile(yaml.c_str()).has_value());
  REQUIRE(c.GetPort("server", "port") == 7003);

  std::remove(ini.c_str());
  std::remove(json.c_str());
  std::remove(yaml.c_str());
}

#endif

TEST_CASE("Backend extension matching", "[config]") {
  REQUIRE(rsb::IniBackend::MatchesExtension("conf"));
  REQUIRE(rsb::JsonBackend::MatchesExtension("JSON"));
  REQUIRE(rsb::YamlBackend::MatchesExtension("yml"));
  REQUIRE(!rsb::YamlBackend::MatchesExtension("ini"));
}
