#include "test_framework.hpp"

#include "docsandbox/common/toml.hpp"
#include "docsandbox/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

/// Clears every variable the loader reads and restores them afterwards.
struct CleanEnv {
  std::vector<std::unique_ptr<EnvGuard>> guards;

  CleanEnv() {
    for (const char *name :
         {"DOCSANDBOX_CONFIG_PATH", "DOCSANDBOX_ENV_FILE", "DOCSANDBOX_SESSION_LIFETIME",
          "DOCSANDBOX_CLEANUP_INTERVAL", "DOCSANDBOX_WATCH_MODE", "DOCSANDBOX_POLL_INTERVAL",
          "DOCSANDBOX_DEBOUNCE", "DOCSANDBOX_WORKSPACES_DIR", "DOCSANDBOX_TEMPLATE_DIR",
          "DOCSANDBOX_LOG_LEVEL"}) {
      guards.push_back(std::make_unique<EnvGuard>(name, std::nullopt));
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = docsandbox::config::config_path_override();
    if (next.has_value()) {
      docsandbox::config::set_config_path_override(*next);
    } else {
      docsandbox::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      docsandbox::config::set_config_path_override(*old_override);
    } else {
      docsandbox::config::clear_config_path_override();
    }
  }
};

bool has_warning_containing(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<docsandbox::tests::TestCase> &tests) {
  using docsandbox::tests::require;
  namespace cfg = docsandbox::config;
  namespace common = docsandbox::common;
  namespace dt = docsandbox::testing;
  using namespace std::chrono_literals;

  tests.push_back({"config_defaults_match_deployment", [] {
                     const cfg::Config config;
                     require(config.sessions.lifetime == 1h, "lifetime default");
                     require(config.sessions.cleanup_interval == 5min, "cleanup default");
                     require(config.watcher.mode == "polling", "mode default");
                     require(config.watcher.poll_interval == 1s, "poll default");
                     require(config.watcher.debounce == 500ms, "debounce default");
                     require(config.watcher.extensions.size() == 3, "extension default");
                     require(config.workspace.main_file == "index.html", "main file default");
                     require(config.workspace.artifact_file == "output.pdf", "artifact default");
                     require(config.renderer.command == "weasyprint", "renderer default");
                   }});

  tests.push_back({"config_parse_duration_units", [] {
                     require(common::parse_duration("250ms").value() == 250ms, "ms unit");
                     require(common::parse_duration("30s").value() == 30s, "s unit");
                     require(common::parse_duration("5m").value() == 5min, "m unit");
                     require(common::parse_duration("2h").value() == 2h, "h unit");
                     require(common::parse_duration("45").value() == 45s, "bare seconds");
                     require(!common::parse_duration("5x").ok(), "unknown unit accepted");
                     require(!common::parse_duration("fast").ok(), "word accepted");
                     require(!common::parse_duration("").ok(), "empty accepted");
                     require(common::format_duration(1h) == "1h", "format hours");
                     require(common::format_duration(5min) == "5m", "format minutes");
                     require(common::format_duration(1500ms) == "1500ms", "format millis");
                   }});

  tests.push_back({"config_parse_reads_sections", [] {
                     const std::string toml = R"(
[sessions]
lifetime = "90s"
cleanup_interval = "10s"

[watcher]
mode = "NATIVE"
poll_interval = "250ms"
debounce = "1s"
extensions = [".html", ".md"]

[workspace]
root = "/srv/workspaces"
main_file = "main.html"
protected_files = ["main.html"]

[renderer]
command = "/usr/bin/weasyprint"
args = ["--quiet"]

[template]
inject_now = false

[observability]
backend = "log"
log_level = "debug"
)";
                     auto parsed = cfg::parse_config(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &c = parsed.value();
                     require(c.sessions.lifetime == 90s, "lifetime");
                     require(c.sessions.cleanup_interval == 10s, "cleanup");
                     require(c.watcher.mode == "native", "mode lowercased");
                     require(c.watcher.poll_interval == 250ms, "poll");
                     require(c.watcher.debounce == 1s, "debounce");
                     require(c.watcher.extensions.size() == 2 && c.watcher.extensions[1] == ".md",
                             "extensions");
                     require(c.workspace.root == "/srv/workspaces", "root");
                     require(c.workspace.main_file == "main.html", "main file");
                     require(c.workspace.protected_files.size() == 1, "protected files");
                     require(c.renderer.args.size() == 1 && c.renderer.args[0] == "--quiet", "args");
                     require(!c.templates.inject_now, "inject_now");
                     require(c.observability.log_level == "debug", "log level");
                   }});

  tests.push_back({"config_parse_rejects_bad_duration", [] {
                     auto parsed = cfg::parse_config("[watcher]\ndebounce = \"soon\"\n");
                     require(!parsed.ok(), "bad duration accepted");
                     require(parsed.code() == common::ErrorCode::Config, "wrong error code");
                   }});

  tests.push_back({"config_validate_accepts_sane_config", [] {
                     dt::TempDir dir;
                     dt::write_template(dir);
                     auto config = dt::temp_config(dir);
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "unexpected warnings");
                     require(std::filesystem::is_directory(dir.path() / "workspaces"),
                             "workspaces root not created");
                   }});

  tests.push_back({"config_validate_fatal_errors", [] {
                     dt::TempDir dir;
                     const auto base = dt::temp_config(dir);

                     auto zero_lifetime = base;
                     zero_lifetime.sessions.lifetime = 0ms;
                     require(!cfg::validate_config(zero_lifetime).ok(), "zero lifetime accepted");

                     auto zero_cleanup = base;
                     zero_cleanup.sessions.cleanup_interval = 0ms;
                     require(!cfg::validate_config(zero_cleanup).ok(), "zero cleanup accepted");

                     auto bad_mode = base;
                     bad_mode.watcher.mode = "fsevents";
                     auto mode_result = cfg::validate_config(bad_mode);
                     require(!mode_result.ok(), "unknown mode accepted");
                     require(mode_result.code() == common::ErrorCode::Config, "mode error code");

                     auto no_extensions = base;
                     no_extensions.watcher.extensions.clear();
                     require(!cfg::validate_config(no_extensions).ok(), "empty extensions accepted");

                     auto bare_extension = base;
                     bare_extension.watcher.extensions = {"html"};
                     require(!cfg::validate_config(bare_extension).ok(),
                             "extension without dot accepted");

                     auto empty_root = base;
                     empty_root.workspace.root = "  ";
                     require(!cfg::validate_config(empty_root).ok(), "empty root accepted");

                     auto escaping_main = base;
                     escaping_main.workspace.main_file = "../index.html";
                     require(!cfg::validate_config(escaping_main).ok(), "escaping main accepted");

                     auto no_renderer = base;
                     no_renderer.renderer.command = "";
                     require(!cfg::validate_config(no_renderer).ok(), "empty renderer accepted");

                     auto bad_backend = base;
                     bad_backend.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown backend accepted");

                     auto bad_level = base;
                     bad_level.observability.log_level = "verbose";
                     require(!cfg::validate_config(bad_level).ok(), "unknown level accepted");
                   }});

  tests.push_back({"config_validate_rejects_uncreatable_root", [] {
                     dt::TempDir dir;
                     dir.create_file("blocker", "not a directory");
                     auto config = dt::temp_config(dir);
                     config.workspace.root = (dir.path() / "blocker" / "workspaces").string();
                     auto validated = cfg::validate_config(config);
                     require(!validated.ok(), "root under a file accepted");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     dt::TempDir dir;
                     auto config = dt::temp_config(dir);
                     config.watcher.poll_interval = 2s;
                     config.watcher.debounce = 500ms;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(has_warning_containing(validated.value(), "poll_interval"),
                             "missing poll warning");
                     require(has_warning_containing(validated.value(), "template_dir"),
                             "missing template warning");

                     config.watcher.mode = "native";
                     auto native = cfg::validate_config(config);
                     require(native.ok(), native.error());
                     require(!has_warning_containing(native.value(), "poll_interval"),
                             "poll warning in native mode");
                   }});

  tests.push_back({"config_load_applies_file_and_env", [] {
                     const CleanEnv clean;
                     dt::TempDir dir;
                     dir.create_file("config.toml",
                                     "[sessions]\nlifetime = \"2h\"\n[watcher]\ndebounce = \"300ms\"\n");
                     const ConfigOverrideGuard override_guard(dir.path() / "config.toml");
                     const EnvGuard debounce("DOCSANDBOX_DEBOUNCE", "750ms");
                     const EnvGuard mode("DOCSANDBOX_WATCH_MODE", "native");
                     const EnvGuard root("DOCSANDBOX_WORKSPACES_DIR",
                                         (dir.path() / "ws").string());

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sessions.lifetime == 2h, "file value lost");
                     require(loaded.value().watcher.debounce == 750ms, "env did not win");
                     require(loaded.value().watcher.mode == "native", "mode override");
                     require(loaded.value().workspace.root == (dir.path() / "ws").string(),
                             "root override");
                   }});

  tests.push_back({"config_load_rejects_bad_env_duration", [] {
                     const CleanEnv clean;
                     dt::TempDir dir;
                     const ConfigOverrideGuard override_guard(dir.path() / "config.toml");
                     const EnvGuard lifetime("DOCSANDBOX_SESSION_LIFETIME", "forever");
                     auto loaded = cfg::load_config();
                     require(!loaded.ok(), "bad env duration accepted");
                     require(loaded.code() == common::ErrorCode::Config, "wrong code");
                   }});

  tests.push_back({"config_load_reads_dotenv_without_overriding_env", [] {
                     const CleanEnv clean;
                     dt::TempDir dir;
                     dir.create_file(".env", "DOCSANDBOX_LOG_LEVEL=\"debug\"\n"
                                             "# comment\n"
                                             "DOCSANDBOX_POLL_INTERVAL=2s\n");
                     const ConfigOverrideGuard override_guard(dir.path() / "config.toml");
                     const EnvGuard poll("DOCSANDBOX_POLL_INTERVAL", "3s");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().observability.log_level == "debug", ".env ignored");
                     require(loaded.value().watcher.poll_interval == 3s,
                             ".env replaced an existing variable");
                   }});

  tests.push_back({"config_save_then_load_round_trip", [] {
                     const CleanEnv clean;
                     dt::TempDir dir;
                     const ConfigOverrideGuard override_guard(dir.path() / "config.toml");
                     cfg::Config config;
                     config.sessions.lifetime = 45min;
                     config.watcher.extensions = {".html", ".svg"};
                     config.workspace.root = (dir.path() / "ws").string();
                     config.renderer.args = {"--presentational-hints"};
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config file missing after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sessions.lifetime == 45min, "lifetime lost");
                     require(loaded.value().watcher.extensions.size() == 2, "extensions lost");
                     require(loaded.value().renderer.args.size() == 1, "args lost");
                     require(cfg::render_config_toml(loaded.value()).find("[watcher]") !=
                                 std::string::npos,
                             "rendered toml missing section");
                   }});
}
