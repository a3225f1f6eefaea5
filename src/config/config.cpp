#include "docsandbox/config/config.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace docsandbox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".docsandbox";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("DOCSANDBOX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("DOCSANDBOX_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

common::Status env_duration(const char *name, std::chrono::milliseconds &target) {
  const auto raw = env_value(name);
  if (!raw.has_value()) {
    return common::Status::success();
  }
  auto parsed = common::parse_duration(*raw);
  if (!parsed.ok()) {
    return common::Status::error(std::string(name) + ": " + parsed.error(),
                                 common::ErrorCode::Config);
  }
  target = parsed.value();
  return common::Status::success();
}

bool is_known_backend(const std::string &backend) {
  return backend == "log" || backend == "noop" || backend == "none";
}

bool is_known_log_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool is_plain_relative_name(const std::string &value) {
  const std::filesystem::path path(value);
  if (value.empty() || path.is_absolute()) {
    return false;
  }
  for (const auto &part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::Config);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), common::ErrorCode::Config);
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

common::Status apply_env_overrides(Config &config) {
  load_dotenv_files();

  auto status = env_duration("DOCSANDBOX_SESSION_LIFETIME", config.sessions.lifetime);
  if (!status.ok()) {
    return status;
  }
  status = env_duration("DOCSANDBOX_CLEANUP_INTERVAL", config.sessions.cleanup_interval);
  if (!status.ok()) {
    return status;
  }
  status = env_duration("DOCSANDBOX_POLL_INTERVAL", config.watcher.poll_interval);
  if (!status.ok()) {
    return status;
  }
  status = env_duration("DOCSANDBOX_DEBOUNCE", config.watcher.debounce);
  if (!status.ok()) {
    return status;
  }

  if (const auto mode = env_value("DOCSANDBOX_WATCH_MODE"); mode.has_value()) {
    config.watcher.mode = common::to_lower(common::trim(*mode));
  }
  if (const auto root = env_value("DOCSANDBOX_WORKSPACES_DIR"); root.has_value()) {
    config.workspace.root = expand_config_path(*root);
  }
  if (const auto dir = env_value("DOCSANDBOX_TEMPLATE_DIR"); dir.has_value()) {
    config.workspace.template_dir = expand_config_path(*dir);
  }
  if (const auto level = env_value("DOCSANDBOX_LOG_LEVEL"); level.has_value()) {
    config.observability.log_level = common::to_lower(common::trim(*level));
  }
  return common::Status::success();
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), common::ErrorCode::Config);
  }
  const auto &doc = parsed.value();

  Config config;

  auto lifetime = doc.get_duration("sessions.lifetime", config.sessions.lifetime);
  if (!lifetime.ok()) {
    return common::Result<Config>::failure(lifetime.status());
  }
  config.sessions.lifetime = lifetime.value();
  auto cleanup = doc.get_duration("sessions.cleanup_interval", config.sessions.cleanup_interval);
  if (!cleanup.ok()) {
    return common::Result<Config>::failure(cleanup.status());
  }
  config.sessions.cleanup_interval = cleanup.value();

  config.watcher.enabled = doc.get_bool("watcher.enabled", config.watcher.enabled);
  config.watcher.mode = common::to_lower(doc.get_string("watcher.mode", config.watcher.mode));
  auto poll = doc.get_duration("watcher.poll_interval", config.watcher.poll_interval);
  if (!poll.ok()) {
    return common::Result<Config>::failure(poll.status());
  }
  config.watcher.poll_interval = poll.value();
  auto debounce = doc.get_duration("watcher.debounce", config.watcher.debounce);
  if (!debounce.ok()) {
    return common::Result<Config>::failure(debounce.status());
  }
  config.watcher.debounce = debounce.value();
  config.watcher.extensions = doc.get_string_array("watcher.extensions", config.watcher.extensions);

  config.workspace.root = expand_config_path(doc.get_string("workspace.root", config.workspace.root));
  config.workspace.template_dir =
      expand_config_path(doc.get_string("workspace.template_dir", config.workspace.template_dir));
  config.workspace.main_file = doc.get_string("workspace.main_file", config.workspace.main_file);
  config.workspace.params_file =
      doc.get_string("workspace.params_file", config.workspace.params_file);
  config.workspace.artifact_file =
      doc.get_string("workspace.artifact_file", config.workspace.artifact_file);
  config.workspace.protected_files =
      doc.get_string_array("workspace.protected_files", config.workspace.protected_files);

  config.renderer.command =
      expand_config_path(doc.get_string("renderer.command", config.renderer.command));
  config.renderer.args = doc.get_string_array("renderer.args", config.renderer.args);

  config.templates.inject_now = doc.get_bool("template.inject_now", config.templates.inject_now);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.log_level =
      common::to_lower(doc.get_string("observability.log_level", config.observability.log_level));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  Config config;
  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto content = common::read_text_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                             common::ErrorCode::Config);
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                             common::ErrorCode::Config);
    }
    config = std::move(parsed.value());
  } else {
    config.workspace.root = expand_config_path(config.workspace.root);
    config.workspace.template_dir = expand_config_path(config.workspace.template_dir);
  }

  auto env_status = apply_env_overrides(config);
  if (!env_status.ok()) {
    return common::Result<Config>::failure(env_status);
  }
  return common::Result<Config>::success(std::move(config));
}

std::string render_config_toml(const Config &config) {
  std::ostringstream out;
  out << "[sessions]\n";
  out << "lifetime = " << common::quote_toml_string(common::format_duration(config.sessions.lifetime))
      << "\n";
  out << "cleanup_interval = "
      << common::quote_toml_string(common::format_duration(config.sessions.cleanup_interval))
      << "\n\n";

  out << "[watcher]\n";
  out << "enabled = " << bool_to_toml(config.watcher.enabled) << "\n";
  out << "mode = " << common::quote_toml_string(config.watcher.mode) << "\n";
  out << "poll_interval = "
      << common::quote_toml_string(common::format_duration(config.watcher.poll_interval)) << "\n";
  out << "debounce = " << common::quote_toml_string(common::format_duration(config.watcher.debounce))
      << "\n";
  out << "extensions = " << string_array_to_toml(config.watcher.extensions) << "\n\n";

  out << "[workspace]\n";
  out << "root = " << common::quote_toml_string(config.workspace.root) << "\n";
  out << "template_dir = " << common::quote_toml_string(config.workspace.template_dir) << "\n";
  out << "main_file = " << common::quote_toml_string(config.workspace.main_file) << "\n";
  out << "params_file = " << common::quote_toml_string(config.workspace.params_file) << "\n";
  out << "artifact_file = " << common::quote_toml_string(config.workspace.artifact_file) << "\n";
  out << "protected_files = " << string_array_to_toml(config.workspace.protected_files) << "\n\n";

  out << "[renderer]\n";
  out << "command = " << common::quote_toml_string(config.renderer.command) << "\n";
  out << "args = " << string_array_to_toml(config.renderer.args) << "\n\n";

  out << "[template]\n";
  out << "inject_now = " << bool_to_toml(config.templates.inject_now) << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }
  std::filesystem::path tmp = path.value();
  tmp += ".tmp";
  auto written = common::write_text_file(tmp, render_config_toml(config));
  if (!written.ok()) {
    return written;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path.value(), ec);
  if (ec) {
    return common::Status::error("failed replacing config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.sessions.lifetime.count() <= 0) {
    return Warnings::failure("sessions.lifetime must be > 0", common::ErrorCode::Config);
  }
  if (config.sessions.cleanup_interval.count() <= 0) {
    return Warnings::failure("sessions.cleanup_interval must be > 0", common::ErrorCode::Config);
  }

  const std::string mode = common::to_lower(common::trim(config.watcher.mode));
  if (mode != "polling" && mode != "native") {
    return Warnings::failure("Invalid watcher.mode: " + config.watcher.mode,
                             common::ErrorCode::Config);
  }
  if (config.watcher.poll_interval.count() <= 0) {
    return Warnings::failure("watcher.poll_interval must be > 0", common::ErrorCode::Config);
  }
  if (config.watcher.debounce.count() < 0) {
    return Warnings::failure("watcher.debounce must not be negative", common::ErrorCode::Config);
  }
  if (config.watcher.extensions.empty()) {
    return Warnings::failure("watcher.extensions must not be empty", common::ErrorCode::Config);
  }
  for (const auto &extension : config.watcher.extensions) {
    if (extension.size() < 2 || extension.front() != '.') {
      return Warnings::failure("watcher.extensions entries must look like \".ext\": " + extension,
                               common::ErrorCode::Config);
    }
  }
  if (mode == "polling" && config.watcher.poll_interval > config.watcher.debounce) {
    warnings.push_back("watcher.poll_interval is longer than watcher.debounce; bursts may be "
                       "observed late");
  }

  if (common::trim(config.workspace.root).empty()) {
    return Warnings::failure("workspace.root is required", common::ErrorCode::Config);
  }
  if (auto root = common::ensure_dir(config.workspace.root); !root.ok()) {
    return Warnings::failure("workspace.root is unusable: " + root.error(),
                             common::ErrorCode::Config);
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(config.workspace.template_dir, ec)) {
    warnings.push_back("workspace.template_dir does not exist; new workspaces will start empty: " +
                       config.workspace.template_dir);
  }
  if (!is_plain_relative_name(config.workspace.main_file)) {
    return Warnings::failure("workspace.main_file must be a relative path inside the workspace",
                             common::ErrorCode::Config);
  }
  if (!is_plain_relative_name(config.workspace.params_file)) {
    return Warnings::failure("workspace.params_file must be a relative path inside the workspace",
                             common::ErrorCode::Config);
  }
  if (!is_plain_relative_name(config.workspace.artifact_file)) {
    return Warnings::failure(
        "workspace.artifact_file must be a relative path inside the workspace",
        common::ErrorCode::Config);
  }

  if (common::trim(config.renderer.command).empty()) {
    return Warnings::failure("renderer.command is required", common::ErrorCode::Config);
  }

  std::stringstream backends(config.observability.backend);
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    const std::string normalized = common::to_lower(common::trim(backend));
    if (!normalized.empty() && !is_known_backend(normalized)) {
      return Warnings::failure("Invalid observability.backend: " + config.observability.backend,
                               common::ErrorCode::Config);
    }
  }
  if (!is_known_log_level(common::to_lower(config.observability.log_level))) {
    return Warnings::failure("Invalid observability.log_level: " + config.observability.log_level,
                             common::ErrorCode::Config);
  }

  return Warnings::success(std::move(warnings));
}

} // namespace docsandbox::config
