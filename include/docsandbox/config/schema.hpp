#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace docsandbox::config {

struct SessionsConfig {
  std::chrono::milliseconds lifetime{std::chrono::hours(1)};
  std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
};

struct WatcherConfig {
  bool enabled = true;
  std::string mode = "polling";
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds debounce{500};
  std::vector<std::string> extensions = {".html", ".css", ".json"};
};

struct WorkspaceConfig {
  std::string root = "~/.docsandbox/workspaces";
  std::string template_dir = "~/.docsandbox/playground_files";
  std::string main_file = "index.html";
  std::string params_file = "params.json";
  std::string artifact_file = "output.pdf";
  std::vector<std::string> protected_files = {"index.html", "params.json"};
};

struct RendererConfig {
  std::string command = "weasyprint";
  std::vector<std::string> args;
};

struct TemplateConfig {
  bool inject_now = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  SessionsConfig sessions;
  WatcherConfig watcher;
  WorkspaceConfig workspace;
  RendererConfig renderer;
  TemplateConfig templates;
  ObservabilityConfig observability;
};

} // namespace docsandbox::config
