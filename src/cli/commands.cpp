#include "docsandbox/cli/commands.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/common/toml.hpp"
#include "docsandbox/config/config.hpp"
#include "docsandbox/daemon/daemon.hpp"
#include "docsandbox/daemon/pid_file.hpp"
#include "docsandbox/runtime/app.hpp"
#include "docsandbox/runtime/workspace_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace docsandbox::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef DOCSANDBOX_VERSION
  std::string version = DOCSANDBOX_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef DOCSANDBOX_GIT_COMMIT
  const std::string commit = DOCSANDBOX_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "docsandbox " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Loads and validates configuration; a failure is reported and mapped to exit code 1.
common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << "[config] " << context.error() << "\n";
    return context;
  }
  context.value().install_observer();
  return context;
}

std::string outcome_name(const render::RegenerationOutcome outcome) {
  switch (outcome) {
  case render::RegenerationOutcome::Rendered:
    return "rendered";
  case render::RegenerationOutcome::Skipped:
    return "skipped";
  case render::RegenerationOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

int run_serve(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    return 1;
  }

  std::string duration_raw;
  (void)take_option(args, "--duration-secs", duration_raw);
  int duration = 0;
  if (!duration_raw.empty()) {
    try {
      duration = std::stoi(duration_raw);
    } catch (const std::exception &) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  daemon::Daemon daemon(context.value().config());
  auto started = daemon.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return started.code() == common::ErrorCode::Config ? 1 : 2;
  }
  std::cout << "docsandbox serving " << daemon.service().store().root().string() << "\n";

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (!g_stop_requested) {
    if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  daemon.stop();
  std::cout << "docsandbox stopped\n";
  return 0;
}

int run_status() {
  auto context = load_context();
  if (!context.ok()) {
    return 1;
  }
  const auto &cfg = context.value().config();
  auto cp = config::config_path();
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  std::cout << "Workspaces: " << common::expand_path(cfg.workspace.root) << "\n";
  std::cout << "Template: " << common::expand_path(cfg.workspace.template_dir) << "\n";
  std::cout << "Watcher: " << (cfg.watcher.enabled ? cfg.watcher.mode : "disabled") << "\n";
  std::cout << "Session lifetime: " << common::format_duration(cfg.sessions.lifetime) << "\n";

  auto state_dir = daemon::resolve_state_dir({});
  if (!state_dir.ok()) {
    std::cerr << state_dir.error() << "\n";
    return 1;
  }
  daemon::PidFile pid(state_dir.value() / "daemon.pid");
  const auto recorded = pid.recorded_pid();
  if (recorded.has_value() && daemon::PidFile::is_process_running(*recorded)) {
    std::cout << "Daemon: running (pid " << *recorded << ")\n";
    auto state = common::read_text_file(state_dir.value() / "daemon_state.json");
    if (state.ok()) {
      std::cout << "State: " << state.value() << "\n";
    }
  } else {
    std::cout << "Daemon: stopped\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];
  if (action == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[config] " << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config_toml(cfg.value());
    return 0;
  }
  if (action == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "[config] invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "configuration ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

int run_sweep() {
  auto context = load_context();
  if (!context.ok()) {
    return 1;
  }
  runtime::WorkspaceService service(context.value().config());
  auto adopted = service.store().adopt_existing();
  if (!adopted.ok()) {
    std::cerr << adopted.error() << "\n";
    return 1;
  }
  const auto report = service.sweeper().sweep_once();
  std::cout << "examined " << adopted.value() << " workspaces: evicted " << report.evicted
            << ", failed " << report.failed << "\n";
  return report.failed == 0 ? 0 : 1;
}

int run_render(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: docsandbox render <workspace-dir>\n";
    return 1;
  }
  auto context = load_context();
  if (!context.ok()) {
    return 1;
  }

  std::error_code ec;
  const auto workspace = std::filesystem::weakly_canonical(args[0], ec);
  if (ec || !std::filesystem::is_directory(workspace, ec)) {
    std::cerr << "not a workspace directory: " << args[0] << "\n";
    return 1;
  }

  runtime::WorkspaceService service(context.value().config());
  auto &dispatcher = service.dispatcher();
  const auto outcome = dispatcher.regenerate(workspace, false);
  const auto status = dispatcher.status(workspace);
  std::cout << outcome_name(outcome) << ": " << dispatcher.artifact_path(workspace).string();
  if (status.exists) {
    std::cout << " (" << status.size << " bytes)";
  }
  std::cout << "\n";
  if (outcome == render::RegenerationOutcome::Failed && status.last_error.has_value()) {
    std::cerr << status.last_error->message << "\n" << status.last_error->trace << "\n";
    return 1;
  }
  return 0;
}

void print_help() {
  std::cout << "docsandbox - per-session document workspaces with live regeneration\n\n";
  std::cout << "Usage: docsandbox [--config PATH] <command> [args]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve [--duration-secs N]   Run the sweeper and change watcher\n";
  std::cout << "  status                      Show configuration and daemon state\n";
  std::cout << "  config show|validate|path   Inspect configuration\n";
  std::cout << "  sweep                       Reclaim expired workspaces once\n";
  std::cout << "  render <workspace-dir>      Regenerate one workspace's artifact\n";
  std::cout << "  version                     Show version\n";
  std::cout << "  help                        Show this message\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "sweep") {
    return run_sweep();
  }
  if (subcommand == "render") {
    return run_render(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace docsandbox::cli
