#include "test_framework.hpp"

#include "docsandbox/watcher/backend.hpp"
#include "docsandbox/watcher/change_watcher.hpp"
#include "docsandbox/watcher/debounce.hpp"
#include "docsandbox/watcher/polling_backend.hpp"
#include "tests/helpers/test_helpers.hpp"

#ifdef __linux__
#include "docsandbox/watcher/inotify_backend.hpp"
#endif

#include <atomic>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

namespace wt = docsandbox::watcher;
namespace dt = docsandbox::testing;

struct CallbackLog {
  std::mutex mutex;
  std::vector<std::filesystem::path> workspaces;

  wt::RegenerateCallback callback() {
    return [this](const std::filesystem::path &workspace) {
      std::lock_guard<std::mutex> lock(mutex);
      workspaces.push_back(workspace);
    };
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mutex);
    return workspaces.size();
  }
};

wt::WatchEvent file_event(const std::filesystem::path &path) {
  return wt::WatchEvent{.path = path, .kind = wt::ChangeKind::Modified, .is_directory = false};
}

std::unique_ptr<wt::ChangeWatcher> make_watcher(const std::filesystem::path &root,
                                                wt::DebounceGate &gate, CallbackLog &log,
                                                std::chrono::milliseconds debounce) {
  return std::make_unique<wt::ChangeWatcher>(
      wt::WatcherOptions{.root = root, .debounce = debounce, .extensions = {".html", ".CSS", ".json"}},
      std::make_unique<wt::PollingBackend>(std::chrono::milliseconds(20)), gate, log.callback());
}

} // namespace

void register_watcher_tests(std::vector<docsandbox::tests::TestCase> &tests) {
  using docsandbox::tests::require;
  namespace common = docsandbox::common;
  using namespace std::chrono_literals;

  tests.push_back({"debounce_admits_leading_edge_then_suppresses", [] {
                     dt::ManualClock clock;
                     wt::DebounceGate gate(clock.fn());
                     require(gate.admit("ws", 500ms), "first event rejected");
                     require(!gate.admit("ws", 500ms), "second event admitted");
                     clock.advance(500ms);
                     require(gate.admit("ws", 500ms), "event after interval rejected");
                   }});

  tests.push_back({"debounce_rejections_do_not_extend_window", [] {
                     dt::ManualClock clock;
                     wt::DebounceGate gate(clock.fn());
                     require(gate.admit("ws", 500ms), "first event rejected");
                     for (int i = 0; i < 4; ++i) {
                       clock.advance(100ms);
                       require(!gate.admit("ws", 500ms), "event inside window admitted");
                     }
                     clock.advance(100ms);
                     require(gate.admit("ws", 500ms),
                             "window was anchored to a rejected event");
                   }});

  tests.push_back({"debounce_keys_are_independent", [] {
                     dt::ManualClock clock;
                     wt::DebounceGate gate(clock.fn());
                     require(gate.admit("a", 1s), "a rejected");
                     require(gate.admit("b", 1s), "b blocked by a");
                     require(!gate.admit("a", 1s), "a admitted twice");
                     require(gate.size() == 2, "size");
                     gate.forget("a");
                     require(gate.size() == 1, "forget did not drop key");
                     require(gate.admit("a", 1s), "forgotten key still suppressed");
                     require(gate.admit("c", 0ms) && gate.admit("c", 0ms), "zero interval suppressed");
                   }});

  tests.push_back({"debounce_real_clock_sleep", [] {
                     wt::DebounceGate gate;
                     require(gate.admit("ws", 50ms), "first rejected");
                     require(!gate.admit("ws", 50ms), "second admitted");
                     std::this_thread::sleep_for(60ms);
                     require(gate.admit("ws", 50ms), "after sleep rejected");
                   }});

  tests.push_back({"watcher_create_backend_modes", [] {
                     auto polling = wt::create_backend("polling", 100ms);
                     require(polling.ok(), polling.error());
                     require(polling.value()->name() == "polling", "polling name");
                     auto native = wt::create_backend("Native", 100ms);
                     require(native.ok(), native.error());
#ifdef __linux__
                     require(native.value()->name() == "native", "native name");
#endif
                     auto unknown = wt::create_backend("kqueue", 100ms);
                     require(!unknown.ok(), "unknown mode accepted");
                     require(unknown.code() == common::ErrorCode::Config, "wrong code");
                   }});

  tests.push_back({"watcher_polling_backend_reports_changes", [] {
                     dt::TempDir dir;
                     dir.create_file("ws/index.html", "a");
                     dt::ManualClock clock;
                     wt::PollingBackend backend(1s, clock.fn());
                     require(backend.open(dir.path()).ok(), "open failed");
                     require(backend.tracked_count() == 2, "initial snapshot");

                     std::vector<wt::WatchEvent> events;
                     const wt::WatchEventSink sink = [&](const wt::WatchEvent &e) {
                       events.push_back(e);
                     };
                     backend.scan_now(sink);
                     require(events.empty(), "unchanged tree reported events");

                     dir.create_file("ws/index.html", "longer content");
                     dir.create_file("ws2/style.css", "p{}");
                     backend.scan_now(sink);
                     require(events.size() == 3, "expected modify, dir create and file create");
                     bool saw_modify = false;
                     bool saw_dir = false;
                     bool saw_create = false;
                     for (const auto &event : events) {
                       if (event.path.filename() == "index.html") {
                         saw_modify = event.kind == wt::ChangeKind::Modified;
                       } else if (event.path.filename() == "ws2") {
                         saw_dir = event.is_directory && event.kind == wt::ChangeKind::Created;
                       } else if (event.path.filename() == "style.css") {
                         saw_create = !event.is_directory && event.kind == wt::ChangeKind::Created;
                       }
                     }
                     require(saw_modify && saw_dir && saw_create, "event kinds");

                     events.clear();
                     backend.wait(10ms, sink);
                     require(events.empty(), "scanned before the interval elapsed");
                     backend.close();
                   }});

  tests.push_back({"watcher_filters_and_resolves_workspace", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     std::filesystem::create_directories(root / "ws1" / "pages");
                     dt::ManualClock clock;
                     wt::DebounceGate gate(clock.fn());
                     CallbackLog log;
                     auto watcher = make_watcher(root, gate, log, 500ms);

                     require(!watcher->handle_event(wt::WatchEvent{
                                 .path = root / "ws1" / "pages", .is_directory = true}),
                             "directory event handled");
                     require(!watcher->handle_event(file_event(root / "ws1" / "notes.txt")),
                             "unwatched extension handled");
                     require(!watcher->handle_event(file_event(root / "stray.html")),
                             "file at root handled");
                     require(!watcher->handle_event(file_event(dir.path() / "elsewhere" / "x.html")),
                             "file outside root handled");
                     require(log.size() == 0, "callback invoked for ignored events");

                     require(watcher->handle_event(file_event(root / "ws1" / "pages" / "THEME.Css")),
                             "nested stylesheet ignored");
                     require(log.size() == 1 && log.workspaces[0] == root / "ws1",
                             "resolved to the wrong workspace");
                     require(watcher->resolve_workspace(root / "ws1" / "a" / "b" / "c.json") ==
                                 root / "ws1",
                             "deep path resolution");
                   }});

  tests.push_back({"watcher_burst_triggers_one_regeneration", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     std::filesystem::create_directories(root);
                     dt::ManualClock clock;
                     wt::DebounceGate gate(clock.fn());
                     CallbackLog log;
                     auto watcher = make_watcher(root, gate, log, 500ms);

                     require(watcher->handle_event(file_event(root / "ws1" / "index.html")),
                             "first event rejected");
                     clock.advance(100ms);
                     require(!watcher->handle_event(file_event(root / "ws1" / "style.css")),
                             "second event admitted");
                     clock.advance(100ms);
                     require(!watcher->handle_event(file_event(root / "ws1" / "params.json")),
                             "third event admitted");
                     require(watcher->handle_event(file_event(root / "ws2" / "index.html")),
                             "other workspace blocked");
                     require(log.size() == 2, "unexpected callback count");
                     require(watcher->admitted_count() == 2, "admitted count");

                     clock.advance(300ms);
                     require(watcher->handle_event(file_event(root / "ws1" / "index.html")),
                             "event after window rejected");
                   }});

  tests.push_back({"watcher_callback_exception_is_contained", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     wt::DebounceGate gate;
                     wt::ChangeWatcher watcher(
                         wt::WatcherOptions{.root = root, .debounce = 0ms},
                         std::make_unique<wt::PollingBackend>(20ms), gate,
                         [](const std::filesystem::path &) { throw std::runtime_error("boom"); });
                     require(watcher.handle_event(file_event(root / "ws" / "index.html")),
                             "event not admitted");
                   }});

  tests.push_back({"watcher_start_stop_are_idempotent", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     wt::DebounceGate gate;
                     CallbackLog log;
                     auto watcher = make_watcher(root, gate, log, 100ms);
                     require(!watcher->is_running(), "running before start");
                     require(watcher->start().ok(), "start failed");
                     require(std::filesystem::is_directory(root), "root not created");
                     require(watcher->is_running(), "not running");
                     require(watcher->start().ok(), "second start failed");
                     require(watcher->is_running(), "second start stopped the watcher");

                     const auto started = std::chrono::steady_clock::now();
                     watcher->stop();
                     require(std::chrono::steady_clock::now() - started < 1s, "stop not prompt");
                     require(!watcher->is_running(), "still running");
                     watcher->stop();
                     require(!watcher->is_running(), "second stop changed state");

                     require(watcher->start().ok(), "restart failed");
                     watcher->stop();
                   }});

  tests.push_back({"watcher_polling_end_to_end_debounces_burst", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     dir.create_file("workspaces/ws1/index.html", "v0");
                     wt::DebounceGate gate;
                     CallbackLog log;
                     auto watcher = make_watcher(root, gate, log, 2s);
                     require(watcher->start().ok(), "start failed");

                     dir.create_file("workspaces/ws1/index.html", "v1-");
                     std::this_thread::sleep_for(40ms);
                     dir.create_file("workspaces/ws1/index.html", "v2--");
                     std::this_thread::sleep_for(40ms);
                     dir.create_file("workspaces/ws1/index.html", "v3---");

                     require(dt::wait_until([&]() { return log.size() >= 1; }), "no regeneration");
                     std::this_thread::sleep_for(200ms);
                     watcher->stop();
                     require(log.size() == 1, "burst triggered more than one regeneration");
                     require(log.workspaces[0].filename() == "ws1", "wrong workspace");
                   }});

  tests.push_back({"watcher_polling_ignores_unwatched_files", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     std::filesystem::create_directories(root / "ws1");
                     wt::DebounceGate gate;
                     CallbackLog log;
                     auto watcher = make_watcher(root, gate, log, 100ms);
                     require(watcher->start().ok(), "start failed");
                     dir.create_file("workspaces/ws1/output.pdf", "binary");
                     dir.create_file("workspaces/readme.html", "root level");
                     std::this_thread::sleep_for(200ms);
                     watcher->stop();
                     require(log.size() == 0, "ignored files triggered regeneration");
                   }});

#ifdef __linux__
  tests.push_back({"watcher_native_backend_detects_modification", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     dir.create_file("workspaces/ws1/index.html", "v0");
                     wt::DebounceGate gate;
                     CallbackLog log;
                     wt::ChangeWatcher watcher(
                         wt::WatcherOptions{.root = root, .debounce = 2s},
                         std::make_unique<wt::InotifyBackend>(), gate, log.callback());
                     require(watcher.start().ok(), "start failed");
                     require(watcher.backend_name() == "native", "backend name");

                     dir.create_file("workspaces/ws1/index.html", "v1");
                     dir.create_file("workspaces/ws1/index.html", "v2");
                     require(dt::wait_until([&]() { return log.size() >= 1; }), "no event");
                     std::this_thread::sleep_for(150ms);
                     watcher.stop();
                     require(log.size() == 1, "burst not coalesced");
                   }});

  tests.push_back({"watcher_native_backend_follows_new_directories", [] {
                     dt::TempDir dir;
                     const auto root = dir.path() / "workspaces";
                     std::filesystem::create_directories(root);
                     wt::InotifyBackend backend;
                     require(backend.open(root).ok(), "open failed");
                     require(backend.watch_count() == 1, "root watch");

                     std::filesystem::create_directories(root / "ws1");
                     std::vector<wt::WatchEvent> events;
                     const wt::WatchEventSink sink = [&](const wt::WatchEvent &e) {
                       events.push_back(e);
                     };
                     backend.wait(500ms, sink);
                     require(!events.empty() && events[0].is_directory, "directory event");
                     require(backend.watch_count() == 2, "new directory not watched");
                     backend.close();
                   }});
#endif
}
