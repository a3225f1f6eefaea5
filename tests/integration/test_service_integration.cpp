#include "tests/test_framework.hpp"

#include "docsandbox/observability/observer.hpp"
#include "docsandbox/runtime/workspace_service.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

namespace {

namespace rt = docsandbox::runtime;
namespace dt = docsandbox::testing;

} // namespace

void register_integration_tests(std::vector<docsandbox::tests::TestCase> &tests) {
  using docsandbox::tests::require;
  namespace render = docsandbox::render;
  using namespace std::chrono_literals;

  tests.push_back({"integration_edit_burst_regenerates_once", [] {
                     dt::TempDir dir;
                     dt::write_template(dir, "<p>{{ title }}</p>");
                     auto renderer = std::make_shared<dt::RecordingRenderer>();
                     rt::ServiceDependencies deps;
                     deps.renderer = renderer;
                     rt::WorkspaceService service(dt::temp_config(dir), std::move(deps));
                     dt::RecordingNotifier notes;
                     (void)service.subscribe(notes.listener());

                     const auto handle = service.resolve_session(std::nullopt).value();
                     auto started = service.start_background();
                     require(started.ok(), started.ok() ? "" : started.error());
                     // Let the polling backend take its first snapshot.
                     std::this_thread::sleep_for(100ms);

                     for (int i = 0; i < 5; ++i) {
                       require(service
                                   .write_file(handle.token, "index.html",
                                               "<p>draft " + std::to_string(i) + "</p>")
                                   .ok(),
                               "write");
                     }
                     require(dt::wait_until([&] { return notes.updated_count() >= 1; }),
                             "burst produced a notification");
                     std::this_thread::sleep_for(400ms);
                     service.dispatcher().wait_idle();
                     require(notes.updated_count() == 1, "one regeneration per burst");
                     const auto updated = std::get<render::ArtifactUpdated>(notes.events()[0]);
                     require(updated.workspace == handle.token, "notification names the session");
                     require(std::filesystem::exists(handle.workspace / "output.pdf"), "artifact");

                     require(service.write_file(handle.token, "style.css", "h1{}").ok(), "css");
                     require(dt::wait_until([&] { return notes.updated_count() == 2; }),
                             "later edit regenerates again");

                     require(service.write_file(handle.token, "notes.txt", "ignored").ok(), "txt");
                     std::this_thread::sleep_for(400ms);
                     service.dispatcher().wait_idle();
                     require(notes.updated_count() == 2, "unwatched extension ignored");
                     service.stop_background();
                   }});

  tests.push_back({"integration_render_failure_reaches_subscribers", [] {
                     dt::TempDir dir;
                     dt::write_template(dir);
                     auto renderer = std::make_shared<dt::RecordingRenderer>();
                     renderer->fail_with("weasyprint exited with status 1: bad css\ntraceback");
                     rt::ServiceDependencies deps;
                     deps.renderer = renderer;
                     rt::WorkspaceService service(dt::temp_config(dir), std::move(deps));
                     dt::RecordingNotifier notes;
                     (void)service.subscribe(notes.listener());

                     const auto handle = service.resolve_session(std::nullopt).value();
                     require(service.start_background().ok(), "start");
                     std::this_thread::sleep_for(100ms);
                     require(service.write_file(handle.token, "params.json", "{\"title\": \"X\"}")
                                 .ok(),
                             "write params");

                     require(dt::wait_until([&] { return notes.failed_count() == 1; }),
                             "failure published");
                     const auto failure = notes.last_failure();
                     require(failure->workspace == handle.token, "failure names the session");
                     require(failure->error.message == "weasyprint exited with status 1: bad css",
                             failure->error.message);
                     require(!std::filesystem::exists(handle.workspace / "output.pdf"),
                             "no artifact published");
                     service.stop_background();
                   }});

  tests.push_back({"integration_sweeper_reclaims_idle_sessions", [] {
                     dt::TempDir dir;
                     dt::write_template(dir);
                     dt::ManualClock clock;
                     dt::ObserverCapture capture;
                     rt::ServiceDependencies deps;
                     deps.renderer = std::make_shared<dt::RecordingRenderer>();
                     deps.clock = clock.fn();
                     auto config = dt::temp_config(dir);
                     config.watcher.enabled = false;
                     rt::WorkspaceService service(config, std::move(deps));

                     const auto idle = service.resolve_session(std::nullopt).value();
                     const auto busy = service.resolve_session(std::nullopt).value();
                     require(service.start_background().ok(), "start");

                     clock.advance(40min);
                     require(service.read_file(busy.token, "index.html").ok(), "busy refreshed");
                     clock.advance(25min);

                     require(dt::wait_until([&] {
                               return !std::filesystem::exists(idle.workspace) &&
                                      !service.store().info(idle.token).has_value();
                             }),
                             "idle workspace reclaimed");
                     require(std::filesystem::exists(busy.workspace), "busy workspace kept");
                     require(service.store().info(busy.token).has_value(), "busy entry kept");
                     namespace obs = docsandbox::observability;
                     require(capture.observer().count<obs::SessionEvictedEvent>() >= 1,
                             "eviction observed");

                     auto revived = service.resolve_session(idle.token);
                     require(revived.ok() && !revived.value().issued, "token still usable");
                     require(std::filesystem::exists(idle.workspace / "index.html"),
                             "fresh copy materialized");
                     service.stop_background();
                   }});
}
