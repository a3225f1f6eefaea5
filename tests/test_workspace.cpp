#include "test_framework.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/workspace/factory.hpp"
#include "docsandbox/workspace/files.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

namespace ws = docsandbox::workspace;
namespace dt = docsandbox::testing;

ws::WorkspaceFiles files_in(const dt::TempDir &dir) {
  std::filesystem::create_directories(dir.path() / "ws");
  return ws::WorkspaceFiles(dir.path() / "ws", {"index.html", "params.json"});
}

} // namespace

void register_workspace_tests(std::vector<docsandbox::tests::TestCase> &tests) {
  using docsandbox::tests::require;
  namespace common = docsandbox::common;

  tests.push_back({"workspace_materialize_copies_tree", [] {
                     dt::TempDir dir;
                     dt::write_template(dir);
                     dir.create_file("template/layouts/base.html", "{% block body %}{% endblock %}");
                     const auto destination = dir.path() / "out";
                     auto status = ws::materialize(dir.path() / "template", destination);
                     require(status.ok(), status.error());
                     require(std::filesystem::exists(destination / "index.html"), "index missing");
                     require(std::filesystem::exists(destination / "style.css"), "css missing");
                     require(dir.read_file("out/layouts/base.html") ==
                                 "{% block body %}{% endblock %}",
                             "nested file content differs");
                   }});

  tests.push_back({"workspace_materialize_missing_template_is_not_fatal", [] {
                     dt::TempDir dir;
                     ws::WorkspaceFactory factory(dir.path() / "no-template");
                     auto status = factory.materialize(dir.path() / "out");
                     require(status.ok(), status.error());
                     require(std::filesystem::is_directory(dir.path() / "out"), "not created");
                   }});

  tests.push_back({"workspace_resolve_within_rules", [] {
                     dt::TempDir dir;
                     const auto root = dir.path();
                     require(common::resolve_within(root, "a/b.html").ok(), "plain path rejected");
                     require(common::resolve_within(root, "a/../b.html").ok(),
                             "inner dot-dot rejected");
                     require(common::resolve_within(root, "../x").code() ==
                                 common::ErrorCode::PathViolation,
                             "parent escape accepted");
                     require(common::resolve_within(root, "a/../../x").code() ==
                                 common::ErrorCode::PathViolation,
                             "nested escape accepted");
                     require(common::resolve_within(root, "/etc/passwd").code() ==
                                 common::ErrorCode::PathViolation,
                             "absolute path accepted");
                     require(common::resolve_within(root, ".").code() ==
                                 common::ErrorCode::PathViolation,
                             "root itself accepted");
                     require(common::resolve_within(root, " ").code() ==
                                 common::ErrorCode::InvalidArgument,
                             "empty path accepted");
                   }});

  tests.push_back({"workspace_symlink_escape_rejected", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     dir.create_file("outside/secret.txt", "secret");
                     std::filesystem::create_directory_symlink(dir.path() / "outside",
                                                               dir.path() / "ws" / "link");
                     auto read = files.read("link/secret.txt");
                     require(!read.ok(), "read through symlink escaped");
                     require(read.code() == common::ErrorCode::PathViolation, "wrong code");
                     require(files.write("link/new.txt", "x").code() ==
                                 common::ErrorCode::PathViolation,
                             "write through symlink escaped");
                     require(!std::filesystem::exists(dir.path() / "outside" / "new.txt"),
                             "file written outside");
                   }});

  tests.push_back({"workspace_write_read_round_trip", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     const std::string content = "line one\n\tline two\r\n\xE2\x9C\x93\n";
                     auto written = files.write("pages/intro.html", content);
                     require(written.ok(), written.error());
                     auto read = files.read("pages/intro.html");
                     require(read.ok(), read.error());
                     require(read.value() == content, "content changed on round trip");

                     require(files.write("pages/intro.html", "replaced").ok(), "overwrite failed");
                     require(files.read("pages/intro.html").value() == "replaced", "overwrite lost");
                   }});

  tests.push_back({"workspace_traversal_rejected_for_every_operation", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     dir.create_file("victim.txt", "keep");
                     const std::string escape = "../victim.txt";
                     require(files.read(escape).code() == common::ErrorCode::PathViolation,
                             "read escaped");
                     require(files.write(escape, "x").code() == common::ErrorCode::PathViolation,
                             "write escaped");
                     require(files.create("../created.txt").code() ==
                                 common::ErrorCode::PathViolation,
                             "create escaped");
                     require(files.remove(escape).code() == common::ErrorCode::PathViolation,
                             "delete escaped");
                     require(dir.read_file("victim.txt") == "keep", "victim modified");
                     require(!std::filesystem::exists(dir.path() / "created.txt"), "file created");
                   }});

  tests.push_back({"workspace_create_refuses_existing", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     require(files.create("notes.css").ok(), "create failed");
                     require(files.read("notes.css").value().empty(), "created file not empty");
                     auto again = files.create("notes.css", "x");
                     require(!again.ok(), "existing file overwritten");
                     require(again.code() == common::ErrorCode::InvalidArgument, "wrong code");
                   }});

  tests.push_back({"workspace_delete_then_list_excludes_file", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     require(files.write("index.html", "<p/>").ok(), "write failed");
                     require(files.write("extra.css", "p{}").ok(), "write failed");
                     require(files.write("sub/part.html", "<i/>").ok(), "write failed");

                     auto before = files.list();
                     require(before.ok(), before.error());
                     require(before.value().size() == 3, "list size before delete");

                     require(files.remove("extra.css").ok(), "delete failed");
                     auto after = files.list();
                     require(after.ok(), after.error());
                     require(after.value().size() == 2, "list size after delete");
                     for (const auto &entry : after.value()) {
                       require(entry.path != "extra.css", "deleted file still listed");
                     }
                     auto missing = files.remove("extra.css");
                     require(missing.code() == common::ErrorCode::NotFound, "double delete");
                   }});

  tests.push_back({"workspace_protected_files_cannot_be_deleted", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     require(files.write("index.html", "<p/>").ok(), "write failed");
                     auto removed = files.remove("./index.html");
                     require(!removed.ok(), "protected file deleted");
                     require(removed.code() == common::ErrorCode::InvalidArgument, "wrong code");
                     require(std::filesystem::exists(dir.path() / "ws" / "index.html"),
                             "protected file gone");
                     require(files.write("index.html", "<p>edit</p>").ok(),
                             "protected file not writable");
                   }});

  tests.push_back({"workspace_list_is_sorted_and_skips_hidden", [] {
                     dt::TempDir dir;
                     auto files = files_in(dir);
                     require(files.write("b.html", "bb").ok(), "write failed");
                     require(files.write("a/z.css", "z").ok(), "write failed");
                     require(files.write(".hidden", "h").ok(), "write failed");
                     require(files.write(".git/config", "g").ok(), "write failed");
                     std::filesystem::create_directories(dir.path() / "ws" / "empty-dir");

                     auto listed = files.list();
                     require(listed.ok(), listed.error());
                     const auto &entries = listed.value();
                     require(entries.size() == 2, "hidden files or directories listed");
                     require(entries[0].path == "a/z.css" && entries[0].name == "z.css",
                             "nested entry");
                     require(entries[1].path == "b.html" && entries[1].size == 2, "size");
                     require(!entries[1].modified.empty(), "modified time missing");
                   }});
}
