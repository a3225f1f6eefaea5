#pragma once

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/result.hpp"
#include "docsandbox/workspace/factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsandbox::sessions {

struct SessionInfo {
  std::string token;
  std::filesystem::path workspace;
  common::SteadyTime created_at;
  common::SteadyTime last_access_at;
  std::chrono::milliseconds age{0};
  std::chrono::milliseconds expires_in{0};
  bool workspace_exists = false;
};

struct ExpiredSession {
  std::string token;
  std::chrono::milliseconds age{0};
};

/// The token map is guarded by one mutex held only for bookkeeping. Workspace
/// creation and deletion are serialized per token by a lock owned by the
/// session entry, so filesystem work for one session never blocks another.
class SessionStore {
public:
  SessionStore(std::filesystem::path root, workspace::WorkspaceFactory factory,
               std::chrono::milliseconds lifetime,
               common::ClockFn clock = common::default_clock());

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  [[nodiscard]] common::Result<std::string> create_session_id() const;

  [[nodiscard]] common::Status register_session(const std::string &token);
  [[nodiscard]] common::Status touch(const std::string &token);
  [[nodiscard]] common::Result<std::filesystem::path>
  get_or_create_workspace(const std::string &token);

  [[nodiscard]] std::vector<ExpiredSession> list_expired(std::chrono::milliseconds lifetime) const;

  [[nodiscard]] common::Status evict(const std::string &token);
  [[nodiscard]] common::Result<bool> evict_if_expired(const std::string &token,
                                                      std::chrono::milliseconds lifetime);

  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] std::optional<SessionInfo> info(const std::string &token) const;
  [[nodiscard]] std::vector<std::string> tokens() const;

  [[nodiscard]] common::Result<std::size_t> adopt_existing();

  [[nodiscard]] std::filesystem::path workspace_path(const std::string &token) const;
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] std::chrono::milliseconds lifetime() const { return lifetime_; }

private:
  struct Entry {
    common::SteadyTime created_at;
    common::SteadyTime last_access_at;
    bool evicted = false;
    std::mutex lifecycle;
  };

  [[nodiscard]] std::shared_ptr<Entry> touch_entry(const std::string &token);
  [[nodiscard]] std::shared_ptr<Entry> find_entry(const std::string &token) const;
  [[nodiscard]] common::Status remove_workspace_locked(const std::string &token,
                                                       const std::shared_ptr<Entry> &entry);
  void forget_entry(const std::string &token, const std::shared_ptr<Entry> &entry);
  void publish_count() const;

  std::filesystem::path root_;
  workspace::WorkspaceFactory factory_;
  std::chrono::milliseconds lifetime_;
  common::ClockFn clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace docsandbox::sessions
