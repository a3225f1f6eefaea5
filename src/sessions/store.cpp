#include "docsandbox/sessions/store.hpp"

#include "docsandbox/observability/global.hpp"
#include "docsandbox/sessions/token.hpp"

#include <algorithm>
#include <iostream>

namespace docsandbox::sessions {

namespace {

std::chrono::milliseconds to_millis(const common::SteadyTime::duration duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

common::Status invalid_token(const std::string &token) {
  return common::Status::error("invalid session token: " + token,
                               common::ErrorCode::InvalidArgument);
}

} // namespace

SessionStore::SessionStore(std::filesystem::path root, workspace::WorkspaceFactory factory,
                           const std::chrono::milliseconds lifetime, common::ClockFn clock)
    : root_(std::move(root)), factory_(std::move(factory)), lifetime_(lifetime),
      clock_(clock ? std::move(clock) : common::default_clock()) {}

common::Result<std::string> SessionStore::create_session_id() const {
  for (int attempt = 0; attempt < 4; ++attempt) {
    auto token = generate_token();
    if (!token.ok()) {
      return token;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.contains(token.value())) {
      return token;
    }
  }
  return common::Result<std::string>::failure("unable to allocate a unique session token");
}

std::filesystem::path SessionStore::workspace_path(const std::string &token) const {
  return root_ / token;
}

std::shared_ptr<SessionStore::Entry> SessionStore::touch_entry(const std::string &token) {
  bool created = false;
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    auto &slot = sessions_[token];
    if (slot == nullptr) {
      slot = std::make_shared<Entry>();
      slot->created_at = now;
      slot->last_access_at = now;
      created = true;
    } else {
      slot->last_access_at =
          now > slot->last_access_at ? now : slot->last_access_at + common::SteadyTime::duration(1);
    }
    entry = slot;
  }
  if (created) {
    publish_count();
  }
  return entry;
}

std::shared_ptr<SessionStore::Entry> SessionStore::find_entry(const std::string &token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(token);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

common::Status SessionStore::register_session(const std::string &token) {
  if (!is_valid_token(token)) {
    return invalid_token(token);
  }
  bool created = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = sessions_[token];
    if (slot == nullptr) {
      const auto now = clock_();
      slot = std::make_shared<Entry>();
      slot->created_at = now;
      slot->last_access_at = now;
      created = true;
    }
  }
  if (created) {
    publish_count();
  }
  return common::Status::success();
}

common::Status SessionStore::touch(const std::string &token) {
  if (!is_valid_token(token)) {
    return invalid_token(token);
  }
  (void)touch_entry(token);
  return common::Status::success();
}

common::Result<std::filesystem::path>
SessionStore::get_or_create_workspace(const std::string &token) {
  using PathResult = common::Result<std::filesystem::path>;
  if (!is_valid_token(token)) {
    return PathResult::failure(invalid_token(token));
  }

  while (true) {
    auto entry = touch_entry(token);
    std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (entry->evicted) {
        // Lost a race with eviction; the next pass registers a fresh entry.
        continue;
      }
    }

    const auto path = workspace_path(token);
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
      return PathResult::success(path);
    }

    auto status = factory_.materialize(path);
    if (!status.ok()) {
      std::filesystem::remove_all(path, ec);
      forget_entry(token, entry);
      return PathResult::failure(status);
    }
    observability::record_session_created(token, path.string());
    return PathResult::success(path);
  }
}

std::vector<ExpiredSession>
SessionStore::list_expired(const std::chrono::milliseconds lifetime) const {
  std::vector<ExpiredSession> expired;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();
  for (const auto &[token, entry] : sessions_) {
    const auto age = now - entry->last_access_at;
    if (age > lifetime) {
      expired.push_back(ExpiredSession{.token = token, .age = to_millis(age)});
    }
  }
  std::sort(expired.begin(), expired.end(),
            [](const ExpiredSession &a, const ExpiredSession &b) { return a.age > b.age; });
  return expired;
}

common::Status SessionStore::remove_workspace_locked(const std::string &token,
                                                     const std::shared_ptr<Entry> &entry) {
  const auto path = workspace_path(token);
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    std::error_code exists_ec;
    if (std::filesystem::exists(path, exists_ec) || exists_ec) {
      return common::Status::error("failed to delete workspace " + path.string() + ": " +
                                       ec.message(),
                                   common::ErrorCode::StorageError);
    }
  }
  if (entry != nullptr) {
    forget_entry(token, entry);
  }
  return common::Status::success();
}

void SessionStore::forget_entry(const std::string &token, const std::shared_ptr<Entry> &entry) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry->evicted = true;
    const auto it = sessions_.find(token);
    if (it != sessions_.end() && it->second == entry) {
      sessions_.erase(it);
    }
  }
  publish_count();
}

common::Status SessionStore::evict(const std::string &token) {
  if (!is_valid_token(token)) {
    return invalid_token(token);
  }

  auto entry = find_entry(token);
  if (entry == nullptr) {
    // Unknown session; still reclaim a stray directory left under the root.
    return remove_workspace_locked(token, nullptr);
  }

  std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
  std::chrono::milliseconds age{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->evicted) {
      return common::Status::success();
    }
    age = to_millis(clock_() - entry->last_access_at);
  }

  auto status = remove_workspace_locked(token, entry);
  observability::record_session_evicted(token, age, status.ok());
  return status;
}

common::Result<bool> SessionStore::evict_if_expired(const std::string &token,
                                                    const std::chrono::milliseconds lifetime) {
  auto entry = find_entry(token);
  if (entry == nullptr) {
    return common::Result<bool>::success(false);
  }

  std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
  std::chrono::milliseconds age{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->evicted) {
      return common::Result<bool>::success(false);
    }
    const auto elapsed = clock_() - entry->last_access_at;
    if (!(elapsed > lifetime)) {
      return common::Result<bool>::success(false);
    }
    age = to_millis(elapsed);
  }

  auto status = remove_workspace_locked(token, entry);
  observability::record_session_evicted(token, age, status.ok());
  if (!status.ok()) {
    return common::Result<bool>::failure(status);
  }
  return common::Result<bool>::success(true);
}

std::size_t SessionStore::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::optional<SessionInfo> SessionStore::info(const std::string &token) const {
  std::optional<SessionInfo> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(token);
    if (it == sessions_.end()) {
      return std::nullopt;
    }
    const auto age = to_millis(clock_() - it->second->last_access_at);
    out = SessionInfo{.token = token,
                      .workspace = workspace_path(token),
                      .created_at = it->second->created_at,
                      .last_access_at = it->second->last_access_at,
                      .age = age,
                      .expires_in = lifetime_ - age};
  }
  std::error_code ec;
  out->workspace_exists = std::filesystem::is_directory(out->workspace, ec);
  return out;
}

std::vector<std::string> SessionStore::tokens() const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(sessions_.size());
  for (const auto &[token, _] : sessions_) {
    out.push_back(token);
  }
  std::sort(out.begin(), out.end());
  return out;
}

common::Result<std::size_t> SessionStore::adopt_existing() {
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return common::Result<std::size_t>::success(0);
  }

  std::size_t adopted = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    for (auto it = std::filesystem::directory_iterator(root_, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
      std::error_code entry_ec;
      if (!it->is_directory(entry_ec)) {
        continue;
      }
      const std::string token = it->path().filename().string();
      if (!is_valid_token(token) || sessions_.contains(token)) {
        continue;
      }
      const auto modified = it->last_write_time(entry_ec);
      auto idle = std::filesystem::file_time_type::duration::zero();
      if (!entry_ec) {
        idle = std::max(std::filesystem::file_time_type::clock::now() - modified,
                        std::filesystem::file_time_type::duration::zero());
      }
      auto entry = std::make_shared<Entry>();
      entry->last_access_at =
          now - std::chrono::duration_cast<common::SteadyTime::duration>(idle);
      entry->created_at = entry->last_access_at;
      sessions_.emplace(token, std::move(entry));
      ++adopted;
    }
  }
  if (ec) {
    return common::Result<std::size_t>::failure("failed to scan workspaces root " +
                                                    root_.string() + ": " + ec.message(),
                                                common::ErrorCode::StorageError);
  }
  if (adopted > 0) {
    std::cerr << "[sessions] adopted " << adopted << " existing workspace(s)\n";
    publish_count();
  }
  return common::Result<std::size_t>::success(adopted);
}

void SessionStore::publish_count() const {
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(active_count())});
}

} // namespace docsandbox::sessions
