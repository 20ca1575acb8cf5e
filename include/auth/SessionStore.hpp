#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace vipervault::auth {

struct SessionPolicy {
  double session_duration{86400.0};   // seconds since creation
  double inactivity_timeout{3600.0};  // seconds since last activity
};

struct SessionRecord {
  double created{};
  double last_activity{};
};

// File-backed session store: one <token>.json per session under dir.
// All operations are serialized; a store is shared by the server workers.
class SessionStore {
public:
  using Clock = std::function<double()>;

  SessionStore(std::filesystem::path dir, SessionPolicy policy, Clock clock = {});
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // Create the directory (0700) if missing.
  bool ensure_dir();

  // Clean up expired sessions, then mint a new token. nullopt if the record cannot be written.
  [[nodiscard]] auto create() -> std::optional<std::string>;

  // True if the session exists and is live; refreshes last_activity.
  // Expired sessions are deleted.
  [[nodiscard]] bool validate(std::string_view token);

  void destroy(std::string_view token);

  // Remove expired and unreadable records. Returns the number removed.
  size_t cleanup();

  [[nodiscard]] auto read(std::string_view token) const -> std::optional<SessionRecord>;

  [[nodiscard]] static bool is_well_formed(std::string_view token);

  [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
  [[nodiscard]] bool expired(const SessionRecord& r, double now) const;
  [[nodiscard]] std::filesystem::path path_for(std::string_view token) const;
  bool write_record(const std::filesystem::path& p, const SessionRecord& r);
  [[nodiscard]] double now() const;
  size_t cleanup_locked();

  std::filesystem::path dir_;
  SessionPolicy policy_;
  Clock clock_;
  mutable std::mutex mu_;
};

// Wall clock in fractional seconds since the epoch.
[[nodiscard]] double wall_clock_seconds();

} // namespace vipervault::auth
