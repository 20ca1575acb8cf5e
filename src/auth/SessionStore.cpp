#include "auth/SessionStore.hpp"
#include "util/Crypto.hpp"
#include "util/Strings.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <signal.h>
#include <unistd.h>

namespace vipervault::auth {

using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr size_t TOKEN_BYTES = 32;

double wall_clock_seconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

SessionStore::SessionStore(fs::path dir, SessionPolicy policy, Clock clock)
    : dir_(std::move(dir)), policy_(policy), clock_(std::move(clock)) {
  if (!clock_) clock_ = wall_clock_seconds;
}

double SessionStore::now() const { return clock_(); }

bool SessionStore::ensure_dir() {
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  if (fs::is_directory(dir_, ec)) return true;
  fs::create_directories(dir_, ec);
  if (ec) {
    std::fprintf(stderr, "vipervault: session: failed to create %s: %s\n",
                 dir_.c_str(), ec.message().c_str());
    return false;
  }
  fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
  return true;
}

bool SessionStore::is_well_formed(std::string_view token) {
  if (token.empty() || token.size() > 128) return false;
  for (unsigned char c : token) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

fs::path SessionStore::path_for(std::string_view token) const {
  return dir_ / (std::string(token) + ".json");
}

bool SessionStore::expired(const SessionRecord& r, double t) const {
  return (t - r.created > policy_.session_duration) ||
         (t - r.last_activity > policy_.inactivity_timeout);
}

static auto read_record_file(const fs::path& p) -> std::optional<SessionRecord> {
  std::ifstream in(p);
  if (!in) return std::nullopt;
  try {
    json j = json::parse(in);
    if (!j.is_object()) return std::nullopt;
    SessionRecord r;
    r.created = j.value("created", 0.0);
    r.last_activity = j.value("last_activity", 0.0);
    return r;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

// "<token>.json.tmp.<pid>" left by a writer that died before its rename.
// Our own pid cannot have a write in flight while mu_ is held.
static bool is_orphaned_temp(const std::string& name) {
  auto pos = name.rfind(".json.tmp.");
  if (pos == std::string::npos) return false;
  auto digits = name.substr(pos + 10);
  if (digits.empty() || digits.size() > 9) return false;
  for (char ch : digits) {
    if (ch < '0' || ch > '9') return false;
  }
  auto pid = static_cast<pid_t>(std::stol(digits));
  if (pid == ::getpid() || pid <= 0) return true;
  return ::kill(pid, 0) < 0 && errno == ESRCH;
}

bool SessionStore::write_record(const fs::path& p, const SessionRecord& r) {
  json j = {{"created", r.created}, {"last_activity", r.last_activity}};
  fs::path tmp = p;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      std::fprintf(stderr, "vipervault: session: cannot write %s\n", tmp.c_str());
      return false;
    }
    out << j.dump();
    if (!out.good()) return false;
  }
  std::error_code ec;
  fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  fs::rename(tmp, p, ec);
  if (ec) {
    std::fprintf(stderr, "vipervault: session: rename to %s failed: %s\n", p.c_str(), ec.message().c_str());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

auto SessionStore::create() -> std::optional<std::string> {
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) {
    fs::create_directories(dir_, ec);
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
  }
  cleanup_locked();

  auto token = util::random_token(TOKEN_BYTES);
  if (!token) return std::nullopt;
  double t = now();
  if (!write_record(path_for(*token), SessionRecord{t, t})) return std::nullopt;
  return token;
}

bool SessionStore::validate(std::string_view token) {
  if (!is_well_formed(token)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  auto p = path_for(token);
  std::error_code ec;
  if (!fs::exists(p, ec)) return false;

  auto rec = read_record_file(p);
  if (!rec) return false;

  double t = now();
  if (expired(*rec, t)) {
    fs::remove(p, ec);
    std::fprintf(stderr, "vipervault: session: %s expired\n", util::redact(token).c_str());
    return false;
  }
  rec->last_activity = t;
  return write_record(p, *rec);
}

void SessionStore::destroy(std::string_view token) {
  if (!is_well_formed(token)) return;
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  fs::remove(path_for(token), ec);
}

size_t SessionStore::cleanup() {
  std::lock_guard<std::mutex> lk(mu_);
  return cleanup_locked();
}

size_t SessionStore::cleanup_locked() {
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) return 0;
  double t = now();
  size_t removed = 0;
  for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const auto& p = it->path();
    if (is_orphaned_temp(p.filename().string())) {
      std::error_code rm_ec;
      if (fs::remove(p, rm_ec)) ++removed;
      continue;
    }
    if (p.extension() != ".json") continue;
    auto rec = read_record_file(p);
    if (!rec || expired(*rec, t)) {
      std::error_code rm_ec;
      if (fs::remove(p, rm_ec)) ++removed;
    }
  }
  if (removed > 0) {
    std::fprintf(stderr, "vipervault: session: removed %zu stale session(s)\n", removed);
  }
  return removed;
}

auto SessionStore::read(std::string_view token) const -> std::optional<SessionRecord> {
  if (!is_well_formed(token)) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  return read_record_file(path_for(token));
}

} // namespace vipervault::auth
