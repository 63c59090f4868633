#include "tally/audit.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <mutex>

#include "tally/hash.hpp"
#include "tally/jsonlite.hpp"
#include "tally/version.hpp"

namespace tally {

namespace {
const std::string kGenesisDigest(64, '0');
}  // namespace

std::string audit_record_to_json(const AuditRecord& r) {
  jsonlite::Object o;
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["action"] = r.action;
  o["quota_key"] = r.quota_key;
  o["before"] = r.before;
  o["after"] = r.after;
  o["detail"] = r.detail;
  o["ts_unix_ms"] = r.timestamp_unix_ms;
  o["v"] = static_cast<int64_t>(r.audit_log_version);
  if (r.genesis) o["genesis"] = true;
  return jsonlite::to_json(o);
}

struct AuditLogImpl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<AuditLogImpl>()) {
  if (!path_.empty()) impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) std::fclose(impl_->file);
}

bool ImmutableAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.genesis = impl_->seq == 0;
  using SC = std::chrono::system_clock;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
  record.audit_log_version = version::AUDIT_LOG_VERSION;

  const std::string line = audit_record_to_json(record);

  if (!path_.empty() && !impl_->file) {
    ++impl_->failure_count;
    return false;
  }
  if (impl_->file) {
    std::fseek(impl_->file, 0, SEEK_END);
    const std::string final_line = line + "\n";
    const bool written =
        std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size() &&
        std::fflush(impl_->file) == 0;
    if (!written) {
      ++impl_->failure_count;
      return false;
    }
  }
  impl_->seq = record.sequence;
  impl_->last_digest = audit_chain_digest(line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

std::string ImmutableAuditLog::last_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

ChainVerification verify_audit_chain(const std::string& path) {
  ChainVerification v;
  std::ifstream in(path);
  if (!in) {
    v.ok = false;
    v.error = "cannot open " + path;
    return v;
  }
  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = jsonlite::get_u64(obj, "seq");
    if (err) {
      v.ok = false;
      v.first_bad_sequence = expected_seq + 1;
      v.error = err->message;
      return v;
    }
    // A chain restarts only at a record marked genesis, which happens when
    // another process appends to an existing file.
    if (jsonlite::get_bool(obj, "genesis")) {
      if (seq != 1) {
        v.ok = false;
        v.first_bad_sequence = seq;
        v.error = "genesis record with sequence " + std::to_string(seq);
        return v;
      }
      expected_prev = kGenesisDigest;
    } else if (seq != expected_seq + 1) {
      v.ok = false;
      v.first_bad_sequence = seq;
      v.error = "sequence gap";
      return v;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      v.ok = false;
      v.first_bad_sequence = seq;
      v.error = "chain digest mismatch";
      return v;
    }
    expected_prev = audit_chain_digest(line);
    expected_seq = seq;
    ++v.entries;
  }
  return v;
}

namespace {
std::mutex g_audit_init_mu;
std::string g_audit_path;
bool g_audit_path_set = false;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  g_audit_path = path;
  g_audit_path_set = true;
}

ImmutableAuditLog& global_audit_log() {
  static ImmutableAuditLog* instance = [] {
    std::lock_guard<std::mutex> lk(g_audit_init_mu);
    std::string path = g_audit_path;
    if (!g_audit_path_set) {
      const char* env = std::getenv("TALLY_AUDIT_LOG");
      if (env && env[0]) path = env;
    }
    return new ImmutableAuditLog(path);
  }();
  return *instance;
}

}  // namespace tally
