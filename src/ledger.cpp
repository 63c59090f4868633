#include "tally/ledger.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

#include "tally/chaos.hpp"
#include "tally/observability.hpp"

namespace tally {

struct QuotaLedger::Cell {
  struct Version {
    uint64_t ticket{0};
    int64_t usage{0};
    std::optional<int64_t> limit;
  };

  std::atomic<uint64_t> claim{0};         // 0 = free, otherwise a claim token

  mutable std::shared_mutex versions_mu;  // guards versions and history only
  std::deque<Version> versions;           // ascending ticket, never empty
  std::deque<QuotaHistoryEntry> history;

  Version newest() const {
    std::shared_lock lk(versions_mu);
    return versions.back();
  }
};

struct QuotaLedger::Mutation {
  enum class Kind { add, set_limit, overwrite };
  Kind kind{Kind::add};
  QuotaKey key;
  int64_t amount{0};              // delta for add, value for overwrite
  std::optional<int64_t> limit;   // for set_limit
  int64_t expected{0};            // for overwrite
};

QuotaValue LedgerSnapshot::get(const QuotaKey& key) const {
  auto it = values.find(key);
  return it == values.end() ? QuotaValue{} : it->second;
}

QuotaLedger::QuotaLedger(Clock clock, int64_t history_retention_seconds)
    : clock_(std::move(clock)), history_retention_seconds_(history_retention_seconds) {}

QuotaLedger::~QuotaLedger() = default;

int64_t QuotaLedger::now() const {
  if (clock_) return clock_();
  using SC = std::chrono::system_clock;
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(SC::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// Scope directory
// ---------------------------------------------------------------------------

LedgerResult QuotaLedger::register_scope(const ScopeRef& scope) {
  const int64_t ts = now();
  std::unique_lock lk(dir_mu_);
  auto& cells = scopes_[scope];
  for (const auto& name : standard_quota_names()) {
    if (cells.count(name) != 0) continue;
    auto cell = std::make_shared<Cell>();
    cell->versions.push_back(Cell::Version{0, 0, std::nullopt});
    cell->history.push_back(QuotaHistoryEntry{ts, 0, std::nullopt});
    cells.emplace(name, std::move(cell));
  }
  return {};
}

LedgerResult QuotaLedger::unregister_scope(const ScopeRef& scope) {
  std::unique_lock lk(dir_mu_);
  if (scopes_.erase(scope) == 0) {
    return LedgerResult{false, ErrorCode::quota_record_missing, "unknown scope " + scope.to_string()};
  }
  return {};
}

bool QuotaLedger::has_scope(const ScopeRef& scope) const {
  std::shared_lock lk(dir_mu_);
  return scopes_.count(scope) != 0;
}

std::vector<ScopeRef> QuotaLedger::scopes() const {
  std::shared_lock lk(dir_mu_);
  std::vector<ScopeRef> out;
  out.reserve(scopes_.size());
  for (const auto& [scope, _] : scopes_) out.push_back(scope);
  return out;
}

QuotaLedger::CellPtr QuotaLedger::find_cell(const QuotaKey& key) const {
  std::shared_lock lk(dir_mu_);
  auto s = scopes_.find(key.scope);
  if (s == scopes_.end()) return nullptr;
  auto c = s->second.find(key.resource_type);
  return c == s->second.end() ? nullptr : c->second;
}

QuotaLedger::CellPtr QuotaLedger::find_or_create_cell(const QuotaKey& key, LedgerResult& err) {
  if (auto cell = find_cell(key)) return cell;
  if (key.resource_type.empty()) {
    err = LedgerResult{false, ErrorCode::validation_error, "empty resource type for " + key.scope.to_string()};
    return nullptr;
  }
  const int64_t ts = now();
  std::unique_lock lk(dir_mu_);
  auto s = scopes_.find(key.scope);
  if (s == scopes_.end()) {
    err = LedgerResult{false, ErrorCode::quota_record_missing, "unknown scope " + key.scope.to_string()};
    return nullptr;
  }
  auto& slot = s->second[key.resource_type];
  if (!slot) {
    slot = std::make_shared<Cell>();
    slot->versions.push_back(Cell::Version{0, 0, std::nullopt});
    slot->history.push_back(QuotaHistoryEntry{ts, 0, std::nullopt});
  }
  return slot;
}

namespace {

template <typename F>
class ScopeExit {
 public:
  explicit ScopeExit(F f) : f_(std::move(f)) {}
  ~ScopeExit() { f_(); }
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

 private:
  F f_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

void QuotaLedger::publish(uint64_t ticket) {
  uint64_t expected = ticket - 1;
  while (!visible_.compare_exchange_weak(expected, ticket, std::memory_order_release,
                                         std::memory_order_relaxed)) {
    expected = ticket - 1;
    std::this_thread::yield();
  }
}

BatchResult QuotaLedger::commit(const std::vector<Mutation>& mutations, OverwriteResult* overwrite) {
  auto& stats = global_engine_stats();
  BatchResult result;

  std::vector<CellPtr> cells;
  cells.reserve(mutations.size());
  for (const auto& m : mutations) {
    LedgerResult err;
    auto cell = find_or_create_cell(m.key, err);
    if (!cell) {
      result.ok = false;
      result.error = err.error;
      result.detail = err.detail;
      stats.batches_aborted.fetch_add(1, std::memory_order_relaxed);
      return result;
    }
    cells.push_back(std::move(cell));
  }

  // Claim order: by key, so two batches over overlapping keys contend on the
  // same first cell instead of livelocking on each other's claims.
  std::vector<size_t> order(mutations.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::sort(order.begin(), order.end(),
            [&](size_t a, size_t b) { return mutations[a].key < mutations[b].key; });

  std::vector<Cell::Version> base(mutations.size());
  std::vector<size_t> claimed;
  claimed.reserve(order.size());
  const uint64_t token = claim_tokens_.fetch_add(1, std::memory_order_relaxed) + 1;

  auto release_claims = [&] {
    for (size_t idx : claimed) cells[idx]->claim.store(0, std::memory_order_release);
    claimed.clear();
  };

  for (;;) {
    // Optimistic read of the newest installed versions.
    for (size_t i = 0; i < cells.size(); ++i) base[i] = cells[i]->newest();

    bool lost = false;
    for (size_t idx : order) {
      uint64_t free_word = 0;
      if (!cells[idx]->claim.compare_exchange_strong(free_word, token, std::memory_order_acq_rel,
                                                     std::memory_order_relaxed)) {
        lost = true;
        break;
      }
      claimed.push_back(idx);
      if (cells[idx]->newest().ticket != base[idx].ticket) {
        lost = true;
        break;
      }
    }
    if (!lost) break;
    release_claims();
    stats.commit_retries.fetch_add(1, std::memory_order_relaxed);
    std::this_thread::yield();
  }

  // Claims held on every key from here on.
  std::vector<Cell::Version> next(mutations.size());
  for (size_t i = 0; i < mutations.size(); ++i) {
    const auto& m = mutations[i];
    next[i] = base[i];
    switch (m.kind) {
      case Mutation::Kind::add: {
        const int64_t raw = base[i].usage + m.amount;
        next[i].usage = raw < 0 ? 0 : raw;
        if (raw < 0) ++result.clamped;
        break;
      }
      case Mutation::Kind::set_limit:
        next[i].limit = m.limit;
        break;
      case Mutation::Kind::overwrite:
        if (base[i].usage != m.expected) {
          if (overwrite) {
            overwrite->ok = false;
            overwrite->conflict = true;
            overwrite->observed = base[i].usage;
            overwrite->detail = "usage of " + m.key.to_string() + " changed since it was read";
          }
          release_claims();
          result.ok = false;
          result.detail = "usage of " + m.key.to_string() + " changed since it was read";
          return result;
        }
        next[i].usage = m.amount < 0 ? 0 : m.amount;
        break;
    }
  }

  const uint64_t ticket = next_ticket_.fetch_add(1, std::memory_order_acq_rel) + 1;
  result.ticket = ticket;

  // Every exit from here, exceptions included, withdraws a partial install,
  // releases the claims and publishes the ticket. Later tickets wait on it.
  size_t installed = 0;
  bool installed_all = false;
  ScopeExit finish([&] {
    if (!installed_all) {
      for (size_t i = 0; i < installed; ++i) {
        std::unique_lock lk(cells[i]->versions_mu);
        cells[i]->versions.pop_back();
      }
    }
    release_claims();
    publish(ticket);
  });

  // Install in batch order; the chaos hook models a storage failure on any key.
  for (; installed < mutations.size(); ++installed) {
    const auto fault = chaos::global_chaos().inject(chaos::FaultType::ledger_commit_failure,
                                                    mutations[installed].key.to_string());
    if (fault.injected) {
      result.ok = false;
      result.error = ErrorCode::fault_injected;
      result.detail = "commit failed on " + mutations[installed].key.to_string();
      break;
    }
    Cell& cell = *cells[installed];
    std::unique_lock lk(cell.versions_mu);
    next[installed].ticket = ticket;
    cell.versions.push_back(next[installed]);
  }

  if (!result.ok) {
    result.clamped = 0;
    stats.batches_aborted.fetch_add(1, std::memory_order_relaxed);
    return result;
  }
  installed_all = true;

  const int64_t ts = now();
  const int64_t cutoff = ts - history_retention_seconds_;
  const uint64_t visible = visible_.load(std::memory_order_acquire);
  for (size_t i = 0; i < mutations.size(); ++i) {
    Cell& cell = *cells[i];
    std::unique_lock lk(cell.versions_mu);
    cell.history.push_back(QuotaHistoryEntry{ts, next[i].usage, next[i].limit});
    while (cell.history.size() > 1 && cell.history[1].ts <= cutoff) cell.history.pop_front();
    while (cell.versions.size() > 1 && cell.versions[1].ticket <= visible) cell.versions.pop_front();
    result.new_usage[mutations[i].key] = next[i].usage;
  }

  stats.batches_committed.fetch_add(1, std::memory_order_relaxed);
  if (result.clamped > 0) {
    stats.clamped_adjustments.fetch_add(result.clamped, std::memory_order_relaxed);
    emit_log(LogLevel::warning, "ledger.clamped", "usage clamped at zero",
             jsonlite::Object{{"ticket", ticket}, {"keys", static_cast<uint64_t>(result.clamped)}});
  }
  return result;
}

AdjustResult QuotaLedger::adjust(const QuotaKey& key, int64_t delta) {
  auto batch = apply_batch({Adjustment{key, delta}});
  AdjustResult r;
  r.ok = batch.ok;
  r.error = batch.error;
  r.detail = batch.detail;
  r.clamped = batch.clamped > 0;
  if (batch.ok) r.new_usage = batch.new_usage[key];
  return r;
}

BatchResult QuotaLedger::apply_batch(const std::vector<Adjustment>& adjustments) {
  // Merge repeated keys, keeping first-seen order for the install sequence.
  std::vector<Mutation> mutations;
  std::map<QuotaKey, size_t> index;
  for (const auto& a : adjustments) {
    auto it = index.find(a.key);
    if (it != index.end()) {
      mutations[it->second].amount += a.delta;
      continue;
    }
    index.emplace(a.key, mutations.size());
    Mutation m;
    m.kind = Mutation::Kind::add;
    m.key = a.key;
    m.amount = a.delta;
    mutations.push_back(std::move(m));
  }
  if (mutations.empty()) {
    BatchResult empty;
    empty.ticket = visible_ticket();
    return empty;
  }
  return commit(mutations, nullptr);
}

LedgerResult QuotaLedger::set_limit(const QuotaKey& key, std::optional<int64_t> limit) {
  if (limit && *limit < 0) {
    return LedgerResult{false, ErrorCode::validation_error, "negative limit for " + key.to_string()};
  }
  Mutation m;
  m.kind = Mutation::Kind::set_limit;
  m.key = key;
  m.limit = limit;
  auto r = commit({m}, nullptr);
  return LedgerResult{r.ok, r.error, r.detail};
}

OverwriteResult QuotaLedger::overwrite_usage(const QuotaKey& key, int64_t expected, int64_t value) {
  OverwriteResult out;
  Mutation m;
  m.kind = Mutation::Kind::overwrite;
  m.key = key;
  m.amount = value;
  m.expected = expected;
  auto r = commit({m}, &out);
  if (out.conflict) return out;
  out.ok = r.ok;
  out.error = r.error;
  out.detail = r.detail;
  out.observed = r.ok ? expected : out.observed;
  return out;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

LedgerSnapshot QuotaLedger::read(const std::vector<std::pair<QuotaKey, CellPtr>>& cells) const {
  for (;;) {
    LedgerSnapshot snap;
    snap.ticket = visible_.load(std::memory_order_acquire);
    bool pruned = false;
    for (const auto& [key, cell] : cells) {
      std::shared_lock lk(cell->versions_mu);
      const Cell::Version* found = nullptr;
      for (auto it = cell->versions.rbegin(); it != cell->versions.rend(); ++it) {
        if (it->ticket <= snap.ticket) {
          found = &*it;
          break;
        }
      }
      if (!found) {
        // A newer visible version replaced the one this read ticket needs.
        pruned = true;
        break;
      }
      snap.values[key] = QuotaValue{found->usage, found->limit, found->ticket};
    }
    if (!pruned) return snap;
  }
}

std::optional<QuotaValue> QuotaLedger::get(const QuotaKey& key) const {
  auto cell = find_cell(key);
  if (!cell) return std::nullopt;
  std::vector<std::pair<QuotaKey, CellPtr>> cells;
  cells.emplace_back(key, std::move(cell));
  auto snap = read(cells);
  return snap.values.at(key);
}

LedgerSnapshot QuotaLedger::snapshot(const std::vector<QuotaKey>& keys) const {
  std::vector<std::pair<QuotaKey, CellPtr>> cells;
  for (const auto& k : keys) {
    if (auto c = find_cell(k)) cells.emplace_back(k, std::move(c));
  }
  return read(cells);
}

LedgerSnapshot QuotaLedger::snapshot_scope(const ScopeRef& scope) const {
  std::vector<std::pair<QuotaKey, CellPtr>> cells;
  {
    std::shared_lock lk(dir_mu_);
    auto s = scopes_.find(scope);
    if (s != scopes_.end()) {
      for (const auto& [name, cell] : s->second) cells.emplace_back(QuotaKey{scope, name}, cell);
    }
  }
  return read(cells);
}

LedgerSnapshot QuotaLedger::snapshot_all() const {
  std::vector<std::pair<QuotaKey, CellPtr>> cells;
  {
    std::shared_lock lk(dir_mu_);
    for (const auto& [scope, by_name] : scopes_) {
      for (const auto& [name, cell] : by_name) cells.emplace_back(QuotaKey{scope, name}, cell);
    }
  }
  return read(cells);
}

bool QuotaLedger::check(const QuotaKey& key, int64_t requested_delta) const {
  auto v = get(key);
  if (!v || !v->limit) return true;
  return v->usage + requested_delta <= *v->limit;
}

std::vector<std::string> QuotaLedger::validate_change(
    const std::vector<ScopeRef>& chain, const std::map<std::string, int64_t>& deltas) const {
  std::vector<QuotaKey> keys;
  for (const auto& scope : chain) {
    for (const auto& [name, _] : deltas) keys.push_back(QuotaKey{scope, name});
  }
  const auto snap = snapshot(keys);

  std::vector<std::string> errors;
  for (const auto& key : keys) {
    auto it = snap.values.find(key);
    if (it == snap.values.end() || !it->second.limit) continue;
    const int64_t required = it->second.usage + deltas.at(key.resource_type);
    if (required > *it->second.limit) {
      errors.push_back(key.resource_type + " quota limit: " + std::to_string(*it->second.limit) +
                       ", requires: " + std::to_string(required) + " (" + key.scope.to_string() + ")");
    }
  }
  return errors;
}

QuotaHistory QuotaLedger::history(const QuotaKey& key, int64_t from, int64_t to) const {
  QuotaHistory out;
  auto cell = find_cell(key);
  if (!cell) return out;
  std::shared_lock lk(cell->versions_mu);
  for (const auto& e : cell->history) {
    if (e.ts < from) {
      out.baseline = e;
    } else if (e.ts < to) {
      out.entries.push_back(e);
    }
  }
  return out;
}

}  // namespace tally
