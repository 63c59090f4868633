#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tally/audit.hpp"
#include "tally/cli_args.hpp"
#include "tally/config.hpp"
#include "tally/engine.hpp"
#include "tally/events.hpp"
#include "tally/jsonlite.hpp"
#include "tally/observability.hpp"
#include "tally/samples.hpp"
#include "tally/stats.hpp"

namespace {

bool read_file(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

int fail(tally::ErrorCode code, const std::string& detail) {
  std::cerr << "{\"error\":\"" << tally::to_string(code) << "\",\"detail\":\""
            << tally::jsonlite::escape(detail) << "\"}\n";
  return 2;
}

int usage() {
  std::cerr << "usage: tally <command> [options]\n"
               "  health\n"
               "  config check [--config FILE]\n"
               "  run --topology FILE [--config FILE] [--events FILE] [--samples FILE]\n"
               "      [--reconcile] [--query KIND] [--aggregate TYPE] [--scope UUID]\n"
               "      [--item ITEM] [--from TS] [--to TS] [--buckets N] [--interval UNIT]\n"
               "      [--backend-ref REF] [--type TYPE] [--alert-type T] [--acknowledged B]\n"
               "      [--opened B]\n"
               "      KIND: usage|customers|resources|creation|quota|timeline|alerts\n"
               "  archive export --samples FILE --out FILE [--from TS] [--to TS]\n"
               "  archive import --in FILE\n"
               "  audit verify --log FILE\n";
  return 1;
}

std::optional<std::string> flag(const std::map<std::string, std::string>& flags,
                                const std::string& name) {
  auto it = flags.find(name);
  if (it == flags.end()) return std::nullopt;
  return it->second;
}

bool parse_i64(const std::string& s, int64_t& out) {
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (s.empty() || *end != '\0') return false;
  out = static_cast<int64_t>(v);
  return true;
}

// Reads --from/--to/--buckets; false on a malformed number.
bool window_flags(const std::map<std::string, std::string>& flags, std::optional<int64_t>& from,
                  std::optional<int64_t>& to, std::string* bad) {
  for (const char* name : {"from", "to"}) {
    if (auto v = flag(flags, name)) {
      int64_t ts = 0;
      if (!parse_i64(*v, ts)) {
        *bad = std::string("--") + name + " must be an integer timestamp";
        return false;
      }
      (std::string(name) == "from" ? from : to) = ts;
    }
  }
  return true;
}

std::optional<bool> parse_bool(const std::string& s) {
  if (s == "true" || s == "1") return true;
  if (s == "false" || s == "0") return false;
  return std::nullopt;
}

int load_events(tally::Engine& engine, const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) return fail(tally::ErrorCode::validation_error, "cannot open events file: " + path);
  std::string line;
  size_t lineno = 0;
  uint64_t applied = 0, rejected = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    if (line.empty()) continue;
    std::optional<tally::jsonlite::JsonError> err;
    auto obj = tally::jsonlite::parse(line, &err);
    if (err) {
      return fail(tally::ErrorCode::json_parse_error,
                  path + ":" + std::to_string(lineno) + ": " + err->message);
    }
    std::string why;
    auto ev = tally::event_from_object(obj, &why);
    if (!ev) {
      return fail(tally::ErrorCode::validation_error,
                  path + ":" + std::to_string(lineno) + ": " + why);
    }
    auto outcome = engine.apply_event(*ev);
    if (outcome.ok) {
      ++applied;
    } else if (!outcome.queued) {
      ++rejected;
      std::cerr << outcome.to_json() << "\n";
    }
  }
  std::cerr << "{\"events_applied\":" << applied << ",\"events_rejected\":" << rejected
            << ",\"pending\":" << engine.processor().pending_count() << "}\n";
  return 0;
}

int run_query(tally::Engine& engine, const std::map<std::string, std::string>& flags) {
  using namespace tally;
  const std::string kind = flag(flags, "query").value_or("");

  std::optional<int64_t> from, to;
  std::string bad;
  if (!window_flags(flags, from, to, &bad)) return fail(ErrorCode::validation_error, bad);

  ScopeType aggregate = ScopeType::customer;
  if (auto a = flag(flags, "aggregate")) {
    auto t = parse_scope_type(*a);
    if (!t) return fail(ErrorCode::validation_error, "unknown aggregate '" + *a + "'");
    aggregate = *t;
  }
  const auto scope_uuid = flag(flags, "scope");

  uint32_t buckets = engine.config().default_buckets;
  if (auto b = flag(flags, "buckets")) {
    int64_t n = 0;
    if (!parse_i64(*b, n) || n <= 0 || n > 10000) {
      return fail(ErrorCode::validation_error, "--buckets must be in [1, 10000]");
    }
    buckets = static_cast<uint32_t>(n);
  }

  std::unique_ptr<QueryContext> ctx;
  if (engine.query_timeout().count() > 0) {
    ctx = std::make_unique<QueryContext>(engine.query_timeout());
  } else {
    ctx = std::make_unique<QueryContext>();
  }

  const auto& stats = engine.stats();
  if (kind == "usage") {
    UsageQuery q;
    q.aggregate = aggregate;
    q.scope_uuid = scope_uuid;
    q.from = from;
    q.to = to;
    q.n_buckets = buckets;
    if (auto i = flag(flags, "item")) {
      auto item = parse_item(*i);
      if (!item) return fail(ErrorCode::validation_error, "unknown item '" + *i + "'");
      q.item = *item;
    }
    auto r = stats.usage_statistics(q, *ctx);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "customers") {
    auto r = stats.customer_summary(*ctx);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "resources") {
    auto r = stats.resource_statistics(flag(flags, "backend-ref").value_or(""));
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "creation") {
    CreationTimeQuery q;
    if (auto t = flag(flags, "type")) {
      auto type = parse_scope_type(*t);
      if (!type) return fail(ErrorCode::validation_error, "unknown type '" + *t + "'");
      q.type = *type;
    }
    q.from = from;
    q.to = to;
    q.n_buckets = buckets;
    auto r = stats.creation_time_statistics(q);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "quota") {
    QuotaQuery q{aggregate, scope_uuid};
    auto r = stats.quota_statistics(q, *ctx);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "timeline") {
    TimelineQuery q;
    q.from = from;
    q.to = to;
    q.aggregate = aggregate;
    q.scope_uuid = scope_uuid;
    q.item = flag(flags, "item");
    if (auto i = flag(flags, "interval")) {
      auto interval = parse_interval(*i);
      if (!interval) return fail(ErrorCode::validation_error, "unknown interval '" + *i + "'");
      q.interval = *interval;
    }
    auto r = stats.quota_timeline(q, *ctx);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  if (kind == "alerts") {
    AlertQuery q;
    q.from = from;
    q.to = to;
    if (scope_uuid) q.scope = ScopeRef{aggregate, *scope_uuid};
    if (auto t = flag(flags, "alert-type")) q.types.push_back(*t);
    if (auto a = flag(flags, "acknowledged")) {
      q.acknowledged = parse_bool(*a);
      if (!q.acknowledged) return fail(ErrorCode::validation_error, "--acknowledged expects true|false");
    }
    if (auto o = flag(flags, "opened")) {
      q.opened = parse_bool(*o);
      if (!q.opened) return fail(ErrorCode::validation_error, "--opened expects true|false");
    }
    auto r = stats.alert_statistics(q);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }
  return fail(ErrorCode::validation_error, "unknown query '" + kind + "'");
}

}  // namespace

int main(int argc, char** argv) {
  const auto cl = tally::parse_command_line(argc, argv);
  const std::string cmd = cl.word(0);
  const std::string sub = cl.word(1);
  const auto& flags = cl.flags;
  if (cmd.empty()) return usage();

  if (cmd == "health") {
    tally::Engine engine;
    std::cout << engine.health_json() << "\n";
    return 0;
  }

  if (cmd == "config" && sub == "check") {
    auto cfg = tally::load_config(flag(flags, "config").value_or(""));
    if (!cfg.ok) return fail(cfg.error, cfg.detail);
    std::cout << cfg.config.to_json() << "\n";
    return 0;
  }

  if (cmd == "audit" && sub == "verify") {
    auto log = flag(flags, "log");
    if (!log) return usage();
    auto v = tally::verify_audit_chain(*log);
    std::cout << "{\"ok\":" << (v.ok ? "true" : "false") << ",\"entries\":" << v.entries
              << ",\"first_bad_sequence\":" << v.first_bad_sequence << ",\"error\":\""
              << tally::jsonlite::escape(v.error) << "\"}\n";
    return v.ok ? 0 : 2;
  }

  if (cmd == "archive" && (sub == "export" || sub == "import")) {
    auto cfg = tally::load_config(flag(flags, "config").value_or(""));
    if (!cfg.ok) return fail(cfg.error, cfg.detail);
    tally::SampleStore store(cfg.config.sample_history_seconds);

    tally::ArchiveResult r;
    if (sub == "export") {
      auto samples = flag(flags, "samples");
      auto out = flag(flags, "out");
      if (!samples || !out) return usage();
      auto loaded = tally::NdjsonMonitoringBackend::load(*samples);
      if (!loaded.ok) return fail(loaded.error, loaded.detail);

      std::optional<int64_t> from, to;
      std::string bad;
      if (!window_flags(flags, from, to, &bad)) return fail(tally::ErrorCode::validation_error, bad);
      const int64_t hi = to.value_or(tally::now_unix_ms() / 1000 + 1);
      const int64_t lo = from.value_or(hi - cfg.config.sample_history_seconds);

      const auto ids = loaded.backend->resource_ids();
      tally::SampleIngestor ingestor(*loaded.backend, store, cfg.config.fail_silently);
      for (auto item : {tally::Item::cpu, tally::Item::memory, tally::Item::storage}) {
        auto report = ingestor.ingest(ids, item, lo, hi);
        if (!report.ok) return fail(report.error, report.detail);
      }
      r = store.export_archive(*out);
    } else {
      auto in = flag(flags, "in");
      if (!in) return usage();
      r = store.import_archive(*in);
    }
    if (!r.ok) return fail(r.error, r.detail);
    std::cout << "{\"ok\":true,\"samples\":" << r.samples << ",\"encoding\":\"" << r.encoding
              << "\",\"digest\":\"" << r.digest << "\"}\n";
    return 0;
  }

  if (cmd == "run") {
    auto topology_path = flag(flags, "topology");
    if (!topology_path) return usage();

    auto cfg = tally::load_config(flag(flags, "config").value_or(""));
    if (!cfg.ok) return fail(cfg.error, cfg.detail);
    tally::Engine engine(cfg.config);

    std::string text;
    if (!read_file(*topology_path, text)) {
      return fail(tally::ErrorCode::validation_error, "cannot read " + *topology_path);
    }
    std::optional<tally::jsonlite::JsonError> err;
    auto doc = tally::jsonlite::parse(text, &err);
    if (err) return fail(tally::ErrorCode::json_parse_error, *topology_path + ": " + err->message);
    auto topo = engine.load_topology(doc);
    if (!topo.ok) return fail(topo.error, topo.detail);

    if (auto samples = flag(flags, "samples")) {
      auto loaded = tally::NdjsonMonitoringBackend::load(*samples);
      if (!loaded.ok) return fail(loaded.error, loaded.detail);
      engine.attach_backend(std::move(loaded.backend));
    }
    if (auto events = flag(flags, "events")) {
      const int rc = load_events(engine, *events);
      if (rc != 0) return rc;
    }
    if (flag(flags, "reconcile")) {
      std::cout << engine.reconcile().to_json() << "\n";
    }
    if (flag(flags, "query")) return run_query(engine, flags);
    return 0;
  }

  return usage();
}
