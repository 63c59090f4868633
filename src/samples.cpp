#include "tally/samples.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>

#if defined(TALLY_WITH_ZSTD)
#include <zstd.h>
#endif

#include "tally/chaos.hpp"
#include "tally/hash.hpp"
#include "tally/jsonlite.hpp"
#include "tally/observability.hpp"
#include "tally/version.hpp"

namespace fs = std::filesystem;

namespace tally {

namespace {

constexpr const char* kArchiveFormat = "tally-samples";

#if defined(TALLY_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

std::string sample_line(const std::string& resource_id, Item item, int64_t ts, double value) {
  jsonlite::Object o;
  o["resource_id"] = resource_id;
  o["item"] = to_string(item);
  o["timestamp"] = ts;
  o["value"] = value;
  return jsonlite::to_json(o);
}

bool sample_from_object(const jsonlite::Object& o, RawSample& out, std::string* error) {
  out.resource_id = jsonlite::get_string(o, "resource_id");
  if (out.resource_id.empty()) {
    if (error) *error = "sample without resource_id";
    return false;
  }
  auto item = parse_item(jsonlite::get_string(o, "item"));
  if (!item) {
    if (error) *error = "unknown item '" + jsonlite::get_string(o, "item") + "'";
    return false;
  }
  if (!jsonlite::has_key(o, "timestamp") || !jsonlite::has_key(o, "value")) {
    if (error) *error = "sample without timestamp or value";
    return false;
  }
  out.item = *item;
  out.timestamp = jsonlite::get_i64(o, "timestamp");
  out.value = jsonlite::get_double(o, "value");
  out.unit = jsonlite::get_string(o, "unit");
  return true;
}

}  // namespace

std::optional<double> normalize_value(Item item, double value, const std::string& unit,
                                      std::string* error) {
  if (!std::isfinite(value)) {
    if (error) *error = "non-finite sample value";
    return std::nullopt;
  }
  if (item == Item::cpu) {
    double pct = value;
    if (unit == "ratio") pct = value * 100.0;
    else if (!unit.empty() && unit != "percent") {
      if (error) *error = "unit '" + unit + "' not valid for cpu";
      return std::nullopt;
    }
    return std::clamp(pct, 0.0, 100.0);
  }
  if (unit.empty() || unit == "MiB") return value;
  if (unit == "B") return value / (1024.0 * 1024.0);
  if (unit == "KiB") return value / 1024.0;
  if (unit == "GiB") return value * 1024.0;
  if (error) *error = "unit '" + unit + "' not valid for " + to_string(item);
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// NdjsonMonitoringBackend
// ---------------------------------------------------------------------------

NdjsonMonitoringBackend::NdjsonMonitoringBackend(std::vector<RawSample> samples) {
  for (auto& s : samples) by_resource_[s.resource_id].push_back(std::move(s));
}

NdjsonMonitoringBackend::LoadResult NdjsonMonitoringBackend::load(const std::string& path) {
  LoadResult out;
  std::ifstream ifs(path);
  if (!ifs) {
    out.ok = false;
    out.error = ErrorCode::backend_unavailable;
    out.detail = "cannot open sample file: " + path;
    return out;
  }
  std::vector<RawSample> samples;
  std::string line;
  size_t lineno = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    if (err) {
      out.ok = false;
      out.error = ErrorCode::json_parse_error;
      out.detail = path + ":" + std::to_string(lineno) + ": " + err->message;
      return out;
    }
    RawSample s;
    std::string why;
    if (!sample_from_object(obj, s, &why)) {
      out.ok = false;
      out.error = ErrorCode::validation_error;
      out.detail = path + ":" + std::to_string(lineno) + ": " + why;
      return out;
    }
    samples.push_back(std::move(s));
  }
  out.backend = std::make_unique<NdjsonMonitoringBackend>(std::move(samples));
  return out;
}

FetchResult NdjsonMonitoringBackend::fetch_samples(const std::vector<std::string>& resource_ids,
                                                   Item item, int64_t from, int64_t to,
                                                   const StopCheck& stop) {
  FetchResult out;
  for (const auto& id : resource_ids) {
    if (stop && stop()) {
      out.stopped = true;
      break;
    }
    auto fault = chaos::global_chaos().inject(chaos::FaultType::monitoring_timeout, id);
    if (fault.injected) {
      out.failures[id] = "monitoring timeout: " + fault.description;
      continue;
    }
    auto it = by_resource_.find(id);
    if (it == by_resource_.end()) continue;
    for (const auto& s : it->second) {
      if (s.item == item && s.timestamp >= from && s.timestamp < to) out.samples.push_back(s);
    }
  }
  return out;
}

std::vector<std::string> NdjsonMonitoringBackend::resource_ids() const {
  std::vector<std::string> out;
  out.reserve(by_resource_.size());
  for (const auto& [id, _] : by_resource_) out.push_back(id);
  return out;
}

// ---------------------------------------------------------------------------
// SampleStore
// ---------------------------------------------------------------------------

SampleStore::SampleStore(int64_t history_seconds, Clock clock)
    : history_seconds_(history_seconds), clock_(std::move(clock)) {}

int64_t SampleStore::now() const {
  return clock_ ? clock_() : static_cast<int64_t>(now_unix_ms() / 1000);
}

size_t SampleStore::append(const std::vector<UsageSample>& samples) {
  const int64_t cutoff = now() - history_seconds_;
  std::unique_lock lk(mu_);
  size_t added = 0;
  for (const auto& s : samples) {
    if (s.timestamp < cutoff) continue;
    auto& series = series_[s.resource_id][s.item];
    if (series.emplace(s.timestamp, s.value).second) ++added;
  }
  return added;
}

std::vector<UsageSample> SampleStore::query(const std::string& resource_id, Item item,
                                            int64_t from, int64_t to) const {
  std::vector<UsageSample> out;
  std::shared_lock lk(mu_);
  auto r = series_.find(resource_id);
  if (r == series_.end()) return out;
  auto i = r->second.find(item);
  if (i == r->second.end()) return out;
  for (auto it = i->second.lower_bound(from); it != i->second.end() && it->first < to; ++it) {
    out.push_back(UsageSample{resource_id, it->first, item, it->second});
  }
  return out;
}

size_t SampleStore::purge_expired() {
  const int64_t cutoff = now() - history_seconds_;
  std::unique_lock lk(mu_);
  size_t removed = 0;
  for (auto r = series_.begin(); r != series_.end();) {
    for (auto i = r->second.begin(); i != r->second.end();) {
      auto& series = i->second;
      auto end = series.lower_bound(cutoff);
      removed += static_cast<size_t>(std::distance(series.begin(), end));
      series.erase(series.begin(), end);
      i = series.empty() ? r->second.erase(i) : std::next(i);
    }
    r = r->second.empty() ? series_.erase(r) : std::next(r);
  }
  return removed;
}

size_t SampleStore::size() const {
  std::shared_lock lk(mu_);
  size_t n = 0;
  for (const auto& [id, items] : series_) {
    for (const auto& [item, series] : items) n += series.size();
  }
  return n;
}

ArchiveResult SampleStore::export_archive(const std::string& path) const {
  ArchiveResult out;
  std::string body;
  {
    std::shared_lock lk(mu_);
    for (const auto& [id, items] : series_) {
      for (const auto& [item, series] : items) {
        for (const auto& [ts, value] : series) {
          body += sample_line(id, item, ts, value);
          body += '\n';
          ++out.samples;
        }
      }
    }
  }
  out.digest = archive_digest(body);

  std::string payload = body;
  out.encoding = "ndjson";
#if defined(TALLY_WITH_ZSTD)
  auto c = compress_zstd(body);
  if (!c.empty()) {
    payload = std::move(c);
    out.encoding = "zstd";
  }
#endif

  jsonlite::Object header;
  header["format"] = kArchiveFormat;
  header["version"] = static_cast<uint64_t>(version::ARCHIVE_FORMAT_VERSION);
  header["encoding"] = out.encoding;
  header["original_size"] = static_cast<uint64_t>(body.size());
  header["samples"] = static_cast<uint64_t>(out.samples);
  header["digest"] = out.digest;

  // Write to a sibling temp file, then rename over the target.
  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      out.ok = false;
      out.error = ErrorCode::validation_error;
      out.detail = "cannot write archive: " + tmp;
      return out;
    }
    ofs << jsonlite::to_json(header) << '\n';
    ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!ofs) {
      out.ok = false;
      out.error = ErrorCode::validation_error;
      out.detail = "short write: " + tmp;
      return out;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    out.ok = false;
    out.error = ErrorCode::validation_error;
    out.detail = "cannot move archive into place: " + path;
    return out;
  }
  emit_log(LogLevel::info, "samples.archive_exported", path,
           {{"samples", static_cast<uint64_t>(out.samples)}, {"encoding", out.encoding},
            {"digest", out.digest}});
  return out;
}

ArchiveResult SampleStore::import_archive(const std::string& path) {
  ArchiveResult out;
  auto fail = [&](ErrorCode code, const std::string& detail) {
    out.ok = false;
    out.error = code;
    out.detail = detail;
    return out;
  };

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return fail(ErrorCode::validation_error, "cannot open archive: " + path);
  std::string header_line;
  if (!std::getline(ifs, header_line)) return fail(ErrorCode::validation_error, "empty archive");
  std::string payload((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  std::optional<jsonlite::JsonError> err;
  auto header = jsonlite::parse(header_line, &err);
  if (err) return fail(ErrorCode::json_parse_error, "archive header: " + err->message);
  if (jsonlite::get_string(header, "format") != kArchiveFormat ||
      jsonlite::get_u64(header, "version") == 0 ||
      jsonlite::get_u64(header, "version") > version::ARCHIVE_FORMAT_VERSION) {
    return fail(ErrorCode::validation_error, "unsupported archive format");
  }

  out.encoding = jsonlite::get_string(header, "encoding");
  std::string body;
  if (out.encoding == "ndjson") {
    body = std::move(payload);
  } else if (out.encoding == "zstd") {
#if defined(TALLY_WITH_ZSTD)
    body = decompress_zstd(payload, jsonlite::get_u64(header, "original_size"));
    if (body.empty() && jsonlite::get_u64(header, "original_size") != 0) {
      return fail(ErrorCode::validation_error, "zstd decompression failed");
    }
#else
    return fail(ErrorCode::validation_error, "archive is zstd-compressed; built without zstd");
#endif
  } else {
    return fail(ErrorCode::validation_error, "unknown archive encoding '" + out.encoding + "'");
  }

  out.digest = archive_digest(body);
  if (out.digest != jsonlite::get_string(header, "digest")) {
    return fail(ErrorCode::validation_error, "archive digest mismatch");
  }

  std::vector<UsageSample> samples;
  std::istringstream lines(body);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty()) continue;
    auto obj = jsonlite::parse(line, &err);
    if (err) return fail(ErrorCode::json_parse_error, "archive body: " + err->message);
    RawSample raw;
    std::string why;
    if (!sample_from_object(obj, raw, &why)) return fail(ErrorCode::validation_error, why);
    samples.push_back(UsageSample{raw.resource_id, raw.timestamp, raw.item, raw.value});
  }
  out.samples = append(samples);
  return out;
}

// ---------------------------------------------------------------------------
// bucketize
// ---------------------------------------------------------------------------

std::vector<Bucket> bucketize(const std::vector<UsageSample>& samples, int64_t from, int64_t to,
                              uint32_t n_buckets) {
  std::vector<Bucket> out;
  if (n_buckets == 0 || to <= from) return out;

  const int64_t span = to - from;
  const int64_t n = n_buckets;
  // floor(span * i / n) without overflowing span * i.
  auto edge = [&](int64_t i) { return from + (span / n) * i + (span % n) * i / n; };

  out.reserve(n_buckets);
  for (int64_t i = 0; i < n; ++i) out.push_back(Bucket{edge(i), edge(i + 1), 0.0});

  std::vector<double> sum(n_buckets, 0.0);
  std::vector<size_t> count(n_buckets, 0);
  for (const auto& s : samples) {
    if (s.timestamp < from || s.timestamp >= to) continue;
    auto it = std::upper_bound(out.begin(), out.end(), s.timestamp,
                               [](int64_t ts, const Bucket& b) { return ts < b.from; });
    // it points past the bucket whose from <= ts; zero-width buckets share a
    // from with their successor, so the last match is the non-empty one.
    const size_t idx = static_cast<size_t>(std::distance(out.begin(), it)) - 1;
    sum[idx] += s.value;
    ++count[idx];
  }
  for (size_t i = 0; i < out.size(); ++i) {
    if (count[i] > 0) out[i].value = sum[i] / static_cast<double>(count[i]);
  }
  return out;
}

// ---------------------------------------------------------------------------
// SampleIngestor
// ---------------------------------------------------------------------------

SampleIngestor::SampleIngestor(MonitoringBackend& backend, SampleStore& store, bool fail_silently)
    : backend_(backend), store_(store), fail_silently_(fail_silently) {}

IngestReport SampleIngestor::ingest(const std::vector<std::string>& resource_ids, Item item,
                                    int64_t from, int64_t to, const StopCheck& stop) {
  auto& stats = global_engine_stats();
  IngestReport report;
  if (to <= from) {
    report.ok = false;
    report.error = ErrorCode::validation_error;
    report.detail = "ingest window is empty";
    return report;
  }

  FetchResult fetched = backend_.fetch_samples(resource_ids, item, from, to, stop);
  report.fetched = fetched.samples.size();

  for (const auto& [id, reason] : fetched.failures) {
    stats.backend_failures.fetch_add(1, std::memory_order_relaxed);
    report.failed_resources.push_back(id);
    report.warnings.push_back(id + ": " + reason);
    emit_log(LogLevel::warning, "samples.backend_failure", reason,
             {{"resource_id", id}, {"item", to_string(item)}});
  }

  std::vector<UsageSample> normalized;
  normalized.reserve(fetched.samples.size());
  for (const auto& raw : fetched.samples) {
    std::string why;
    auto v = normalize_value(raw.item, raw.value, raw.unit, &why);
    if (!v) {
      ++report.rejected;
      report.warnings.push_back(raw.resource_id + ": " + why);
      continue;
    }
    normalized.push_back(UsageSample{raw.resource_id, raw.timestamp, raw.item, *v});
  }
  report.stored = store_.append(normalized);
  stats.samples_ingested.fetch_add(report.stored, std::memory_order_relaxed);

  if (fetched.stopped) {
    report.ok = false;
    report.error = ErrorCode::deadline_exceeded;
    report.deadline_exceeded = true;
    report.detail = "monitoring fetch stopped at deadline";
    emit_log(LogLevel::warning, "samples.fetch_stopped", report.detail,
             {{"item", to_string(item)}, {"fetched", static_cast<uint64_t>(report.fetched)}});
    return report;
  }
  if (!report.failed_resources.empty() && !fail_silently_) {
    report.ok = false;
    report.error = ErrorCode::backend_unavailable;
    report.detail = std::to_string(report.failed_resources.size()) + " resource(s) unreachable";
  }
  return report;
}

}  // namespace tally
