#pragma once

// tally/samples.hpp - Sample Ingestion & Bucketing.
//
// PIPELINE:
//   MonitoringBackend::fetch_samples()  raw samples with units, per-resource
//                                       failures reported, never thrown
//   normalize_value()                   memory/storage -> MiB, cpu -> 0..100 %
//   SampleStore::append()               append-only, keyed (resource, item, ts)
//   bucketize()                         n contiguous [from, to) windows, mean
//
// RETENTION:
//   The store keeps samples newer than now - history_seconds. purge_expired()
//   drops the rest; a sample older than the window is rejected at append.
//
// ARCHIVES:
//   export_archive() writes one JSON header line followed by the NDJSON body.
//   With TALLY_WITH_ZSTD the body is zstd-compressed. The header carries the
//   BLAKE3 "arc:" digest of the uncompressed body, checked on import.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tally/types.hpp"

namespace tally {

struct UsageSample {
  std::string resource_id;
  int64_t timestamp{0};
  Item item{Item::cpu};
  double value{0.0};
};

struct RawSample {
  std::string resource_id;
  int64_t timestamp{0};
  Item item{Item::cpu};
  double value{0.0};
  std::string unit;   // B, KiB, MiB, GiB for memory/storage; ratio, percent for cpu
};

// Empty unit means already normalized. nullopt (and *error) for a unit the
// item does not accept.
std::optional<double> normalize_value(Item item, double value, const std::string& unit,
                                      std::string* error);

struct FetchResult {
  std::vector<RawSample> samples;
  std::map<std::string, std::string> failures;   // resource_id -> reason
  bool stopped{false};                            // stop check fired; remaining ids not fetched
};

// Polled by backends between resources. Returns true once the caller's
// deadline has passed or the query was cancelled. Empty = never stop.
using StopCheck = std::function<bool()>;

class MonitoringBackend {
 public:
  virtual ~MonitoringBackend() = default;
  virtual FetchResult fetch_samples(const std::vector<std::string>& resource_ids, Item item,
                                    int64_t from, int64_t to, const StopCheck& stop) = 0;
};

// Backend over a fixed sample set, loaded from NDJSON lines:
//   {"resource_id":"r1","timestamp":100,"item":"cpu","value":0.5,"unit":"ratio"}
// A monitoring_timeout chaos fault targeted at a resource id fails that
// resource's fetch.
class NdjsonMonitoringBackend : public MonitoringBackend {
 public:
  explicit NdjsonMonitoringBackend(std::vector<RawSample> samples);

  struct LoadResult {
    bool ok{true};
    ErrorCode error{ErrorCode::none};
    std::string detail;
    std::unique_ptr<NdjsonMonitoringBackend> backend;
  };
  static LoadResult load(const std::string& path);

  FetchResult fetch_samples(const std::vector<std::string>& resource_ids, Item item,
                            int64_t from, int64_t to, const StopCheck& stop) override;

  std::vector<std::string> resource_ids() const;

 private:
  std::map<std::string, std::vector<RawSample>> by_resource_;
};

struct ArchiveResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  size_t samples{0};
  std::string digest;
  std::string encoding;
};

class SampleStore {
 public:
  using Clock = std::function<int64_t()>;

  explicit SampleStore(int64_t history_seconds = 30LL * 24 * 3600, Clock clock = {});

  // Returns the number of samples newly stored. Re-ingesting a sample with
  // the same (resource, item, timestamp) is a no-op.
  size_t append(const std::vector<UsageSample>& samples);

  // Samples with timestamp in [from, to), ascending.
  std::vector<UsageSample> query(const std::string& resource_id, Item item, int64_t from,
                                 int64_t to) const;

  size_t purge_expired();
  size_t size() const;

  ArchiveResult export_archive(const std::string& path) const;
  ArchiveResult import_archive(const std::string& path);

 private:
  int64_t now() const;

  int64_t history_seconds_;
  Clock clock_;
  mutable std::shared_mutex mu_;
  std::map<std::string, std::map<Item, std::map<int64_t, double>>> series_;
};

struct Bucket {
  int64_t from{0};
  int64_t to{0};
  double value{0.0};
};

// Exactly n_buckets windows: from_i = from + span*i/n, to_i = from_{i+1},
// value = mean of samples inside, 0 when empty. Empty result when
// n_buckets == 0 or to <= from.
std::vector<Bucket> bucketize(const std::vector<UsageSample>& samples, int64_t from, int64_t to,
                              uint32_t n_buckets);

struct IngestReport {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  size_t fetched{0};
  size_t stored{0};
  size_t rejected{0};                       // unit normalization failures
  std::vector<std::string> failed_resources;
  std::vector<std::string> warnings;
  bool deadline_exceeded{false};
};

class SampleIngestor {
 public:
  SampleIngestor(MonitoringBackend& backend, SampleStore& store, bool fail_silently = true);

  // A fired stop check yields deadline_exceeded regardless of fail_silently;
  // samples fetched before it are still stored.
  IngestReport ingest(const std::vector<std::string>& resource_ids, Item item, int64_t from,
                      int64_t to, const StopCheck& stop = {});

 private:
  MonitoringBackend& backend_;
  SampleStore& store_;
  bool fail_silently_;
};

}  // namespace tally
