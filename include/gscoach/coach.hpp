#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <gscoach/benchmarks.hpp>
#include <gscoach/engagement.hpp>
#include <gscoach/insights.hpp>
#include <gscoach/metrics.hpp>
#include <gscoach/position_tracker.hpp>
#include <gscoach/snapshot_store.hpp>

namespace gscoach {

// Consistent copy of everything derived up to one ingestion step.
struct CoachView {
  std::uint64_t seq{0};
  InsightInputs inputs;
  std::map<std::string, TrackedEntity> histories;
  std::vector<KillEvent> events;
  std::vector<std::string> insights;
};

// Owns one of each component. A single producer calls ingest(); any number of
// readers call poll()/view() from their own threads.
class Coach {
public:
  Coach() : Coach(benchmark_catalog()) {}
  explicit Coach(BenchmarkCatalog benchmarks);

  Coach(const Coach&) = delete;
  Coach& operator=(const Coach&) = delete;

  // Returns false when s is not newer than the current snapshot; nothing
  // changes in that case.
  bool ingest(Snapshot s);

  // Fills out and advances cursor only when something was ingested since.
  bool poll(std::uint64_t& cursor, CoachView& out) const;

  CoachView view() const;

  // Back to the freshly constructed state (same benchmarks).
  void reset();

  std::uint64_t sequence() const { return store_.sequence(); }
  std::uint64_t dropped() const;

private:
  // Raw component state taken under the shared lock. Everything in a
  // CoachView is derived from it after the lock is released.
  struct State_ {
    SnapshotPair pair;
    EntityPositionTracker tracker;
    EngagementDetector detector;
    MetricSampler sampler;
  };

  State_ copy_state_() const; // caller holds mu_ (shared)
  static void derive_(const State_& st, CoachView& out);

  mutable std::shared_mutex mu_;
  SnapshotStore store_;
  EntityPositionTracker tracker_;
  EngagementDetector detector_;
  std::shared_ptr<const BenchmarkCatalog> benchmarks_;
  MetricSampler sampler_;
  std::optional<GameClock> current_clock_;
  std::uint64_t dropped_{0};
};

} // namespace gscoach
