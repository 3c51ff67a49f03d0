#include <gscoach/coach.hpp>
#include <mutex>
#include <utility>
#include <gscoach/log.hpp>

namespace gscoach {

Coach::Coach(BenchmarkCatalog benchmarks)
  : benchmarks_(std::make_shared<const BenchmarkCatalog>(std::move(benchmarks))),
    sampler_(benchmarks_) {}

bool Coach::ingest(Snapshot s) {
  std::unique_lock lock(mu_);

  if (current_clock_ && s.clock() <= *current_clock_) {
    ++dropped_;
    logger().debug("coach: dropping snapshot at {} (current {})",
                   format_game_time(s.clock()), format_game_time(*current_clock_));
    return false;
  }
  current_clock_ = s.clock();

  const SnapshotPair pair = store_.ingest(std::move(s));
  const Snapshot& cur = *pair.current;
  tracker_.update(cur);
  const std::size_t n = detector_.update(cur, pair.previous ? &*pair.previous : nullptr);
  if (n > 0) logger().debug("coach: {} new event(s) at {}", n, format_game_time(cur.clock()));
  sampler_.update(cur);
  return true;
}

Coach::State_ Coach::copy_state_() const {
  return State_{store_.latest(), tracker_, detector_, sampler_};
}

void Coach::derive_(const State_& st, CoachView& out) {
  out.seq = st.pair.seq;
  out.inputs = InsightInputs{};
  if (st.pair.current) out.inputs.current = *st.pair.current;

  const GameClock now = out.inputs.current.clock();
  out.inputs.engagement = st.detector.status_at(now);
  out.inputs.movements = st.tracker.describe_recent(now);
  out.inputs.predictions = st.tracker.predict(now);
  out.inputs.metrics = st.sampler.report(now);
  out.inputs.deaths = st.detector.death_summary();
  out.histories = st.tracker.entities();
  out.events = st.detector.events();
  out.insights = compose_insights(out.inputs, st.sampler.benchmarks());
}

bool Coach::poll(std::uint64_t& cursor, CoachView& out) const {
  std::optional<State_> st;
  {
    std::shared_lock lock(mu_);
    if (store_.sequence() == cursor) return false;
    st.emplace(copy_state_());
  }
  derive_(*st, out);
  cursor = out.seq;
  return true;
}

CoachView Coach::view() const {
  std::optional<State_> st;
  {
    std::shared_lock lock(mu_);
    st.emplace(copy_state_());
  }
  CoachView out;
  derive_(*st, out);
  return out;
}

void Coach::reset() {
  std::unique_lock lock(mu_);
  store_.clear();
  current_clock_.reset();
  tracker_ = EntityPositionTracker{};
  detector_ = EngagementDetector{};
  sampler_ = MetricSampler(benchmarks_);
  dropped_ = 0;
  logger().debug("coach: reset");
}

std::uint64_t Coach::dropped() const {
  std::shared_lock lock(mu_);
  return dropped_;
}

} // namespace gscoach
