#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gscoach/benchmarks.hpp>
#include <gscoach/ring_series.hpp>
#include <gscoach/snapshot.hpp>

namespace gscoach {

inline constexpr std::size_t kMetricSeriesCap = 20;
inline constexpr double kTrendSignificant = 100.0;
inline constexpr double kTrendMild = 20.0;

enum class Metric { Gpm, Xpm, LastHits };

const char* metric_label(Metric m);

enum class Trend { UpSignificantly, Up, Flat, Down, DownSignificantly };

// latest >= mean + 100 -> UpSignificantly, >= mean + 20 -> Up, and the mirror
// image downwards; anything closer to the mean is Flat.
Trend classify_trend(double latest, double mean);
const char* trend_text(Trend t); // "trending up significantly", ...

struct MetricSample {
  GameClock clock{};
  int value{};
};

using MetricSeries = RingSeries<MetricSample, kMetricSeriesCap>;

struct SeriesStats {
  Metric metric{};
  int latest{};
  double mean{};
  Trend trend{Trend::Flat};
  std::size_t samples{};
};

enum class CsRating { Excellent, Good, Average, Poor };

struct CsRate {
  double per_minute{};
  std::string phase; // benchmark table used
  CsRating rating{CsRating::Average};
};

struct MetricReport {
  std::vector<SeriesStats> series; // only series with >= 2 samples
  std::optional<CsRate> cs_rate;

  std::optional<SeriesStats> find(Metric m) const;
  std::vector<std::string> lines() const;
};

// Rolling gpm / xpm / last-hit series for the local player.
// Not thread-safe; Coach serializes access. The benchmark catalog is shared
// and never modified, so copies of a sampler may outlive the original.
class MetricSampler {
public:
  MetricSampler() : MetricSampler(benchmark_catalog()) {}
  explicit MetricSampler(BenchmarkCatalog benchmarks);
  explicit MetricSampler(std::shared_ptr<const BenchmarkCatalog> benchmarks);

  // Append whichever values s carries. Snapshots not newer than the last
  // sampled one are ignored.
  void update(const Snapshot& s);

  MetricReport report(GameClock now) const;

  const MetricSeries& series(Metric m) const;
  const BenchmarkCatalog& benchmarks() const { return *benchmarks_; }
  std::shared_ptr<const BenchmarkCatalog> benchmarks_handle() const { return benchmarks_; }

private:
  static std::optional<SeriesStats> stats_(Metric m, const MetricSeries& s);

  MetricSeries gpm_;
  MetricSeries xpm_;
  MetricSeries last_hits_;
  std::optional<GameClock> last_clock_;
  std::shared_ptr<const BenchmarkCatalog> benchmarks_;
};

} // namespace gscoach
