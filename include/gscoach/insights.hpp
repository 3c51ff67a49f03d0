#pragma once
#include <optional>
#include <string>
#include <vector>
#include <gscoach/benchmarks.hpp>
#include <gscoach/engagement.hpp>
#include <gscoach/metrics.hpp>
#include <gscoach/position_tracker.hpp>
#include <gscoach/snapshot.hpp>

namespace gscoach {

inline constexpr double kProximityWarnRadius = 2000.0;
inline constexpr GameClock kRecentSightingS = 30;

// Everything the compositor reads; copied out of the Coach under one lock.
struct InsightInputs {
  Snapshot current;
  std::optional<EngagementStatus> engagement;
  std::vector<MovementDescription> movements;
  std::vector<Prediction> predictions;
  MetricReport metrics;
  DeathSummary deaths;
};

enum class Phase { Early, Mid, Late };

// < 10 min early, < 25 min mid, otherwise late.
Phase phase_at(GameClock clock);
const char* phase_name(Phase p);

enum class DistanceBand { VeryClose, Nearby, Medium, Far };

DistanceBand distance_band(double units);
const char* distance_band_text(DistanceBand b);

enum class Readiness { Excellent, Good, Caution, NotReady };

// Health/mana thresholds plus ability availability; ranges from -2 to 7.
int readiness_score(const Snapshot& s);
Readiness readiness_tier(int score);
const char* readiness_text(Readiness r);

// Gold threshold purchase hint; nullopt below 1000 gold.
std::optional<std::string> item_suggestion(int gold);

// Net worth against the minute-indexed benchmark table.
std::vector<std::string> item_timing_lines(const Snapshot& s, const BenchmarkCatalog& bench);

// Standing tower comparison; empty without building data or a known team.
std::vector<std::string> map_control_lines(const Snapshot& s);

// Ordered advisory list: engagement, enemy tracking and predictions,
// performance, phase-specific advice, item timings, map control.
std::vector<std::string> compose_insights(const InsightInputs& in, const BenchmarkCatalog& bench);

} // namespace gscoach
