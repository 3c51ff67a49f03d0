#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <gscoach/ring_series.hpp>
#include <gscoach/snapshot.hpp>

namespace gscoach {

inline constexpr std::size_t kPositionHistoryCap = 100;
inline constexpr GameClock kDescribeWindowS = 60;
inline constexpr GameClock kPredictWindowS = 30;

struct PositionSample {
  GameClock clock{};
  Vec2i pos{};
};

using PositionHistory = RingSeries<PositionSample, kPositionHistoryCap>;

struct TrackedEntity {
  PositionHistory history;
  int times_spotted{0};
};

enum class Heading { East, West, North, South };

const char* heading_name(Heading h);

// Dominant axis of a displacement; ties go to the horizontal axis.
// Zero displacement has no heading.
std::optional<Heading> classify_heading(int dx, int dy);

struct MovementDescription {
  std::string name;
  GameClock seconds_ago{};
  Vec2i last_pos{};
  std::optional<Heading> heading; // set when >= 2 samples and it moved
  int times_spotted{0};

  // "Axe: last seen 4 seconds ago at (100, -250)"
  std::string text() const;
};

struct Prediction {
  std::string name;
  Vec2i pos{};
};

// Per-entity position history for opposing heroes seen on the minimap.
// Not thread-safe; Coach serializes access.
class EntityPositionTracker {
public:
  // Append hostile hero positions from s. No-op if s is not newer than the
  // last processed snapshot.
  void update(const Snapshot& s);

  // Entities seen within the last 60 s of now, most recent first.
  std::vector<MovementDescription> describe_recent(GameClock now) const;

  // Linear extrapolation for entities seen within the last 30 s of now.
  std::vector<Prediction> predict(GameClock now) const;

  const std::map<std::string, TrackedEntity>& entities() const { return entities_; }
  std::optional<GameClock> last_clock() const { return last_clock_; }

private:
  std::map<std::string, TrackedEntity> entities_;
  std::optional<GameClock> last_clock_;
};

} // namespace gscoach
