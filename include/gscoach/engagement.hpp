#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <gscoach/snapshot.hpp>

namespace gscoach {

// Engagement classifier thresholds (seconds / event counts).
inline constexpr GameClock kEngageQuietS    = 15; // no event for this long ends a fight
inline constexpr GameClock kEngageWindowS   = 30;
inline constexpr int       kEngageMinEvents = 3;
inline constexpr GameClock kSkirmishWindowS = 60;
inline constexpr int       kSkirmishMinEvents = 2;
// Upper bound on events emitted for one victim counter in a single step.
inline constexpr int       kMaxEventsPerCounterStep = 10;

enum class EventKind { LocalDeath, Elimination };

struct KillEvent {
  GameClock clock{};
  EventKind kind{EventKind::Elimination};
  std::string subject; // who scored ("" when unknown)
  std::string victim;
};

enum class EngagementState { Calm, Engaged };

// Advisory produced by status_at().
struct EngagementStatus {
  enum class Level { Engaged, Skirmish };
  Level level{Level::Skirmish};
  GameClock elapsed_s{0};  // Engaged only: seconds since the fight started
  int recent_events{0};    // events inside the window that triggered the advisory

  std::string text() const;
};

struct DeathSummary {
  int count{0};
  std::optional<GameClock> last_death;
};

// "victimid_4" -> "Enemy4"
std::string victim_name_from_id(const std::string& victim_id);

// Diffs consecutive snapshots into kill/death events and tracks whether a
// fight is in progress. Not thread-safe; Coach serializes access.
class EngagementDetector {
public:
  // Diff current against previous (may be null on the first snapshot).
  // Returns the number of events emitted by this step.
  std::size_t update(const Snapshot& current, const Snapshot* previous);

  std::optional<EngagementStatus> status_at(GameClock now) const;

  // Events with clock >= now - window.
  int count_events_in_window(GameClock now, GameClock window) const;

  EngagementState state() const { return state_; }
  GameClock engaged_since() const { return engaged_since_; }
  std::optional<GameClock> last_event_clock() const { return last_event_; }

  const std::vector<GameClock>& local_deaths() const { return local_deaths_; }
  const std::map<std::string, std::vector<GameClock>>& eliminations() const { return eliminations_; }
  const std::vector<KillEvent>& events() const { return events_; }
  std::size_t event_count() const { return events_.size(); }

  DeathSummary death_summary() const;

private:
  void emit_(KillEvent e);
  void step_state_(GameClock now);

  std::vector<GameClock> local_deaths_;
  std::map<std::string, std::vector<GameClock>> eliminations_;
  std::vector<KillEvent> events_; // chronological log of both kinds

  std::optional<GameClock> last_event_;
  EngagementState state_{EngagementState::Calm};
  GameClock engaged_since_{0};
};

} // namespace gscoach
