#include <gscoach/engagement.hpp>
#include <algorithm>
#include <sstream>
#include <utility>
#include <gscoach/log.hpp>

namespace gscoach {

std::string EngagementStatus::text() const {
  std::ostringstream os;
  if (level == Level::Engaged) {
    os << "TEAM FIGHT IN PROGRESS! Started " << elapsed_s << " seconds ago";
  } else {
    os << "Skirmishes detected (" << recent_events << " kills in the last minute) - team fight may be developing!";
  }
  return os.str();
}

std::string victim_name_from_id(const std::string& victim_id) {
  static const std::string kPrefix = "victimid_";
  std::string id = victim_id;
  if (id.rfind(kPrefix, 0) == 0) id.erase(0, kPrefix.size());
  return "Enemy" + id;
}

static std::string local_name(const Snapshot& s) {
  if (s.hero && s.hero->name && !s.hero->name->empty()) return format_hero_name(*s.hero->name);
  return "You";
}

std::size_t EngagementDetector::update(const Snapshot& current, const Snapshot* previous) {
  const GameClock now = current.clock();
  // Out-of-order pair; diffing it would double count.
  if (previous && now < previous->clock()) return 0;

  const std::size_t before = events_.size();

  if (previous && current.hero && previous->hero) {
    const bool was_alive = previous->hero->alive.value_or(true);
    const bool is_alive  = current.hero->alive.value_or(true);
    if (was_alive && !is_alive) {
      emit_(KillEvent{now, EventKind::LocalDeath, "", local_name(current)});
    }
  }

  if (previous && current.player && previous->player &&
      current.player->kill_list && previous->player->kill_list) {
    const auto& cur  = *current.player->kill_list;
    const auto& last = *previous->player->kill_list;
    const std::string killer = local_name(current);
    for (const auto& [victim_id, count] : cur) {
      auto it = last.find(victim_id);
      const int last_count = (it == last.end()) ? 0 : it->second;
      if (count <= last_count) continue;
      // One event per unit of increase, all stamped with this snapshot's clock.
      int n = count - last_count;
      if (n > kMaxEventsPerCounterStep) {
        logger().warn("engagement: counter for {} jumped {} -> {} at {}; emitting {}",
                      victim_id, last_count, count, format_game_time(now), kMaxEventsPerCounterStep);
        n = kMaxEventsPerCounterStep;
      }
      for (int k = 0; k < n; ++k) {
        emit_(KillEvent{now, EventKind::Elimination, killer, victim_name_from_id(victim_id)});
      }
    }
  }

  step_state_(now);
  return events_.size() - before;
}

void EngagementDetector::emit_(KillEvent e) {
  if (e.kind == EventKind::LocalDeath) local_deaths_.push_back(e.clock);
  else eliminations_[e.victim].push_back(e.clock);
  last_event_ = e.clock;
  events_.push_back(std::move(e));
}

void EngagementDetector::step_state_(GameClock now) {
  if (!last_event_) return;
  const GameClock since = now - *last_event_;

  if (state_ == EngagementState::Calm && since < kEngageQuietS) {
    const int n = count_events_in_window(now, kEngageWindowS);
    if (n >= kEngageMinEvents) {
      state_ = EngagementState::Engaged;
      engaged_since_ = now;
      logger().debug("engagement started at {} ({} events in {}s)", format_game_time(now), n, kEngageWindowS);
    }
  } else if (state_ == EngagementState::Engaged && since >= kEngageQuietS) {
    state_ = EngagementState::Calm;
    logger().debug("engagement ended at {} after {}s", format_game_time(now), now - engaged_since_);
  }
}

int EngagementDetector::count_events_in_window(GameClock now, GameClock window) const {
  const GameClock start = now - window;
  auto in_window = [start](GameClock t){ return t >= start; };

  int n = static_cast<int>(std::count_if(local_deaths_.begin(), local_deaths_.end(), in_window));
  for (const auto& kv : eliminations_) {
    n += static_cast<int>(std::count_if(kv.second.begin(), kv.second.end(), in_window));
  }
  return n;
}

std::optional<EngagementStatus> EngagementDetector::status_at(GameClock now) const {
  if (state_ == EngagementState::Engaged) {
    EngagementStatus st{};
    st.level = EngagementStatus::Level::Engaged;
    st.elapsed_s = now - engaged_since_;
    st.recent_events = count_events_in_window(now, kEngageWindowS);
    return st;
  }
  const int n = count_events_in_window(now, kSkirmishWindowS);
  if (n >= kSkirmishMinEvents) {
    EngagementStatus st{};
    st.level = EngagementStatus::Level::Skirmish;
    st.recent_events = n;
    return st;
  }
  return std::nullopt;
}

DeathSummary EngagementDetector::death_summary() const {
  DeathSummary d{};
  d.count = static_cast<int>(local_deaths_.size());
  if (!local_deaths_.empty()) d.last_death = local_deaths_.back();
  return d;
}

} // namespace gscoach
