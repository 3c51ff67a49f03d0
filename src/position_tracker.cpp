#include <gscoach/position_tracker.hpp>
#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>
#include <utility>

namespace gscoach {

const char* heading_name(Heading h) {
  switch (h) {
    case Heading::East:  return "East";
    case Heading::West:  return "West";
    case Heading::North: return "North";
    case Heading::South: return "South";
  }
  return "Unknown";
}

std::optional<Heading> classify_heading(int dx, int dy) {
  if (dx == 0 && dy == 0) return std::nullopt;
  if (std::abs(dx) >= std::abs(dy)) return dx > 0 ? Heading::East : Heading::West;
  return dy > 0 ? Heading::North : Heading::South;
}

std::string MovementDescription::text() const {
  std::ostringstream os;
  os << name << ": last seen " << seconds_ago << " seconds ago at ("
     << last_pos.x << ", " << last_pos.y << ")";
  return os.str();
}

void EntityPositionTracker::update(const Snapshot& s) {
  const GameClock now = s.clock();
  if (last_clock_ && now <= *last_clock_) return;

  const int hostile_team = opposing_team_id(s.team());

  // A hero can show up under more than one marker slot; record it once.
  std::set<std::string> seen;
  for (const auto& kv : s.minimap) {
    const VisibleEntity& e = kv.second;
    if (e.kind != MarkerKind::HostileHero || e.team != hostile_team) continue;
    if (!e.name || e.name->empty()) continue;

    const std::string name = format_hero_name(*e.name);
    if (!seen.insert(name).second) continue;

    auto& tracked = entities_[name];
    tracked.history.push(PositionSample{now, e.pos});
    ++tracked.times_spotted;
  }

  last_clock_ = now;
}

std::vector<MovementDescription> EntityPositionTracker::describe_recent(GameClock now) const {
  std::vector<MovementDescription> out;
  for (const auto& [name, tracked] : entities_) {
    const auto& h = tracked.history;
    if (h.empty()) continue;

    const auto& latest = h.back();
    const GameClock since = now - latest.clock;
    if (since < 0 || since > kDescribeWindowS) continue;

    MovementDescription d{};
    d.name = name;
    d.seconds_ago = since;
    d.last_pos = latest.pos;
    d.times_spotted = tracked.times_spotted;
    if (h.size() >= 2) {
      const auto& prev = h[h.size() - 2];
      d.heading = classify_heading(latest.pos.x - prev.pos.x, latest.pos.y - prev.pos.y);
    }
    out.push_back(std::move(d));
  }

  std::stable_sort(out.begin(), out.end(), [](const MovementDescription& a, const MovementDescription& b){
    return a.seconds_ago < b.seconds_ago;
  });
  return out;
}

std::vector<Prediction> EntityPositionTracker::predict(GameClock now) const {
  std::vector<Prediction> out;
  for (const auto& [name, tracked] : entities_) {
    const auto& h = tracked.history;
    if (h.size() < 2) continue;

    const auto& latest = h.back();
    const auto& prev   = h[h.size() - 2];

    const GameClock since = now - latest.clock;
    if (since < 0 || since > kPredictWindowS) continue;

    const GameClock dt = latest.clock - prev.clock;
    if (dt <= 0) continue;

    const double factor = double(since) / double(dt);
    const int dx = latest.pos.x - prev.pos.x;
    const int dy = latest.pos.y - prev.pos.y;
    out.push_back(Prediction{
      name,
      Vec2i{ latest.pos.x + static_cast<int>(dx * factor),
             latest.pos.y + static_cast<int>(dy * factor) }
    });
  }
  return out;
}

} // namespace gscoach
