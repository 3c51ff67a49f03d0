#include <gscoach/insights.hpp>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace gscoach {

Phase phase_at(GameClock clock) {
  const int minutes = clock / 60;
  if (minutes < 10) return Phase::Early;
  if (minutes < 25) return Phase::Mid;
  return Phase::Late;
}

const char* phase_name(Phase p) {
  switch (p) {
    case Phase::Early: return "Early Game Phase";
    case Phase::Mid:   return "Mid Game Phase";
    case Phase::Late:  return "Late Game Phase";
  }
  return "";
}

DistanceBand distance_band(double units) {
  if (units < 1000.0) return DistanceBand::VeryClose;
  if (units < 2000.0) return DistanceBand::Nearby;
  if (units < 4000.0) return DistanceBand::Medium;
  return DistanceBand::Far;
}

const char* distance_band_text(DistanceBand b) {
  switch (b) {
    case DistanceBand::VeryClose: return "VERY CLOSE!";
    case DistanceBand::Nearby:    return "Nearby";
    case DistanceBand::Medium:    return "Medium distance";
    case DistanceBand::Far:       return "Far away";
  }
  return "";
}

int readiness_score(const Snapshot& s) {
  int score = 0;

  if (s.hero) {
    if (const auto hp = s.hero->health_percent) {
      if (*hp > 80)      score += 2;
      else if (*hp > 50) score += 1;
      else               score -= 1;
    }
    if (const auto mp = s.hero->mana_percent) {
      if (*mp > 70)      score += 2;
      else if (*mp > 40) score += 1;
      else               score -= 1;
    }
  }

  if (s.abilities) {
    const auto& abilities = *s.abilities;
    const bool ultimate_ready = std::any_of(abilities.begin(), abilities.end(), [](const Ability& a){
      return a.ultimate.value_or(false) && a.can_cast.value_or(false);
    });
    if (ultimate_ready) score += 2;

    // Abilities with unknown passivity are left out.
    const bool actives_ready = std::all_of(abilities.begin(), abilities.end(), [](const Ability& a){
      return a.passive.value_or(true) || a.can_cast.value_or(false);
    });
    if (actives_ready) score += 1;
  }

  return score;
}

Readiness readiness_tier(int score) {
  if (score >= 4) return Readiness::Excellent;
  if (score >= 2) return Readiness::Good;
  if (score >= 0) return Readiness::Caution;
  return Readiness::NotReady;
}

const char* readiness_text(Readiness r) {
  switch (r) {
    case Readiness::Excellent: return "Excellent! All systems ready for team fight.";
    case Readiness::Good:      return "Good. Most resources available.";
    case Readiness::Caution:   return "Caution advised. Limited resources.";
    case Readiness::NotReady:  return "Not ready for team fight. Consider retreating.";
  }
  return "";
}

std::optional<std::string> item_suggestion(int gold) {
  if (gold >= 4000) return "You have sufficient gold for major items (BKB, Blink, etc.)";
  if (gold >= 2000) return "You have gold for mid-tier items (Force Staff, Eul's, etc.)";
  if (gold >= 1000) return "Consider purchasing support/utility items";
  return std::nullopt;
}

std::vector<std::string> item_timing_lines(const Snapshot& s, const BenchmarkCatalog& bench) {
  std::vector<std::string> out;
  if (!s.player || !s.player->net_worth) return out;

  const int minutes = s.clock() / 60;
  const int net_worth = *s.player->net_worth;

  const NetWorthBenchmark* current = nullptr;
  const NetWorthBenchmark* next = nullptr;
  for (const auto& b : bench.net_worth) {
    if (b.minute <= minutes) current = &b;
    else if (!next) next = &b;
  }
  if (!current) return out;

  out.emplace_back("Item Timing Analysis:");
  std::ostringstream os;
  const int diff = net_worth - current->net_worth;
  if (diff >= 1000)       os << "  You're ahead of item timings! +" << diff << " gold";
  else if (diff >= -1000) os << "  You're on track with item timings";
  else                    os << "  You're behind on item timings: " << diff << " gold";
  out.push_back(os.str());

  os.str("");
  os << "  Current benchmark (" << current->minute << " min): " << current->items;
  out.push_back(os.str());

  if (next) {
    os.str("");
    os << "  Next goal (" << next->minute << " min): " << next->items;
    out.push_back(os.str());

    const int time_left = next->minute - minutes; // > 0 by construction
    const int gold_needed = next->net_worth - net_worth;
    if (gold_needed > 0) {
      os.str("");
      os << "  Need " << gold_needed << " gold in " << time_left << " minutes ("
         << gold_needed / time_left << " GPM)";
      out.push_back(os.str());
    }
  }
  return out;
}

static int count_towers(const std::map<std::string, Building>& team_buildings) {
  return static_cast<int>(std::count_if(team_buildings.begin(), team_buildings.end(), [](const auto& kv){
    return kv.first.find("tower") != std::string::npos;
  }));
}

std::vector<std::string> map_control_lines(const Snapshot& s) {
  std::vector<std::string> out;
  const Team team = s.team();
  if (!s.buildings || team == Team::Unknown) return out;

  const Team enemy = (team == Team::Radiant) ? Team::Dire : Team::Radiant;
  auto towers_of = [&](Team t){
    auto it = s.buildings->find(team_key(t));
    return it == s.buildings->end() ? 0 : count_towers(it->second);
  };
  const int ours = towers_of(team);
  const int theirs = towers_of(enemy);
  const int diff = ours - theirs;

  out.emplace_back("Map Control:");
  std::ostringstream os;
  os << "  Your team has " << ours << " towers, enemy has " << theirs << " towers";
  out.push_back(os.str());

  if (diff >= 3)       out.emplace_back("  Strong map control advantage. Consider aggressive warding.");
  else if (diff >= 1)  out.emplace_back("  Slight map control advantage. Maintain pressure.");
  else if (diff == 0)  out.emplace_back("  Even map control. Focus on objectives.");
  else if (diff >= -2) out.emplace_back("  Losing map control. Defend remaining towers.");
  else                 out.emplace_back("  Significant map control disadvantage. Play defensively.");

  if (diff < 0)      out.emplace_back("  Tip: When behind in towers, focus on smoke ganks and pick-offs.");
  else if (diff > 0) out.emplace_back("  Tip: Use your map control to secure Roshan and invade jungle.");
  return out;
}

static void append_tracking_(const InsightInputs& in, const std::optional<Vec2i>& me,
                             std::vector<std::string>& out) {
  char buf[160];
  if (!in.movements.empty()) {
    out.emplace_back("Enemy Movement Patterns:");
    for (const auto& m : in.movements) {
      out.push_back("  " + m.text());
      if (m.heading) out.push_back(std::string("    Moving ") + heading_name(*m.heading));
      out.push_back("    Times spotted: " + std::to_string(m.times_spotted));
      if (me) {
        const double d = distance(*me, m.last_pos);
        std::snprintf(buf, sizeof(buf), "    Distance from you: %s (%.0f units)",
                      distance_band_text(distance_band(d)), d);
        out.emplace_back(buf);
      }
    }
  }

  if (!in.predictions.empty()) {
    out.emplace_back("Enemy Movement Predictions:");
    for (const auto& p : in.predictions) {
      std::snprintf(buf, sizeof(buf), "  %s likely at (%d, %d)", p.name.c_str(), p.pos.x, p.pos.y);
      out.emplace_back(buf);
      if (me && distance(*me, p.pos) < kProximityWarnRadius) {
        out.push_back("    WARNING: " + p.name + " may be very close to you!");
      }
    }
  }
}

static void append_deaths_(const DeathSummary& d, GameClock now, std::vector<std::string>& out) {
  if (d.count == 0) {
    out.emplace_back("Deaths: 0 - Excellent survival!");
    return;
  }
  out.push_back("Deaths: " + std::to_string(d.count));
  const int minutes = now / 60;
  if (minutes > 0 && double(d.count) / double(minutes) > 0.2) {
    out.emplace_back("  High death rate, play more cautiously");
  }
  if (d.last_death) {
    const GameClock since = now - *d.last_death;
    if (since > 300) {
      out.push_back("  Good survival streak: " + std::to_string(since / 60) + " minutes without dying");
    }
  }
}

static void append_early_(const Snapshot& s, std::vector<std::string>& out) {
  const GameClock t = s.clock();
  const int minutes = t / 60;
  const int seconds = t % 60;

  if (s.player && s.player->last_hits && minutes > 0) {
    const int lh = *s.player->last_hits;
    const int expected = minutes * 10;
    if (lh < expected / 2) {
      out.push_back("  Your last hits are low (" + std::to_string(lh) + "). Focus more on last hitting.");
    } else if (lh >= expected) {
      out.push_back("  Good job on last hitting! You have " + std::to_string(lh) + " CS.");
    }
  }
  if (seconds >= 45 && seconds <= 48) out.emplace_back("  Stack camps now! Pull at X:53.");
  if (minutes > 0 && minutes % 2 == 0 && seconds >= 55) out.emplace_back("  Water runes spawning in a few seconds!");
}

static void append_mid_(const InsightInputs& in, const std::optional<Vec2i>& me,
                        std::vector<std::string>& out) {
  const Snapshot& s = in.current;
  if (s.player && s.player->gold) {
    if (auto hint = item_suggestion(*s.player->gold)) out.push_back("  " + *hint);
  }
  if (me) {
    for (const auto& m : in.movements) {
      if (m.seconds_ago < kRecentSightingS && distance(*me, m.last_pos) < kProximityWarnRadius) {
        out.push_back("  " + m.name + " was recently spotted nearby - be careful!");
      }
    }
  }
  if (s.clock() / 60 >= 10) {
    out.emplace_back("  Roshan is available. Consider checking/taking with team coordination.");
  }
}

static void append_late_(const Snapshot& s, std::vector<std::string>& out) {
  if (s.hero && s.hero->buyback_cost && s.player && s.player->gold) {
    const int cost = *s.hero->buyback_cost;
    const int gold = *s.player->gold;
    if (gold < cost) {
      out.push_back("  You don't have buyback gold! Need " + std::to_string(cost - gold) + " more gold.");
    } else {
      out.push_back("  You have buyback available (" + std::to_string(cost) + " gold).");
    }
    if (s.hero->buyback_cooldown && *s.hero->buyback_cooldown > 0) {
      out.push_back("  Buyback on cooldown for " + std::to_string(*s.hero->buyback_cooldown) + "s");
    }
  }
  const int score = readiness_score(s);
  out.push_back(std::string("  Team fight readiness: ") + readiness_text(readiness_tier(score)) +
                " (score " + std::to_string(score) + ")");
}

std::vector<std::string> compose_insights(const InsightInputs& in, const BenchmarkCatalog& bench) {
  std::vector<std::string> out;
  const Snapshot& s = in.current;
  const GameClock now = s.clock();
  const std::optional<Vec2i> me = s.hero ? s.hero->position() : std::nullopt;

  if (in.engagement) out.push_back(in.engagement->text());

  append_tracking_(in, me, out);

  out.emplace_back("Hero Performance Metrics:");
  for (auto& line : in.metrics.lines()) out.push_back("  " + line);
  append_deaths_(in.deaths, now, out);

  const Phase phase = phase_at(now);
  out.push_back(std::string(phase_name(phase)) + ":");
  switch (phase) {
    case Phase::Early: append_early_(s, out); break;
    case Phase::Mid:   append_mid_(in, me, out); break;
    case Phase::Late:  append_late_(s, out); break;
  }

  for (auto& line : item_timing_lines(s, bench)) out.push_back(std::move(line));
  for (auto& line : map_control_lines(s)) out.push_back(std::move(line));
  return out;
}

} // namespace gscoach
