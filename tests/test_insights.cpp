#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include <gscoach/insights.hpp>

using namespace gscoach;

static bool has_line(const std::vector<std::string>& lines, const std::string& want) {
  return std::find(lines.begin(), lines.end(), want) != lines.end();
}

static Snapshot local_at(GameClock t) {
  Snapshot s;
  s.game_time = t;
  s.player = PlayerState{};
  s.player->team = Team::Radiant;
  s.hero = HeroState{};
  s.hero->name = "npc_dota_hero_sniper";
  s.hero->xpos = 0;
  s.hero->ypos = 0;
  return s;
}

static Ability ability(bool can_cast, bool passive, bool ultimate) {
  Ability a;
  a.name = "x";
  a.can_cast = can_cast;
  a.passive = passive;
  a.ultimate = ultimate;
  return a;
}

TEST_CASE("Phase boundaries") {
  REQUIRE(phase_at(0) == Phase::Early);
  REQUIRE(phase_at(599) == Phase::Early);
  REQUIRE(phase_at(600) == Phase::Mid);
  REQUIRE(phase_at(1499) == Phase::Mid);
  REQUIRE(phase_at(1500) == Phase::Late);
}

TEST_CASE("Distance bands") {
  REQUIRE(distance_band(999.0) == DistanceBand::VeryClose);
  REQUIRE(distance_band(1000.0) == DistanceBand::Nearby);
  REQUIRE(distance_band(1999.0) == DistanceBand::Nearby);
  REQUIRE(distance_band(3999.0) == DistanceBand::Medium);
  REQUIRE(distance_band(4000.0) == DistanceBand::Far);
}

TEST_CASE("Readiness score combines health, mana and abilities") {
  auto s = local_at(1800);
  s.hero->health_percent = 90;
  s.hero->mana_percent = 90;
  s.abilities = std::vector<Ability>{ability(true, false, false), ability(true, false, true),
                                     ability(false, true, false)};
  REQUIRE(readiness_score(s) == 7);
  REQUIRE(readiness_tier(7) == Readiness::Excellent);

  s.hero->health_percent = 40;
  s.hero->mana_percent = 20;
  s.abilities.reset();
  REQUIRE(readiness_score(s) == -2);
  REQUIRE(readiness_tier(-2) == Readiness::NotReady);

  REQUIRE(readiness_tier(2) == Readiness::Good);
  REQUIRE(readiness_tier(0) == Readiness::Caution);
}

TEST_CASE("Item suggestions by gold") {
  REQUIRE(item_suggestion(999) == std::nullopt);
  REQUIRE(item_suggestion(1000) == std::string("Consider purchasing support/utility items"));
  REQUIRE(item_suggestion(2000)->find("mid-tier") != std::string::npos);
  REQUIRE(item_suggestion(4000)->find("major items") != std::string::npos);
}

TEST_CASE("Item timing compares net worth with the benchmark table") {
  const auto& bench = benchmark_catalog();

  auto ahead = local_at(720);
  ahead.player->net_worth = 5500;
  auto lines = item_timing_lines(ahead, bench);
  REQUIRE(lines == std::vector<std::string>{
    "Item Timing Analysis:",
    "  You're ahead of item timings! +1500 gold",
    "  Current benchmark (10 min): Power Treads + Wraith Bands",
    "  Next goal (15 min): Core farming item (Battlefury/Maelstrom)",
    "  Need 1500 gold in 3 minutes (500 GPM)",
  });

  auto behind = local_at(1200);
  behind.player->net_worth = 9000;
  lines = item_timing_lines(behind, bench);
  REQUIRE(lines[1] == "  You're behind on item timings: -2000 gold");
  REQUIRE(lines.back() == "  Need 9000 gold in 10 minutes (900 GPM)");

  auto past = local_at(1860);
  past.player->net_worth = 20000;
  lines = item_timing_lines(past, bench);
  REQUIRE(lines.size() == 3);
  REQUIRE(lines[1] == "  You're ahead of item timings! +2000 gold");

  auto early = local_at(300);
  early.player->net_worth = 2000;
  REQUIRE(item_timing_lines(early, bench).empty());
}

TEST_CASE("Map control counts standing towers per team") {
  auto s = local_at(900);
  s.buildings = std::map<std::string, std::map<std::string, Building>>{
    {"radiant", {{"dota_goodguys_tower1_top", {1000, 1800}},
                 {"dota_goodguys_tower2_top", {1800, 1800}},
                 {"dota_goodguys_tower1_mid", {200, 1800}},
                 {"good_rax_melee_top", {2200, 2200}}}},
    {"dire",    {{"dota_badguys_tower1_top", {1800, 1800}}}},
  };
  auto lines = map_control_lines(s);
  REQUIRE(lines == std::vector<std::string>{
    "Map Control:",
    "  Your team has 3 towers, enemy has 1 towers",
    "  Slight map control advantage. Maintain pressure.",
    "  Tip: Use your map control to secure Roshan and invade jungle.",
  });

  s.player->team = Team::Dire;
  lines = map_control_lines(s);
  REQUIRE(lines[2] == "  Losing map control. Defend remaining towers.");

  s.player->team = Team::Unknown;
  REQUIRE(map_control_lines(s).empty());
}

TEST_CASE("Early game advisory list is ordered") {
  InsightInputs in;
  in.current = local_at(5 * 60 + 46);
  in.current.player->last_hits = 20;

  EngagementStatus st{};
  st.level = EngagementStatus::Level::Skirmish;
  st.recent_events = 2;
  in.engagement = st;

  MovementDescription m{};
  m.name = "Axe";
  m.seconds_ago = 2;
  m.last_pos = {500, 0};
  m.heading = Heading::East;
  m.times_spotted = 4;
  in.movements.push_back(m);
  in.predictions.push_back(Prediction{"Axe", {700, 0}});

  auto lines = compose_insights(in, benchmark_catalog());
  REQUIRE(lines == std::vector<std::string>{
    "Skirmishes detected (2 kills in the last minute) - team fight may be developing!",
    "Enemy Movement Patterns:",
    "  Axe: last seen 2 seconds ago at (500, 0)",
    "    Moving East",
    "    Times spotted: 4",
    "    Distance from you: VERY CLOSE! (500 units)",
    "Enemy Movement Predictions:",
    "  Axe likely at (700, 0)",
    "    WARNING: Axe may be very close to you!",
    "Hero Performance Metrics:",
    "Deaths: 0 - Excellent survival!",
    "Early Game Phase:",
    "  Your last hits are low (20). Focus more on last hitting.",
    "  Stack camps now! Pull at X:53.",
  });
}

TEST_CASE("Proximity warning stops at 2000 units") {
  InsightInputs in;
  in.current = local_at(3 * 60);

  in.predictions = {Prediction{"Axe", {2000, 0}}};
  auto far = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(far, "  Axe likely at (2000, 0)"));
  REQUIRE_FALSE(has_line(far, "    WARNING: Axe may be very close to you!"));

  in.predictions = {Prediction{"Axe", {1999, 0}}};
  auto near = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(near, "    WARNING: Axe may be very close to you!"));
}

TEST_CASE("Movement lines always report times spotted") {
  InsightInputs in;
  in.current = local_at(3 * 60);
  MovementDescription m{};
  m.name = "Lina";
  m.seconds_ago = 10;
  m.last_pos = {4000, 0};
  m.times_spotted = 1;
  in.movements.push_back(m);

  auto lines = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(lines, "    Times spotted: 1"));
  REQUIRE_FALSE(has_line(lines, "    Moving East"));
}

TEST_CASE("Rune reminder on even minutes") {
  InsightInputs in;
  in.current = local_at(4 * 60 + 56);
  auto lines = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(lines, "  Water runes spawning in a few seconds!"));

  in.current = local_at(3 * 60 + 56);
  lines = compose_insights(in, benchmark_catalog());
  REQUIRE_FALSE(has_line(lines, "  Water runes spawning in a few seconds!"));
}

TEST_CASE("Mid game advice uses gold, recent sightings and Roshan") {
  InsightInputs in;
  in.current = local_at(12 * 60);
  in.current.player->gold = 2500;

  MovementDescription m{};
  m.name = "Bounty Hunter";
  m.seconds_ago = 10;
  m.last_pos = {1500, 0};
  in.movements.push_back(m);

  in.deaths.count = 4;
  in.deaths.last_death = 100;

  auto lines = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(lines, "Mid Game Phase:"));
  REQUIRE(has_line(lines, "  You have gold for mid-tier items (Force Staff, Eul's, etc.)"));
  REQUIRE(has_line(lines, "  Bounty Hunter was recently spotted nearby - be careful!"));
  REQUIRE(has_line(lines, "  Roshan is available. Consider checking/taking with team coordination."));
  REQUIRE(has_line(lines, "    Distance from you: Nearby (1500 units)"));
  REQUIRE(has_line(lines, "Deaths: 4"));
  REQUIRE(has_line(lines, "  High death rate, play more cautiously"));
  REQUIRE(has_line(lines, "  Good survival streak: 10 minutes without dying"));
  REQUIRE_FALSE(has_line(lines, "Enemy Movement Predictions:"));
}

TEST_CASE("Late game advice covers buyback and readiness") {
  InsightInputs in;
  in.current = local_at(30 * 60);
  in.current.player->gold = 1500;
  in.current.hero->buyback_cost = 2000;
  in.current.hero->buyback_cooldown = 0;
  in.current.hero->health_percent = 90;
  in.current.hero->mana_percent = 30;
  in.current.abilities = std::vector<Ability>{ability(true, false, true), ability(false, false, false)};

  auto lines = compose_insights(in, benchmark_catalog());
  REQUIRE(has_line(lines, "Late Game Phase:"));
  REQUIRE(has_line(lines, "  You don't have buyback gold! Need 500 more gold."));
  REQUIRE(has_line(lines, "  Team fight readiness: Good. Most resources available. (score 3)"));
  REQUIRE_FALSE(has_line(lines, "Enemy Movement Patterns:"));
}
