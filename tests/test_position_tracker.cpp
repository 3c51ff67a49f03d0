#include <catch2/catch_test_macros.hpp>
#include <string>
#include <gscoach/position_tracker.hpp>

using namespace gscoach;

static Snapshot radiant_at(GameClock t) {
  Snapshot s;
  s.game_time = t;
  s.player = PlayerState{};
  s.player->team = Team::Radiant;
  return s;
}

static void add_marker(Snapshot& s, const std::string& slot, const std::string& unit,
                       int team, Vec2i pos, MarkerKind kind = MarkerKind::HostileHero) {
  VisibleEntity e;
  e.name = unit;
  e.team = team;
  e.pos = pos;
  e.kind = kind;
  s.minimap[slot] = e;
}

TEST_CASE("Only hostile hero markers of the opposing team are tracked") {
  EntityPositionTracker tr;
  auto s = radiant_at(100);
  add_marker(s, "o1", "npc_dota_hero_axe", 3, {100, 200});
  add_marker(s, "o2", "npc_dota_hero_lina", 2, {0, 0});                       // own team
  add_marker(s, "o3", "npc_dota_creep_badguys_melee", 3, {5, 5}, MarkerKind::Other);
  tr.update(s);

  REQUIRE(tr.entities().size() == 1);
  REQUIRE(tr.entities().count("Axe") == 1);
  REQUIRE(tr.entities().at("Axe").history.back().pos == Vec2i{100, 200});
}

TEST_CASE("Unknown local team treats team 3 as hostile") {
  EntityPositionTracker tr;
  Snapshot s;
  s.game_time = 10;
  add_marker(s, "o1", "npc_dota_hero_axe", 3, {1, 1});
  add_marker(s, "o2", "npc_dota_hero_lina", 2, {2, 2});
  tr.update(s);
  REQUIRE(tr.entities().size() == 1);
  REQUIRE(tr.entities().count("Axe") == 1);
}

TEST_CASE("A hero under two marker slots is recorded once per snapshot") {
  EntityPositionTracker tr;
  auto s = radiant_at(50);
  add_marker(s, "o1", "npc_dota_hero_axe", 3, {1, 1});
  add_marker(s, "o7", "npc_dota_hero_axe", 3, {1, 1});
  tr.update(s);
  REQUIRE(tr.entities().at("Axe").history.size() == 1);
  REQUIRE(tr.entities().at("Axe").times_spotted == 1);
}

TEST_CASE("History is capped at 100 with non-decreasing clocks") {
  EntityPositionTracker tr;
  for (int t = 1; t <= 150; ++t) {
    auto s = radiant_at(t);
    add_marker(s, "o1", "npc_dota_hero_axe", 3, {t, 0});
    tr.update(s);
  }
  const auto& h = tr.entities().at("Axe").history;
  REQUIRE(h.size() == kPositionHistoryCap);
  REQUIRE(h.front().clock == 51);
  REQUIRE(h.back().clock == 150);
  for (std::size_t i = 1; i < h.size(); ++i) REQUIRE(h[i - 1].clock <= h[i].clock);
  REQUIRE(tr.entities().at("Axe").times_spotted == 150);
}

TEST_CASE("Replaying an old or equal clock leaves histories unchanged") {
  EntityPositionTracker tr;
  auto s1 = radiant_at(100);
  add_marker(s1, "o1", "npc_dota_hero_axe", 3, {0, 0});
  tr.update(s1);

  auto stale = radiant_at(90);
  add_marker(stale, "o1", "npc_dota_hero_axe", 3, {500, 500});
  add_marker(stale, "o2", "npc_dota_hero_lion", 3, {500, 500});
  tr.update(stale);
  tr.update(s1);

  REQUIRE(tr.entities().size() == 1);
  REQUIRE(tr.entities().at("Axe").history.size() == 1);
  REQUIRE(tr.last_clock() == 100);
}

TEST_CASE("predict extrapolates linearly from the last two samples") {
  EntityPositionTracker tr;
  const GameClock t0 = 100, t1 = 105;
  auto s0 = radiant_at(t0);
  add_marker(s0, "o1", "npc_dota_hero_axe", 3, {0, 0});
  tr.update(s0);
  auto s1 = radiant_at(t1);
  add_marker(s1, "o1", "npc_dota_hero_axe", 3, {10, 0});
  tr.update(s1);

  auto preds = tr.predict(t1 + (t1 - t0));
  REQUIRE(preds.size() == 1);
  REQUIRE(preds[0].name == "Axe");
  REQUIRE(preds[0].pos == Vec2i{20, 0});

  // Too old to predict, and a single sample never predicts.
  REQUIRE(tr.predict(t1 + kPredictWindowS + 1).empty());
  REQUIRE(tr.predict(t1 - 1).empty());
}

TEST_CASE("describe_recent filters by age and sorts most recent first") {
  EntityPositionTracker tr;
  auto s0 = radiant_at(100);
  add_marker(s0, "o1", "npc_dota_hero_axe", 3, {0, 0});
  tr.update(s0);
  auto s1 = radiant_at(120);
  add_marker(s1, "o2", "npc_dota_hero_bounty_hunter", 3, {300, -50});
  add_marker(s1, "o1", "npc_dota_hero_axe", 3, {0, 40});
  tr.update(s1);
  auto s2 = radiant_at(130);
  add_marker(s2, "o1", "npc_dota_hero_axe", 3, {-90, 40});
  tr.update(s2);

  auto d = tr.describe_recent(140);
  REQUIRE(d.size() == 2);
  REQUIRE(d[0].name == "Axe");
  REQUIRE(d[0].seconds_ago == 10);
  REQUIRE(d[0].heading == Heading::West);
  REQUIRE(d[0].times_spotted == 3);
  REQUIRE(d[1].name == "Bounty Hunter");
  REQUIRE_FALSE(d[1].heading.has_value());
  REQUIRE(d[1].text() == "Bounty Hunter: last seen 20 seconds ago at (300, -50)");

  // Bounty Hunter last seen at 120 drops out after 60 s.
  REQUIRE(tr.describe_recent(181).size() == 1);
}

TEST_CASE("classify_heading picks the dominant axis") {
  REQUIRE(classify_heading(10, 3) == Heading::East);
  REQUIRE(classify_heading(-10, 3) == Heading::West);
  REQUIRE(classify_heading(1, 5) == Heading::North);
  REQUIRE(classify_heading(1, -5) == Heading::South);
  REQUIRE(classify_heading(4, 4) == Heading::East);
  REQUIRE_FALSE(classify_heading(0, 0).has_value());
}
