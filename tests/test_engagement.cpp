#include <catch2/catch_test_macros.hpp>
#include <string>
#include <gscoach/engagement.hpp>

using namespace gscoach;

static Snapshot with_kills(GameClock t, int victim4_kills, bool alive = true) {
  Snapshot s;
  s.game_time = t;
  s.player = PlayerState{};
  s.player->team = Team::Radiant;
  s.player->kill_list = std::map<std::string, int>{{"victimid_4", victim4_kills}};
  s.hero = HeroState{};
  s.hero->name = "npc_dota_hero_sniper";
  s.hero->alive = alive;
  return s;
}

TEST_CASE("Alive to dead emits exactly one death event at the later clock") {
  EngagementDetector det;
  auto a = with_kills(100, 0, true);
  auto b = with_kills(101, 0, false);
  auto c = with_kills(102, 0, false);

  REQUIRE(det.update(a, nullptr) == 0);
  REQUIRE(det.update(b, &a) == 1);
  REQUIRE(det.update(c, &b) == 0);

  REQUIRE(det.local_deaths() == std::vector<GameClock>{101});
  REQUIRE(det.events().size() == 1);
  REQUIRE(det.events()[0].kind == EventKind::LocalDeath);
  REQUIRE(det.events()[0].victim == "Sniper");
  REQUIRE(det.events()[0].subject.empty());

  auto d = det.death_summary();
  REQUIRE(d.count == 1);
  REQUIRE(d.last_death == 101);
}

TEST_CASE("Missing alive flag reads as alive") {
  EngagementDetector det;
  auto a = with_kills(10, 0);
  a.hero->alive.reset();
  auto b = with_kills(11, 0, false);
  REQUIRE(det.update(b, &a) == 1);
}

TEST_CASE("A counter jump of N emits N events at the same clock") {
  EngagementDetector det;
  auto a = with_kills(200, 1);
  auto b = with_kills(201, 4);
  REQUIRE(det.update(b, &a) == 3);
  const auto& el = det.eliminations().at("Enemy4");
  REQUIRE(el == std::vector<GameClock>{201, 201, 201});
  REQUIRE(det.events()[0].subject == "Sniper");
}

TEST_CASE("Counters that stay flat or drop emit nothing") {
  EngagementDetector det;
  auto a = with_kills(300, 2);
  auto b = with_kills(301, 2);
  auto c = with_kills(302, 1);
  REQUIRE(det.update(b, &a) == 0);
  REQUIRE(det.update(c, &b) == 0);
  REQUIRE(det.event_count() == 0);
}

TEST_CASE("Three eliminations within 20 s engage; 16 quiet seconds calm down") {
  EngagementDetector det;
  auto s0 = with_kills(100, 0);
  auto s1 = with_kills(105, 1);
  auto s2 = with_kills(115, 2);
  auto s3 = with_kills(125, 3);
  det.update(s0, nullptr);
  det.update(s1, &s0);
  det.update(s2, &s1);
  REQUIRE(det.state() == EngagementState::Calm);
  det.update(s3, &s2);
  REQUIRE(det.state() == EngagementState::Engaged);
  REQUIRE(det.engaged_since() == 125);

  auto st = det.status_at(130);
  REQUIRE(st.has_value());
  REQUIRE(st->level == EngagementStatus::Level::Engaged);
  REQUIRE(st->text() == "TEAM FIGHT IN PROGRESS! Started 5 seconds ago");

  auto s4 = with_kills(141, 3);
  det.update(s4, &s3);
  REQUIRE(det.state() == EngagementState::Calm);
}

TEST_CASE("A fight ends exactly 15 s after the last event") {
  EngagementDetector det;
  auto s0 = with_kills(100, 0);
  auto s1 = with_kills(115, 1);
  auto s2 = with_kills(120, 2);
  auto s3 = with_kills(125, 3);
  det.update(s1, &s0);
  det.update(s2, &s1);
  det.update(s3, &s2);
  REQUIRE(det.state() == EngagementState::Engaged);

  auto s4 = with_kills(139, 3);
  det.update(s4, &s3);
  REQUIRE(det.state() == EngagementState::Engaged);

  auto s5 = with_kills(140, 3);
  det.update(s5, &s4);
  REQUIRE(det.state() == EngagementState::Calm);
}

TEST_CASE("A huge counter jump emits a bounded number of events") {
  EngagementDetector det;
  auto a = with_kills(400, 0);
  auto b = with_kills(401, 2000000000);
  REQUIRE(det.update(b, &a) == static_cast<std::size_t>(kMaxEventsPerCounterStep));
  REQUIRE(det.eliminations().at("Enemy4").size() == static_cast<std::size_t>(kMaxEventsPerCounterStep));

  // The next snapshot diffs against the reported counter, not the capped count.
  auto c = with_kills(402, 2000000001);
  REQUIRE(det.update(c, &b) == 1);
}

TEST_CASE("Two events within a minute report skirmishes") {
  EngagementDetector det;
  auto s0 = with_kills(100, 0);
  auto s1 = with_kills(110, 1);
  auto s2 = with_kills(150, 2);
  det.update(s1, &s0);
  det.update(s2, &s1);
  REQUIRE(det.state() == EngagementState::Calm);

  auto st = det.status_at(160);
  REQUIRE(st.has_value());
  REQUIRE(st->level == EngagementStatus::Level::Skirmish);
  REQUIRE(st->recent_events == 2);
  REQUIRE(st->text() == "Skirmishes detected (2 kills in the last minute) - team fight may be developing!");

  REQUIRE_FALSE(det.status_at(171).has_value());
}

TEST_CASE("Out-of-order pairs are ignored") {
  EngagementDetector det;
  auto newer = with_kills(200, 0);
  auto older = with_kills(190, 5);
  REQUIRE(det.update(older, &newer) == 0);
  REQUIRE(det.count_events_in_window(200, 60) == 0);
}

TEST_CASE("victim_name_from_id") {
  REQUIRE(victim_name_from_id("victimid_4") == "Enemy4");
  REQUIRE(victim_name_from_id("7") == "Enemy7");
}
