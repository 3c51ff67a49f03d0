#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gscoach {

// Game clock in whole seconds of match time.
using GameClock = int;

struct Vec2i {
  int x{};
  int y{};
};

inline bool operator==(const Vec2i& a, const Vec2i& b) { return a.x == b.x && a.y == b.y; }

double distance(const Vec2i& a, const Vec2i& b);

enum class Team : int {
  Unknown = 0,
  Radiant = 2,
  Dire = 3,
};

// Minimap marker classification. Only HostileHero markers are tracked.
enum class MarkerKind : int {
  Other = 0,
  HostileHero,
};

MarkerKind marker_kind_from_image(const std::string& image);

// One minimap marker as seen in a single snapshot.
struct VisibleEntity {
  std::optional<std::string> name; // raw unit name, e.g. "npc_dota_hero_axe"
  int team{};                      // numeric team id (2 radiant, 3 dire)
  Vec2i pos{};
  MarkerKind kind{MarkerKind::Other};
};

struct PlayerState {
  Team team{Team::Unknown};
  std::optional<int> gold;
  std::optional<int> net_worth;
  std::optional<int> gpm;
  std::optional<int> xpm;
  std::optional<int> last_hits;
  std::optional<int> denies;
  std::optional<int> kills;
  std::optional<int> deaths;
  // Elimination counters keyed by victim id ("victimid_4" -> 2).
  std::optional<std::map<std::string, int>> kill_list;
};

struct HeroState {
  std::optional<std::string> name;
  std::optional<int> level;
  std::optional<bool> alive;
  std::optional<int> respawn_seconds;
  std::optional<int> buyback_cost;
  std::optional<int> buyback_cooldown;
  std::optional<int> health_percent;
  std::optional<int> mana_percent;
  std::optional<int> xpos;
  std::optional<int> ypos;

  std::optional<Vec2i> position() const {
    if (!xpos || !ypos) return std::nullopt;
    return Vec2i{*xpos, *ypos};
  }
};

struct Ability {
  std::string name;
  std::optional<int> level;
  std::optional<bool> can_cast;
  std::optional<bool> passive;
  std::optional<bool> ultimate;
};

struct Building {
  int health{};
  int max_health{};
};

// Single immutable sample of match state as delivered by the game client.
// Every field the client may omit is optional; absence means "unknown".
struct Snapshot {
  std::optional<GameClock> game_time;
  std::optional<std::string> game_state; // e.g. "DOTA_GAMERULES_STATE_GAME_IN_PROGRESS"
  std::optional<bool> daytime;

  std::optional<PlayerState> player;
  std::optional<HeroState> hero;
  std::optional<std::vector<Ability>> abilities;

  // Minimap markers keyed by the client's marker slot ("o12").
  std::map<std::string, VisibleEntity> minimap;

  // Buildings keyed by team ("radiant"/"dire") then building name.
  std::optional<std::map<std::string, std::map<std::string, Building>>> buildings;

  GameClock clock() const { return game_time.value_or(0); }
  Team team() const { return player ? player->team : Team::Unknown; }
};

// Numeric team id of the opposing side; unknown local team treats dire (3) as hostile.
int opposing_team_id(Team local);

Team team_from_name(const std::string& name);
const char* team_key(Team t); // "radiant" / "dire" / "unknown"

// "npc_dota_hero_bounty_hunter" -> "Bounty Hunter"
std::string format_hero_name(const std::string& raw);

// 125 -> "2:05"; nullopt -> "Unknown"
std::string format_game_time(std::optional<GameClock> seconds);

} // namespace gscoach
