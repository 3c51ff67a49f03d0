#include <gscoach/snapshot.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace gscoach {

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

double distance(const Vec2i& a, const Vec2i& b) {
  const double dx = double(a.x) - double(b.x);
  const double dy = double(a.y) - double(b.y);
  return std::sqrt(dx*dx + dy*dy);
}

MarkerKind marker_kind_from_image(const std::string& image) {
  return image == "minimap_enemyicon" ? MarkerKind::HostileHero : MarkerKind::Other;
}

int opposing_team_id(Team local) {
  return local == Team::Dire ? static_cast<int>(Team::Radiant) : static_cast<int>(Team::Dire);
}

Team team_from_name(const std::string& name) {
  const auto n = lower(name);
  if (n == "radiant") return Team::Radiant;
  if (n == "dire")    return Team::Dire;
  return Team::Unknown;
}

const char* team_key(Team t) {
  switch (t) {
    case Team::Radiant: return "radiant";
    case Team::Dire:    return "dire";
    default:            return "unknown";
  }
}

std::string format_hero_name(const std::string& raw) {
  static const std::string kPrefix = "npc_dota_hero_";
  std::string name = raw;
  if (name.rfind(kPrefix, 0) == 0) name.erase(0, kPrefix.size());

  std::string out;
  out.reserve(name.size());
  bool word_start = true;
  for (char c : name) {
    if (c == '_') {
      out.push_back(' ');
      word_start = true;
      continue;
    }
    if (word_start) {
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      word_start = false;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string format_game_time(std::optional<GameClock> seconds) {
  if (!seconds) return "Unknown";
  const int s = *seconds;
  const char* sign = s < 0 ? "-" : "";
  const int a = s < 0 ? -s : s;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%d:%02d", sign, a / 60, a % 60);
  return std::string(buf);
}

} // namespace gscoach
