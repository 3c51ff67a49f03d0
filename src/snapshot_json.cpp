#include <gscoach/snapshot_json.hpp>
#include <fstream>
#include <gscoach/log.hpp>

namespace gscoach {

using nlohmann::json;

namespace {

// Absent or null -> nullopt; present with the wrong type throws type_error.
template <class T>
std::optional<T> opt_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  return it->template get<T>();
}

const json* opt_object(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return nullptr;
  (void)it->get_ref<const json::object_t&>(); // throws type_error unless an object
  return &*it;
}

PlayerState decode_player(const json& p) {
  PlayerState out;
  if (auto team = opt_field<std::string>(p, "team_name")) out.team = team_from_name(*team);
  out.gold      = opt_field<int>(p, "gold");
  out.net_worth = opt_field<int>(p, "net_worth");
  out.gpm       = opt_field<int>(p, "gpm");
  out.xpm       = opt_field<int>(p, "xpm");
  out.last_hits = opt_field<int>(p, "last_hits");
  out.denies    = opt_field<int>(p, "denies");
  out.kills     = opt_field<int>(p, "kills");
  out.deaths    = opt_field<int>(p, "deaths");
  out.kill_list = opt_field<std::map<std::string, int>>(p, "kill_list");
  return out;
}

HeroState decode_hero(const json& h) {
  HeroState out;
  out.name             = opt_field<std::string>(h, "name");
  out.level            = opt_field<int>(h, "level");
  out.alive            = opt_field<bool>(h, "alive");
  out.respawn_seconds  = opt_field<int>(h, "respawn_seconds");
  out.buyback_cost     = opt_field<int>(h, "buyback_cost");
  out.buyback_cooldown = opt_field<int>(h, "buyback_cooldown");
  out.health_percent   = opt_field<int>(h, "health_percent");
  out.mana_percent     = opt_field<int>(h, "mana_percent");
  out.xpos             = opt_field<int>(h, "xpos");
  out.ypos             = opt_field<int>(h, "ypos");
  return out;
}

// "ability0".."abilityN"; kept in slot order.
std::vector<Ability> decode_abilities(const json& a) {
  std::map<std::string, Ability> by_slot;
  for (const auto& [slot, v] : a.items()) {
    if (!v.is_object()) continue;
    Ability ab;
    ab.name     = opt_field<std::string>(v, "name").value_or("");
    ab.level    = opt_field<int>(v, "level");
    ab.can_cast = opt_field<bool>(v, "can_cast");
    ab.passive  = opt_field<bool>(v, "passive");
    ab.ultimate = opt_field<bool>(v, "ultimate");
    by_slot.emplace(slot, std::move(ab));
  }
  std::vector<Ability> out;
  out.reserve(by_slot.size());
  for (auto& [slot, ab] : by_slot) out.push_back(std::move(ab));
  return out;
}

VisibleEntity decode_marker(const json& m) {
  VisibleEntity out;
  out.name  = opt_field<std::string>(m, "name");
  out.team  = opt_field<int>(m, "team").value_or(0);
  out.pos.x = m.at("xpos").get<int>();
  out.pos.y = m.at("ypos").get<int>();
  out.kind  = marker_kind_from_image(opt_field<std::string>(m, "image").value_or(""));
  return out;
}

std::map<std::string, std::map<std::string, Building>> decode_buildings(const json& b) {
  std::map<std::string, std::map<std::string, Building>> out;
  for (const auto& [team, list] : b.items()) {
    if (!list.is_object()) continue;
    auto& dst = out[team];
    for (const auto& [name, v] : list.items()) {
      dst[name] = Building{v.at("health").get<int>(), v.at("max_health").get<int>()};
    }
  }
  return out;
}

} // namespace

std::optional<Snapshot> decode_snapshot(const json& doc) {
  if (!doc.is_object()) {
    logger().warn("decode: payload is not a JSON object");
    return std::nullopt;
  }
  try {
    Snapshot s;
    if (const json* m = opt_object(doc, "map")) {
      s.game_time  = opt_field<int>(*m, "game_time");
      s.game_state = opt_field<std::string>(*m, "game_state");
      s.daytime    = opt_field<bool>(*m, "daytime");
    }
    if (const json* p = opt_object(doc, "player"))    s.player = decode_player(*p);
    if (const json* h = opt_object(doc, "hero"))      s.hero = decode_hero(*h);
    if (const json* a = opt_object(doc, "abilities")) s.abilities = decode_abilities(*a);
    if (const json* mm = opt_object(doc, "minimap")) {
      for (const auto& [key, v] : mm->items()) s.minimap.emplace(key, decode_marker(v));
    }
    if (const json* b = opt_object(doc, "buildings")) s.buildings = decode_buildings(*b);
    return s;
  } catch (const json::exception& e) {
    logger().warn("decode: rejecting payload: {}", e.what());
    return std::nullopt;
  }
}

std::optional<Snapshot> decode_snapshot(const std::string& text) {
  json doc = json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded()) {
    logger().warn("decode: payload is not valid JSON ({} bytes)", text.size());
    return std::nullopt;
  }
  return decode_snapshot(doc);
}

std::vector<Snapshot> load_capture_stream(std::istream& in) {
  std::vector<Snapshot> out;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    if (auto s = decode_snapshot(line)) out.push_back(std::move(*s));
    else logger().warn("capture: skipping line {}", line_no);
  }
  return out;
}

std::optional<std::vector<Snapshot>> load_capture_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return load_capture_stream(f);
}

} // namespace gscoach
