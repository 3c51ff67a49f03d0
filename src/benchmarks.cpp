#include <gscoach/benchmarks.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <gscoach/log.hpp>

namespace gscoach {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && (cols[0] == "kind" || cols[0] == "Kind");
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::logic_error&) { // invalid_argument, out_of_range
    ok = false;
    return 0.0;
  }
}

static int to_int_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::logic_error&) {
    ok = false;
    return 0;
  }
}

static std::optional<CsBenchmark> parse_cs_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  const std::string phase = cols[1];
  if (phase.empty()) return std::nullopt;
  bool ok1, ok2, ok3, ok4;
  const int until = to_int_safe(cols[2], ok1);
  const double excellent = to_double_safe(cols[3], ok2);
  const double good = to_double_safe(cols[4], ok3);
  const double poor = to_double_safe(cols[5], ok4);
  if (!(ok1 && ok2 && ok3 && ok4)) return std::nullopt;
  if (until < 0 || poor < 0.0 || !(poor <= good && good <= excellent)) return std::nullopt;
  return CsBenchmark{phase, until, excellent, good, poor};
}

static std::optional<NetWorthBenchmark> parse_networth_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  bool ok1, ok2;
  const int minute = to_int_safe(cols[1], ok1);
  const int nw = to_int_safe(cols[2], ok2);
  if (!(ok1 && ok2) || minute <= 0 || nw < 0) return std::nullopt;
  return NetWorthBenchmark{minute, nw, cols[3]};
}

static void sort_catalog(BenchmarkCatalog& cat) {
  std::stable_sort(cat.cs.begin(), cat.cs.end(), [](const CsBenchmark& a, const CsBenchmark& b){
    // Open-ended (0) phase sorts last.
    const long ka = a.until_minute == 0 ? std::numeric_limits<int>::max() : long(a.until_minute);
    const long kb = b.until_minute == 0 ? std::numeric_limits<int>::max() : long(b.until_minute);
    return ka < kb;
  });
  std::stable_sort(cat.net_worth.begin(), cat.net_worth.end(),
    [](const NetWorthBenchmark& a, const NetWorthBenchmark& b){ return a.minute < b.minute; });
}

static BenchmarkCatalog make_catalog_builtin() {
  BenchmarkCatalog cat;
  cat.cs = {
    {"early", 10, 7.0, 5.0, 3.0},
    {"late",   0, 8.0, 6.0, 4.0},
  };
  cat.net_worth = {
    {10,  4000, "Power Treads + Wraith Bands"},
    {15,  7000, "Core farming item (Battlefury/Maelstrom)"},
    {20, 11000, "Second major item (BKB/Desolator)"},
    {30, 18000, "Third major item (Satanic/Butterfly)"},
  };
  return cat;
}

const BenchmarkCatalog& benchmark_catalog() {
  static const BenchmarkCatalog cat = make_catalog_builtin();
  return cat;
}

std::optional<CsBenchmark> cs_benchmark_at(const BenchmarkCatalog& cat, int minute) {
  for (const auto& b : cat.cs) {
    if (b.until_minute == 0 || minute < b.until_minute) return b;
  }
  return std::nullopt;
}

BenchmarkCatalog benchmark_catalog_from_csv_stream(std::istream& in) {
  BenchmarkCatalog out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (cols[0] == "cs") {
      if (auto row = parse_cs_row(cols); row.has_value()) { out.cs.push_back(*row); continue; }
    } else if (cols[0] == "networth") {
      if (auto row = parse_networth_row(cols); row.has_value()) { out.net_worth.push_back(*row); continue; }
    }
    logger().warn("benchmarks: skipping invalid row {}: '{}'", line_no, raw);
  }

  const auto& builtin = benchmark_catalog();
  if (out.cs.empty()) out.cs = builtin.cs;
  if (out.net_worth.empty()) out.net_worth = builtin.net_worth;
  sort_catalog(out);
  return out;
}

std::optional<BenchmarkCatalog> load_benchmark_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return benchmark_catalog_from_csv_stream(f);
}

} // namespace gscoach
