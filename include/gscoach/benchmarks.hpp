#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace gscoach {

// Last-hits-per-minute rating table for one game phase.
struct CsBenchmark {
  std::string phase;    // e.g. "early"
  int until_minute;     // phase applies while minutes < until_minute; 0 = open ended
  double excellent;     // cs/min >= excellent
  double good;          // cs/min >= good
  double poor;          // cs/min <  poor
};

// Net worth expected by a given minute, with the item milestone it stands for.
struct NetWorthBenchmark {
  int minute;
  int net_worth;
  std::string items;
};

struct BenchmarkCatalog {
  std::vector<CsBenchmark> cs;              // sorted by until_minute, open ended last
  std::vector<NetWorthBenchmark> net_worth; // sorted by minute
};

// Built-in default tables.
const BenchmarkCatalog& benchmark_catalog();

// Phase table in effect at the given minute; nullopt if the catalog has none.
std::optional<CsBenchmark> cs_benchmark_at(const BenchmarkCatalog& cat, int minute);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Rows are tagged by their first column:
//   cs,<phase>,<until_minute>,<excellent>,<good>,<poor>
//   networth,<minute>,<net_worth>,<items>
// Accepts an optional header row starting with "kind"; ignores blank lines and
// lines starting with '#'. Whitespace around fields is trimmed. Invalid rows
// are skipped. A table with no valid rows falls back to the built-in one.
BenchmarkCatalog benchmark_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<BenchmarkCatalog> load_benchmark_catalog_csv(const std::string& path);

} // namespace gscoach
