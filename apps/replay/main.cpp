#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <gscoach/coach.hpp>
#include <gscoach/log.hpp>
#include <gscoach/snapshot_json.hpp>

using namespace gscoach;

static void usage(const char* argv0) {
  std::fprintf(stderr,
    "usage: %s <capture.jsonl> [--benchmarks file.csv] [--step seconds] [--verbose]\n", argv0);
}

static void print_view(const CoachView& v) {
  std::printf("=== %s ===\n", format_game_time(v.inputs.current.game_time).c_str());
  for (const auto& line : v.insights) std::printf("%s\n", line.c_str());
  std::printf("\n");
}

int main(int argc, char** argv) {
  std::string capture_path;
  std::string bench_path;
  int step = 30;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--benchmarks") == 0 && i + 1 < argc) bench_path = argv[++i];
    else if (std::strcmp(argv[i], "--step") == 0 && i + 1 < argc) step = std::atoi(argv[++i]);
    else if (std::strcmp(argv[i], "--verbose") == 0) verbose = true;
    else if (argv[i][0] != '-' && capture_path.empty()) capture_path = argv[i];
    else { usage(argv[0]); return 2; }
  }
  if (capture_path.empty() || step <= 0) { usage(argv[0]); return 2; }

  init_logging(verbose ? spdlog::level::debug : spdlog::level::info);

  auto capture = load_capture_file(capture_path);
  if (!capture) {
    logger().error("cannot open capture '{}'", capture_path);
    return 1;
  }

  BenchmarkCatalog bench = benchmark_catalog();
  if (!bench_path.empty()) {
    auto loaded = load_benchmark_catalog_csv(bench_path);
    if (!loaded) {
      logger().error("cannot open benchmarks '{}'", bench_path);
      return 1;
    }
    bench = std::move(*loaded);
  }

  Coach coach(std::move(bench));
  std::uint64_t cursor = 0;
  CoachView view;
  std::optional<GameClock> last_printed;

  logger().info("replaying {} snapshots from '{}'", capture->size(), capture_path);
  for (auto& s : *capture) {
    if (!coach.ingest(std::move(s))) continue;
    if (!coach.poll(cursor, view)) continue;
    const GameClock now = view.inputs.current.clock();
    if (last_printed && now - *last_printed < step) continue;
    print_view(view);
    last_printed = now;
  }

  // Always end on the final state.
  if (coach.sequence() > 0) {
    view = coach.view();
    if (!last_printed || *last_printed != view.inputs.current.clock()) print_view(view);
  }
  logger().info("done: {} ingested, {} dropped as stale", coach.sequence(), coach.dropped());
  return 0;
}
