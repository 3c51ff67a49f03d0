#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <gscoach/coach.hpp>
#include <gscoach/log.hpp>
#include <gscoach/replay_runner.hpp>
#include <gscoach/snapshot_json.hpp>
#include <gscoach/viewer/app.hpp>

using namespace gscoach;

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s <capture.jsonl> [--benchmarks file.csv] [--verbose]\n", argv0);
}

int main(int argc, char** argv) {
  std::string capture_path;
  std::string bench_path;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--benchmarks") == 0 && i + 1 < argc) bench_path = argv[++i];
    else if (std::strcmp(argv[i], "--verbose") == 0) verbose = true;
    else if (argv[i][0] != '-' && capture_path.empty()) capture_path = argv[i];
    else { usage(argv[0]); return 2; }
  }
  if (capture_path.empty()) { usage(argv[0]); return 2; }

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
  ReplayRunner replay(coach, std::move(*capture));
  replay.start();

  ViewerApp app(coach, replay);
  const int code = app.run();

  replay.stop();
  return code;
}
