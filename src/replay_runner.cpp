#include <gscoach/replay_runner.hpp>
#include <algorithm>
#include <chrono>
#include <utility>
#include <gscoach/log.hpp>

namespace gscoach {

ReplayCursor::ReplayCursor(std::vector<Snapshot> capture)
  : capture_(std::move(capture)) {
  // Captures are recorded in order, but keep equal clocks in arrival order.
  std::stable_sort(capture_.begin(), capture_.end(), [](const Snapshot& a, const Snapshot& b){
    return a.clock() < b.clock();
  });
  restart();
}

void ReplayCursor::restart() {
  next_ = 0;
  clock_ = capture_.empty() ? 0.0 : double(capture_.front().clock());
}

std::size_t ReplayCursor::advance(double dt, Coach& coach) {
  if (dt > 0.0) clock_ += dt;
  std::size_t pushed = 0;
  while (next_ < capture_.size() && double(capture_[next_].clock()) <= clock_) {
    coach.ingest(capture_[next_]);
    ++next_;
    ++pushed;
  }
  return pushed;
}

ReplayRunner::ReplayRunner(Coach& coach, std::vector<Snapshot> capture)
  : coach_(coach), cursor_(std::move(capture)) {}

void ReplayRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&ReplayRunner::thread_main_, this);
}

void ReplayRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void ReplayRunner::request_restart() {
  pending_restart_.store(true, std::memory_order_release);
}

void ReplayRunner::thread_main_() {
  using clock = std::chrono::steady_clock;
  const double base_dt = 1.0 / 20.0; // 20 Hz wall cadence
  const auto   tick_ns = std::chrono::nanoseconds((long long)(base_dt * 1e9));
  auto next = clock::now();

  logger().info("replay: starting ({} snapshots)", cursor_.size());

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_restart_.load(std::memory_order_acquire)) {
      pending_restart_.store(false, std::memory_order_relaxed);
      coach_.reset();
      cursor_.restart();
      finished_.store(false, std::memory_order_release);
      logger().info("replay: restarted");
    }

    const double warp = time_scale.load(std::memory_order_relaxed);
    const double dt_eff = base_dt * (warp < 0.0 ? 0.0 : warp);

    if (!cursor_.finished()) {
      cursor_.advance(dt_eff, coach_);
      replay_clock_.store(cursor_.clock(), std::memory_order_relaxed);
      if (cursor_.finished()) {
        finished_.store(true, std::memory_order_release);
        logger().info("replay: end of capture at {}", format_game_time(int(cursor_.clock())));
      }
    }

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }

  logger().info("replay: stopped");
}

} // namespace gscoach
