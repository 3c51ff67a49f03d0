#pragma once
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>
#include <gscoach/coach.hpp>
#include <gscoach/snapshot.hpp>

namespace gscoach {

// Deterministic half of the replay: walks a capture in clock order and feeds
// every snapshot whose clock has been reached into the coach.
class ReplayCursor {
public:
  explicit ReplayCursor(std::vector<Snapshot> capture);

  // Advance the replay clock by dt game seconds; returns snapshots pushed.
  std::size_t advance(double dt, Coach& coach);

  // Rewind to the first snapshot of the capture.
  void restart();

  bool finished() const { return next_ >= capture_.size(); }
  double clock() const { return clock_; }
  std::size_t position() const { return next_; }
  std::size_t size() const { return capture_.size(); }

private:
  std::vector<Snapshot> capture_;
  std::size_t next_{0};
  double clock_{0.0};
};

// Owns the replay thread. The coach outlives the runner.
class ReplayRunner {
public:
  ReplayRunner(Coach& coach, std::vector<Snapshot> capture);
  ~ReplayRunner() { stop(); }
  ReplayRunner(const ReplayRunner&) = delete;
  ReplayRunner& operator=(const ReplayRunner&) = delete;

  void start();
  void stop();

  // Rewind the capture and reset the coach; picked up on the next tick.
  void request_restart();

  bool finished() const { return finished_.load(std::memory_order_acquire); }
  double replay_clock() const { return replay_clock_.load(std::memory_order_relaxed); }

  // Control surface
  std::atomic<double> time_scale{1.0}; // 0.0 = paused

private:
  void thread_main_();

  Coach& coach_;
  ReplayCursor cursor_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<bool> finished_{false};
  std::atomic<double> replay_clock_{0.0};
  std::atomic<bool> pending_restart_{false};
};

} // namespace gscoach
