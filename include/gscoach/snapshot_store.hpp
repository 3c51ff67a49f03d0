#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <gscoach/snapshot.hpp>

namespace gscoach {

// (current, previous) as produced by one ingestion step.
struct SnapshotPair {
  std::optional<Snapshot> current;
  std::optional<Snapshot> previous;
  std::uint64_t seq{0}; // ingestion step that produced this pair
};

// Holds the two most recent snapshots. Writers serialize; readers always get
// a pair from a single ingestion step.
class SnapshotStore {
public:
  // Rotate current into previous and store s as current. Never fails.
  SnapshotPair ingest(Snapshot s);

  SnapshotPair latest() const;

  // Drop both snapshots. The sequence still advances so pollers notice.
  void clear();

  // Copy the pair out only if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, SnapshotPair& out) const;

  std::uint64_t sequence() const;

private:
  mutable std::shared_mutex mu_;
  std::optional<Snapshot> current_;
  std::optional<Snapshot> previous_;
  std::uint64_t seq_{0};
};

} // namespace gscoach
