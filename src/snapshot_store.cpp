#include <gscoach/snapshot_store.hpp>
#include <mutex>
#include <utility>

namespace gscoach {

SnapshotPair SnapshotStore::ingest(Snapshot s) {
  std::unique_lock lock(mu_);
  previous_ = std::move(current_);
  current_ = std::move(s);
  ++seq_;
  return SnapshotPair{current_, previous_, seq_};
}

void SnapshotStore::clear() {
  std::unique_lock lock(mu_);
  current_.reset();
  previous_.reset();
  ++seq_;
}

SnapshotPair SnapshotStore::latest() const {
  std::shared_lock lock(mu_);
  return SnapshotPair{current_, previous_, seq_};
}

bool SnapshotStore::try_consume_latest(std::uint64_t& cursor, SnapshotPair& out) const {
  std::shared_lock lock(mu_);
  if (seq_ == cursor) return false;
  out = SnapshotPair{current_, previous_, seq_};
  cursor = seq_;
  return true;
}

std::uint64_t SnapshotStore::sequence() const {
  std::shared_lock lock(mu_);
  return seq_;
}

} // namespace gscoach
