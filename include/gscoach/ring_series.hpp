#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gscoach {

// Fixed-capacity ring of samples in insertion order. Once full, each push
// overwrites the oldest entry. Logical index 0 is the oldest retained sample.
template <class T, std::size_t Cap>
class RingSeries {
public:
  static_assert(Cap > 0, "RingSeries needs a non-zero capacity");
  static constexpr std::size_t kCapacity = Cap;

  void push(const T& v) {
    buf_[write_index()] = v;
    ++size_;
  }

  std::size_t size() const { return current_size(); }
  bool empty() const { return size_ == 0; }
  void clear() { size_ = 0; }

  const T& operator[](std::size_t logical) const { return buf_[index(logical)]; }
  const T& front() const { return buf_[index(0)]; }
  const T& back() const { return buf_[index(current_size() - 1)]; }

  // Total pushes since construction (including evicted ones).
  std::uint64_t pushed() const { return size_; }

  std::vector<T> to_vector() const {
    std::vector<T> out;
    const std::size_t n = current_size();
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.push_back(buf_[index(i)]);
    return out;
  }

private:
  std::size_t index(std::size_t logical) const {
    const std::size_t start = (size_ >= Cap)
      ? static_cast<std::size_t>(size_ % static_cast<std::uint64_t>(Cap))
      : 0u;
    return (start + logical) % Cap;
  }
  std::size_t write_index() const {
    return static_cast<std::size_t>(size_ % static_cast<std::uint64_t>(Cap));
  }
  std::size_t current_size() const {
    const std::uint64_t cap64 = static_cast<std::uint64_t>(Cap);
    const std::uint64_t used  = (size_ < cap64) ? size_ : cap64;
    return static_cast<std::size_t>(used);
  }

  std::array<T, Cap> buf_{};
  std::uint64_t size_{0};
};

} // namespace gscoach
