#ifndef WELLWATCH_HISTORY_RING_BUFFER_HPP_
#define WELLWATCH_HISTORY_RING_BUFFER_HPP_

#include <cstddef>
#include <utility>
#include <vector>

namespace wellwatch::history {

// Fixed-capacity ring buffer indexed by a write cursor.
//
// - Storage grows until `capacity` is reached and is then reused in place, so
//   steady-state pushes never allocate.
// - Pushing into a full buffer overwrites the oldest element.
// - Index 0 is always the oldest retained element.
// - No internal locking; owners serialize access.
template <typename T>
class RingBuffer {
public:
  explicit RingBuffer(std::size_t capacity) : capacity_(capacity == 0U ? 1U : capacity) {}

  // Returns true when the push evicted the oldest element.
  bool Push(T value) {
    if (storage_.size() < capacity_) {
      storage_.push_back(std::move(value));
      return false;
    }
    storage_[cursor_] = std::move(value);
    cursor_ = (cursor_ + 1U) % capacity_;
    return true;
  }

  const T& At(std::size_t index) const {
    if (storage_.size() < capacity_) {
      return storage_[index];
    }
    return storage_[(cursor_ + index) % capacity_];
  }

  const T& Back() const {
    return At(storage_.size() - 1U);
  }

  // Appends the newest `count` elements to `out`, oldest first.
  void CopyNewest(std::size_t count, std::vector<T>& out) const {
    const std::size_t size = storage_.size();
    const std::size_t take = count < size ? count : size;
    out.reserve(out.size() + take);
    for (std::size_t i = size - take; i < size; ++i) {
      out.push_back(At(i));
    }
  }

  std::size_t Size() const {
    return storage_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  bool Empty() const {
    return storage_.empty();
  }

  bool Full() const {
    return storage_.size() == capacity_;
  }

  void Clear() {
    storage_.clear();
    cursor_ = 0U;
  }

private:
  std::size_t capacity_;
  std::size_t cursor_ = 0U;
  std::vector<T> storage_;
};

} // namespace wellwatch::history

#endif // WELLWATCH_HISTORY_RING_BUFFER_HPP_
