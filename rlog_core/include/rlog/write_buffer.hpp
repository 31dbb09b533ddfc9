#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace rlog
{

// FIFO of formatted lines held while the log file is being rotated.
// Bounded; once full the newest line is dropped and counted.
// Not thread-safe: guarded by the owning sink's mutex.
class WriteBuffer
{
 public:
  explicit WriteBuffer(size_t capacity) : capacity_(capacity) {}

  bool Push(std::string line)
  {
    if (lines_.size() >= capacity_)
    {
      ++drop_count_;
      return false;
    }
    bytes_ += line.size();
    lines_.push_back(std::move(line));
    return true;
  }

  // Hands every line to `fn` in arrival order and empties the buffer.
  template <typename Fn>
  size_t Drain(Fn&& fn)
  {
    size_t count = 0;
    while (!lines_.empty())
    {
      std::string line = std::move(lines_.front());
      lines_.pop_front();
      bytes_ -= line.size();
      fn(line);
      ++count;
    }
    return count;
  }

  void Clear()
  {
    lines_.clear();
    bytes_ = 0;
  }

  size_t Size() const { return lines_.size(); }
  bool Empty() const { return lines_.empty(); }
  size_t Bytes() const { return bytes_; }
  size_t Capacity() const { return capacity_; }

  uint64_t DropCount() const { return drop_count_; }
  void AddDrops(uint64_t n) { drop_count_ += n; }

 private:
  std::deque<std::string> lines_;
  size_t capacity_;
  size_t bytes_ = 0;
  uint64_t drop_count_ = 0;
};

}  // namespace rlog
