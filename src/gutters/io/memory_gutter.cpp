#include "gutters/io/memory_gutter.hpp"

#include <algorithm>

namespace gutters::io {

MemoryGutter::MemoryGutter(std::span<const std::byte> input)
  : input_(input.begin(), input.end()) {}

void MemoryGutter::feed(std::span<const std::byte> bytes) {
  input_.insert(input_.end(), bytes.begin(), bytes.end());
}

IoCount MemoryGutter::read_some(std::span<std::byte> buf) {
  ++read_calls_;
  if (read_error_) return io_error(*read_error_);

  const std::size_t n = (std::min)({buf.size(), input_.size(), max_chunk_});
  std::copy_n(input_.begin(), n, buf.begin());
  input_.erase(input_.begin(), input_.begin() + static_cast<std::ptrdiff_t>(n));
  return n;  // 0 once input is drained: end of stream
}

IoCount MemoryGutter::write_some(std::span<const std::byte> buf) {
  ++write_calls_;
  if (write_error_) return io_error(*write_error_);

  const std::size_t room = write_capacity_ - (std::min)(write_capacity_, output_.size());
  const std::size_t n = (std::min)({buf.size(), room, max_chunk_});
  output_.insert(output_.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
  return n;
}

} // namespace gutters::io
