#include "bodyroute/filter/body_accumulator.h"

namespace bodyroute {
namespace filter {

bool BodyAccumulator::append(const std::string& chunk, bool end_stream) {
  if (complete_) {
    return false;
  }

  ++chunk_count_;
  bytes_received_ += chunk.size();

  if (!overflowed_) {
    if (max_bytes_ > 0 && bytes_received_ > max_bytes_) {
      // Retained prefix stays as is; an oversized body carries no signal
      overflowed_ = true;
    } else {
      buffer_.append(chunk);
    }
  }

  if (end_stream) {
    complete_ = true;
  }
  return true;
}

}  // namespace filter
}  // namespace bodyroute
