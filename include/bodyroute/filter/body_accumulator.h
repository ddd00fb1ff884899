#ifndef BODYROUTE_FILTER_BODY_ACCUMULATOR_H
#define BODYROUTE_FILTER_BODY_ACCUMULATOR_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace bodyroute {
namespace filter {

/**
 * Body Accumulator
 *
 * Assembles a request body delivered in one or more chunks. Chunks are kept
 * in delivery order and the buffer only grows. Once the final chunk has been
 * appended the accumulator is sealed and the body may be consumed.
 *
 * With a non-zero limit, a chunk that would push the body past the limit
 * marks the accumulator overflowed; that chunk and all later ones are not
 * retained and the assembled body is not usable as a routing signal.
 */
class BodyAccumulator {
 public:
  // 0 means unbounded
  explicit BodyAccumulator(uint64_t max_bytes = 0) : max_bytes_(max_bytes) {}

  /**
   * Append a chunk. Appending after the final chunk is ignored and returns
   * false.
   */
  bool append(const std::string& chunk, bool end_stream);

  /**
   * Mark the body complete without further data (e.g. trailers arrived).
   */
  void seal() { complete_ = true; }

  bool complete() const { return complete_; }
  bool overflowed() const { return overflowed_; }

  // Bytes delivered, including any dropped after overflow
  uint64_t bytesReceived() const { return bytes_received_; }
  size_t chunkCount() const { return chunk_count_; }

  // Assembled body so far
  const std::string& data() const { return buffer_; }

 private:
  const uint64_t max_bytes_;
  std::string buffer_;
  uint64_t bytes_received_{0};
  size_t chunk_count_{0};
  bool complete_{false};
  bool overflowed_{false};
};

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_BODY_ACCUMULATOR_H
