#pragma once
#include "buffered_reader/bounded_queue.hpp"
#include "buffered_reader/byte_source.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <thread>

namespace blr {

// One item on the producer -> consumer channel. Either a chunk of bytes
// (empty == end of stream) or the error that stopped the producer.
struct ChunkMessage {
  std::string bytes;
  std::exception_ptr error;
};

// Reads fixed-size chunks from a ByteSource on a background thread so disk
// latency overlaps with decoding/splitting on the caller's thread. Only the
// worker touches the source until stop() has joined it.
class ChunkProducer {
public:
  struct Config {
    std::size_t chunk_bytes    = 128 * 1024 * 1024;
    std::size_t queue_capacity = 4;
  };

  ChunkProducer(ByteSource src, Config cfg);
  ~ChunkProducer();

  ChunkProducer(const ChunkProducer&) = delete;
  ChunkProducer& operator=(const ChunkProducer&) = delete;

  // Spawn the worker. Calling it twice is a no-op.
  void start();

  // Blocking pop. Rethrows the producer's error when it reaches the front.
  // Returns an empty string once the source is exhausted.
  std::string next();

  // Unblock and join the worker, drop queued chunks, close the source.
  void stop() noexcept;

  bool running() const noexcept { return worker_.joinable(); }
  std::size_t queue_high_water() const { return queue_.high_water(); }
  std::size_t queue_capacity() const noexcept { return queue_.capacity(); }
  std::uint64_t chunks_produced() const noexcept { return produced_.load(); }

private:
  void run();

  ByteSource src_;
  Config cfg_;
  BoundedQueue<ChunkMessage> queue_;
  std::thread worker_;
  std::atomic<std::uint64_t> produced_{0};
  bool started_{false};
  bool finished_{false};      // consumer saw the terminal chunk or an error
};

}
