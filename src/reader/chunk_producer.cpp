#include "buffered_reader/chunk_producer.hpp"

#include <stdexcept>
#include <utility>

namespace blr {

ChunkProducer::ChunkProducer(ByteSource src, Config cfg)
  : src_(std::move(src)), cfg_(cfg), queue_(cfg.queue_capacity) {
  if (cfg_.chunk_bytes == 0) throw std::invalid_argument("chunk_bytes must be > 0");
}

ChunkProducer::~ChunkProducer() { stop(); }

void ChunkProducer::start() {
  if (started_) return;
  started_ = true;
  worker_ = std::thread(&ChunkProducer::run, this);
}

void ChunkProducer::run() {
  try {
    while (true) {
      std::string chunk = src_.read_chunk(cfg_.chunk_bytes);
      const bool last = chunk.empty();
      if (!last) ++produced_;
      // push fails only when the consumer has gone away
      if (!queue_.push(ChunkMessage{std::move(chunk), nullptr})) return;
      if (last) return;
    }
  } catch (const std::exception&) {
    (void)queue_.push(ChunkMessage{std::string(), std::current_exception()}); // refused only after stop()
  }
}

std::string ChunkProducer::next() {
  if (finished_) return std::string();
  start();
  auto msg = queue_.pop();
  if (!msg) { finished_ = true; return std::string(); }
  if (msg->error) {
    finished_ = true;
    std::rethrow_exception(msg->error);
  }
  if (msg->bytes.empty()) finished_ = true;
  return std::move(msg->bytes);
}

void ChunkProducer::stop() noexcept {
  queue_.close();
  queue_.clear();
  if (worker_.joinable()) worker_.join();
  finished_ = true;
  src_.close();
}

}
