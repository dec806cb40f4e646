#include "buffered_reader/line_reader.hpp"
#include "buffered_reader/byte_source.hpp"
#include "buffered_reader/chunk_producer.hpp"
#include "buffered_reader/errors.hpp"
#include "buffered_reader/line_splitter.hpp"
#include "buffered_reader/text_decoder.hpp"

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace blr {

namespace {

void validate(const LineReader::Config& cfg) {
  (void)parse_encoding(cfg.encoding); // throws on unknown names
  if (cfg.queue_capacity == 0) throw std::invalid_argument("queue_capacity must be >= 1");
}

std::string display_name(const std::string& name) {
  if (name.empty()) return "<stream>";
  auto base = std::filesystem::path(name).filename().string();
  return base.empty() ? name : base;
}

}

struct LineReader::Impl {
  enum class State { Open, Iterating, Exhausted, Closed };

  std::string name;
  Config cfg;
  Compression kind;
  std::size_t chunk;
  TextDecoder decoder;

  // exactly one of these is set: plain files go through the producer
  // thread, compressed files are pulled on the caller's thread
  std::unique_ptr<ChunkProducer> producer;
  std::optional<ByteSource> direct;

  SplitResult batch;           // lines of the current chunk
  std::size_t next_line{0};
  std::string carry;           // partial line waiting for its '\n'
  std::string text;            // decoded chunk scratch
  std::string last;            // storage for the final unterminated line
  std::exception_ptr deferred; // strict decode failure, raised after the good lines
  bool source_done{false};

  ReaderCounters counters;
  State state{State::Open};

  Impl(ByteSource src, std::string nm, Config c)
    : name(std::move(nm)),
      cfg(std::move(c)),
      kind(src.compression()),
      chunk(cfg.chunk_bytes ? cfg.chunk_bytes : default_chunk_bytes(kind)),
      decoder(parse_encoding(cfg.encoding), cfg.errors) {
    if (kind == Compression::None) {
      ChunkProducer::Config pc;
      pc.chunk_bytes = chunk;
      pc.queue_capacity = cfg.queue_capacity;
      producer = std::make_unique<ChunkProducer>(std::move(src), pc);
    } else {
      direct.emplace(std::move(src));
    }
  }

  void ensure_open() const {
    if (state == State::Closed) throw ClosedResourceError(name + ": reader is closed");
  }

  const char* mode() const { return producer ? "buffered" : "compressed"; }

  std::string pull_chunk() {
    if (producer) return producer->next();
    return direct->read_chunk(chunk);
  }

  // Stop the producer and close the source; counters stay readable.
  void release() noexcept {
    if (producer) producer->stop();
    if (direct) direct->close();
  }

  void finish() noexcept {
    counters.mark_finish();
    release();
    if (state != State::Closed) state = State::Exhausted;
  }

  bool advance(std::string_view& out) {
    while (true) {
      if (next_line < batch.size()) {
        out = batch.line(next_line++);
        counters.add_line();
        return true;
      }
      if (deferred) {
        finish();
        std::rethrow_exception(std::exchange(deferred, nullptr));
      }
      if (source_done) {
        if (finish_lines(carry, last)) {
          out = last;
          counters.add_line();
          return true;
        }
        finish();
        return false;
      }

      std::string bytes = pull_chunk();
      counters.add_bytes(bytes.size());
      const bool end = bytes.empty();
      text.clear();
      if (!decoder.decode(bytes, text, end))
        deferred = std::make_exception_ptr(DecodeError(name + ": " + decoder.error()));
      if (end) source_done = true;

      batch = split_lines(std::move(carry), text);
      carry = std::move(batch.carry);
      next_line = 0;
    }
  }
};

LineReader::LineReader(std::string path)
  : LineReader(std::move(path), Config{}) {}

LineReader::LineReader(std::string path, Config cfg) : p_(nullptr) {
  validate(cfg);
  ByteSource src = ByteSource::open(path);
  p_ = new Impl(std::move(src), std::move(path), std::move(cfg));
}

LineReader::LineReader(int fd, std::string name, Config cfg) : p_(nullptr) {
  ByteSource src = ByteSource::adopt(fd, name); // owns fd from here on
  validate(cfg);
  p_ = new Impl(std::move(src), std::move(name), std::move(cfg));
}

LineReader::~LineReader() {
  close();
  delete p_;
}

bool LineReader::read_next(std::string_view& out) {
  p_->ensure_open();
  if (p_->state == Impl::State::Exhausted) return false;
  if (p_->state == Impl::State::Open) {
    p_->state = Impl::State::Iterating;
    p_->counters.mark_start();
  }
  try {
    return p_->advance(out);
  } catch (const ReaderError&) {
    p_->finish();
    throw;
  }
}

std::uint64_t LineReader::for_each_line(const LineCallback& cb) {
  std::uint64_t n = 0;
  std::string_view line;
  while (read_next(line)) { cb(line); ++n; }
  return n;
}

LineReader::iterator& LineReader::iterator::operator++() {
  if (r_ && !r_->read_next(line_)) r_ = nullptr;
  return *this;
}

LineReader::iterator LineReader::begin() {
  p_->ensure_open();
  return iterator(this);
}

ReaderStats LineReader::stats() const {
  p_->ensure_open();
  return p_->counters.snapshot(display_name(p_->name), p_->mode());
}

void LineReader::close() noexcept {
  if (!p_ || p_->state == Impl::State::Closed) return;
  p_->counters.mark_finish();
  p_->release();
  p_->state = Impl::State::Closed;
}

bool LineReader::closed() const noexcept { return p_->state == Impl::State::Closed; }

bool LineReader::exhausted() const {
  p_->ensure_open();
  return p_->state == Impl::State::Exhausted;
}

Compression LineReader::compression() const {
  p_->ensure_open();
  return p_->kind;
}

std::size_t LineReader::chunk_bytes() const {
  p_->ensure_open();
  return p_->chunk;
}

std::size_t LineReader::queue_high_water() const {
  p_->ensure_open();
  return p_->producer ? p_->producer->queue_high_water() : 0;
}

}
