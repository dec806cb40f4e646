#include "buffered_reader/byte_source.hpp"

#include <utility>

namespace blr {

PlainFileSource::PlainFileSource(UniqueFd fd, std::string name)
  : fd_(std::move(fd)), name_(std::move(name)) {}

std::size_t PlainFileSource::read_some(char* dst, std::size_t n) {
  if (!fd_.valid() || n == 0) return 0;
  return read_retry(fd_.get(), dst, n, name_.c_str());
}

}
