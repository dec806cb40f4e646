#pragma once
#include <stdexcept>
#include <string>

namespace blr {

// Base of every failure raised while opening or iterating a reader.
class ReaderError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// open/read failure of the underlying descriptor; never retried.
class IoError : public ReaderError {
public:
  using ReaderError::ReaderError;
};

// malformed compressed stream, or undecodable text under the strict policy.
class DecodeError : public ReaderError {
public:
  using ReaderError::ReaderError;
};

// source handed over in a mode we cannot read from (raised at open time).
class InvalidModeError : public ReaderError {
public:
  using ReaderError::ReaderError;
};

class ClosedResourceError : public ReaderError {
public:
  using ReaderError::ReaderError;
};

// "<what>: <strerror(err)>"
std::string errno_message(const std::string& what, int err);

}
