#pragma once
#include <stdexcept>
#include <string>

namespace mtrack {

// Malformed or out-of-domain input (empty id list, bad fraction, ...).
struct ValidationError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Store closed, never opened, or a transaction could not be started.
struct StoreUnavailableError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A single record failed to encode or decode.
struct EncodingError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A batch write failed; the batch is lost.
struct FlushError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace mtrack
