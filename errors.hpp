#pragma once

#include <stdexcept>
#include <string>

// Fatal pre-run failure: bad configuration or an unsafe source/destination
// layout. Raised before any worker starts.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A file could not be read (missing, permission revoked, short read).
class IOError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class PlacementError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IndexError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The store stayed locked for the whole retry budget of a claim.
class IndexBusyError : public IndexError {
 public:
  using IndexError::IndexError;
};

class FileTimeoutError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
