#pragma once

#include <stdexcept>
#include <string>

namespace muse::util {

/*
  Central error types.

  Transient/permanent classification is by type: retry predicates
  test with dynamic_cast, never by message.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Connection pool acquire timed out.
class PoolExhausted : public ResourceExhausted {
 public:
  explicit PoolExhausted(const std::string& msg) : ResourceExhausted(msg) {
  }
};

// Lock contention, I/O hiccup or serialization failure in the datastore.
class TransientStoreError : public std::runtime_error {
 public:
  explicit TransientStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CircuitOpen : public std::runtime_error {
 public:
  explicit CircuitOpen(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised at a cancellation checkpoint once the owning loop was stopped.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GenerationError : public std::runtime_error {
 public:
  GenerationError(const std::string& msg, bool retryable) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool Retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

} // namespace muse::util
