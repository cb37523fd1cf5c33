#pragma once

#include <stdexcept>
#include <string>

namespace syncore::util {

/*
  Central error types.

  Local operations (enqueue, cache reads/writes) only raise the validation,
  lookup and capacity errors. Transport and conflict errors come from the
  sync path; the gRPC adapters translate them to and from status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
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

// Retried with backoff.
class TransientTransportError : public std::runtime_error {
 public:
  explicit TransientTransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The operation is parked until someone resolves it.
class ConflictRequiresManualResolution : public std::runtime_error {
 public:
  ConflictRequiresManualResolution(const std::string& conflict_id, const std::string& msg)
      : std::runtime_error(msg), conflict_id_(conflict_id) {
  }

  const std::string& ConflictId() const {
    return conflict_id_;
  }

 private:
  std::string conflict_id_;
};

class CorruptionDetected : public std::runtime_error {
 public:
  CorruptionDetected(const std::string& key, const std::string& msg) : std::runtime_error(msg), key_(key) {
  }

  const std::string& Key() const {
    return key_;
  }

 private:
  std::string key_;
};

// Schema/version mismatch with the remote. Aborts the session.
class FatalError : public std::runtime_error {
 public:
  explicit FatalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace syncore::util
