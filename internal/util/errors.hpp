#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "vodbridge/content/v1/readiness.pb.h"

namespace vodbridge::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// No provider extension found, or every adapter strategy failed to bind.
class BackendUnavailable : public std::runtime_error {
 public:
  explicit BackendUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A bound adapter returned a malformed, error-flagged or mistyped payload.
class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A direct provider method rejected the argument shape it was called with.
class SignatureMismatch : public std::runtime_error {
 public:
  explicit SignatureMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Host transport failure (JSON-RPC endpoint unreachable, bad HTTP status).
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PreflightError : public std::runtime_error {
 public:
  explicit PreflightError(std::vector<vodbridge::content::v1::PreflightFailure> failures)
      : std::runtime_error(Describe(failures)), failures_(std::move(failures)) {
  }

  const std::vector<vodbridge::content::v1::PreflightFailure>& failures() const {
    return failures_;
  }

 private:
  static std::string Describe(const std::vector<vodbridge::content::v1::PreflightFailure>& failures) {
    std::string out;
    for (const auto& failure : failures) {
      if (!out.empty()) out += "; ";
      out += failure.message();
    }
    return out.empty() ? "not-ready" : out;
  }

  std::vector<vodbridge::content::v1::PreflightFailure> failures_;
};

} // namespace vodbridge::util
