#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vodbridge::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace vodbridge::util;

  if (dynamic_cast<const BackendUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const PreflightError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  // BackendError and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace vodbridge::grpc
