#include "cataphract/core/errors.h"

namespace cataphract {

const char* error_kind_label(ErrorKind k) {
  switch (k) {
    case ErrorKind::None: return "none";
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::Authorization: return "AuthorizationError";
    case ErrorKind::NotFound: return "NotFoundError";
    case ErrorKind::InvalidRoute: return "InvalidRouteError";
    case ErrorKind::InvalidState: return "InvalidStateError";
    case ErrorKind::Conflict: return "ConflictError";
    case ErrorKind::Internal: return "InternalError";
  }
  return "unknown";
}

} // namespace cataphract
