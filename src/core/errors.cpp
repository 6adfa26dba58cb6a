#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return "None";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Auth:      return "AuthError";
        case ErrorKind::Build:     return "BuildError";
        case ErrorKind::Timeout:   return "TimeoutError";
        case ErrorKind::Cache:     return "CacheError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Internal:  return "InternalError";
    }
    return "Unknown";
}
