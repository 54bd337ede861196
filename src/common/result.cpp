#include "selfspy/common/result.hpp"

namespace selfspy::common {

const char *error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  case ErrorKind::Capture:
    return "capture";
  case ErrorKind::Encryption:
    return "encryption";
  case ErrorKind::BufferOverflow:
    return "buffer_overflow";
  case ErrorKind::Flush:
    return "flush";
  case ErrorKind::StoreUnavailable:
    return "store_unavailable";
  case ErrorKind::Store:
    return "store";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

} // namespace selfspy::common
