#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::InvalidInput:      return "invalid_input";
        case ErrorKind::InvalidState:      return "invalid_state";
        case ErrorKind::IoFailure:         return "io_failure";
        case ErrorKind::IntegrityMismatch: return "integrity_mismatch";
        case ErrorKind::Unimplemented:     return "unimplemented";
        case ErrorKind::NotFound:          return "not_found";
    }
    return "unknown";
}
