#include "util/result.hpp"

namespace canister {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Protocol:   return "protocol";
        case ErrorKind::Cancelled:  return "cancelled";
    }
    return "unknown";
}

} // namespace canister
