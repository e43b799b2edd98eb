#include "tsg_errors.hpp"

namespace tsg {

const char* reason_to_string(MalformedInputError::Reason reason) noexcept {
    switch (reason) {
        case MalformedInputError::Reason::MISSING_FIELD:  return "missing_field";
        case MalformedInputError::Reason::WRONG_TYPE:     return "wrong_type";
        case MalformedInputError::Reason::INVALID_VALUE:  return "invalid_value";
        case MalformedInputError::Reason::UNDECODABLE:    return "undecodable";
        case MalformedInputError::Reason::LIMIT_EXCEEDED: return "limit_exceeded";
        case MalformedInputError::Reason::STRUCTURE:      return "structure";
        case MalformedInputError::Reason::PROTOCOL:       return "protocol";
        case MalformedInputError::Reason::ORDERING:       return "ordering";
        default: return "unknown";
    }
}

} // namespace tsg
