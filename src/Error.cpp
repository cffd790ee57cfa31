// src/Error.cpp
#include <Zipkit/Error.hpp>

namespace Zipkit {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "ok";
        case ErrorKind::Io: return "I/O error";
        case ErrorKind::VisitorAbort: return "visitor abort";
        case ErrorKind::SizeMismatch: return "size mismatch";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::InvalidState: return "invalid state";
    }
    return "unknown";
}

std::string Error::describe() const {
    if (ok()) {
        return "ok";
    }
    return std::string(toString(m_kind)) + ": " + m_message;
}

} // namespace Zipkit
