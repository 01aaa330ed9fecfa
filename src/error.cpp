#include "airline/error.hpp"

#include <sstream>

namespace airline {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NOT_FOUND";
        case ErrorKind::ValidationError: return "VALIDATION_ERROR";
        case ErrorKind::Conflict: return "CONFLICT";
        case ErrorKind::BadRequest: return "BAD_REQUEST";
        case ErrorKind::DatabaseError: return "DATABASE_ERROR";
        case ErrorKind::CompensationFailed: return "COMPENSATION_FAILED";
    }
    return "UNKNOWN";
}

int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError:
        case ErrorKind::BadRequest:
            return 400;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::Conflict:
            return 409;
        case ErrorKind::DatabaseError:
        case ErrorKind::CompensationFailed:
            return 500;
    }
    return 500;
}

Error Error::caused_by(Error c) const {
    Error out = *this;
    out.cause = std::make_shared<const Error>(std::move(c));
    return out;
}

std::string Error::to_string() const {
    std::ostringstream os;
    os << airline::to_string(kind) << ": " << message;

    // Walk the cause chain one level at a time so each link stays readable
    for (const Error* c = cause.get(); c != nullptr; c = c->cause.get()) {
        os << "\n  caused by " << airline::to_string(c->kind) << ": " << c->message;
    }
    for (const auto& f : compensation_failures) {
        os << "\n  compensation failed: " << f.to_string();
    }
    return os.str();
}

} // namespace airline
