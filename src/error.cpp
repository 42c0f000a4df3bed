#include "objxfer/error.hpp"

#include <cerrno>
#include <cstring>

namespace objxfer {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::PermissionDenied: return "permission denied";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::PreconditionNotMet: return "precondition not met";
        case ErrorKind::BackendFailure: return "backend failure";
        case ErrorKind::RetentionConflict: return "retention conflict";
    }
    return "unknown";
}

Error Error::with_trace(std::initializer_list<std::string> context) const {
    Error copy = *this;
    std::string frame;
    for (const auto& c : context) {
        if (c.empty()) continue;
        if (!frame.empty()) frame += ", ";
        frame += c;
    }
    if (!frame.empty()) copy.trace.push_back(std::move(frame));
    return copy;
}

std::string Error::to_string() const {
    std::string result = error_kind_name(kind);
    result += ": ";
    result += message;
    if (!trace.empty()) {
        result += " (";
        for (size_t i = 0; i < trace.size(); ++i) {
            if (i > 0) result += " <- ";
            result += trace[i];
        }
        result += ")";
    }
    return result;
}

Error error_from_errno(int err, const std::string& path) {
    std::string msg = path + ": " + std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return not_found(std::move(msg));
        case EACCES:
        case EPERM:
            return permission_denied(std::move(msg));
        case EINVAL:
        case ENAMETOOLONG:
            return invalid_argument(std::move(msg));
        default:
            return backend_failure(std::move(msg));
    }
}

}  // namespace objxfer
