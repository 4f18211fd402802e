#include <memory_mcp/core/result.hpp>

#include <cstring>
#include <ostream>
#include <sstream>

namespace memory_mcp {

Error Error::FromErrno(const std::string& operation,
                       const std::string& path,
                       int errno_value) {
    std::string message = errno_value != 0
        ? std::string(std::strerror(errno_value))
        : std::string("unknown I/O error");
    return Error{operation, path, message, errno_value,
                 ErrorCategory::IoFailure};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::IoFailure:        return "io_failure";
        case ErrorCategory::Config:           return "config";
        case ErrorCategory::UnknownTool:      return "unknown_tool";
        case ErrorCategory::InvalidArguments: return "invalid_arguments";
        case ErrorCategory::InternalFailure:  return "internal_failure";
    }
    return "internal_failure";
}

// "<operation> [<path>]: <message> (errno N)"
std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    if (os_error.has_value() && *os_error != 0) {
        oss << " (errno " << *os_error << ")";
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

} // namespace memory_mcp
