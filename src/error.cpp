#include "gator/error.hpp"

namespace gator {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::network:
        return "NetworkError";
    case ErrorKind::http_status:
        return "HttpStatusError";
    case ErrorKind::range_mismatch:
        return "RangeMismatchError";
    case ErrorKind::disk:
        return "DiskError";
    case ErrorKind::resume_fingerprint_mismatch:
        return "ResumeFingerprintMismatch";
    case ErrorKind::cancelled:
        return "CancellationError";
    }
    return "UnknownError";
}

} // namespace gator
