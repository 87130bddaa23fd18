#include "util/result.hpp"

namespace pkgrepo {

std::string_view ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::MalformedPackage:     return "MalformedPackage";
        case ErrorCode::DescriptorMismatch:   return "DescriptorMismatch";
        case ErrorCode::NoMatchingRepository: return "NoMatchingRepository";
        case ErrorCode::RepositoryBusy:       return "RepositoryBusy";
        case ErrorCode::MetadataBuildFailed:  return "MetadataBuildFailed";
        case ErrorCode::SigningFailed:        return "SigningFailed";
        case ErrorCode::VerificationFailed:   return "VerificationFailed";
        case ErrorCode::StorageError:         return "StorageError";
        case ErrorCode::PreconditionFailed:   return "PreconditionFailed";
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::Timeout:              return "Timeout";
        case ErrorCode::Cancelled:            return "Cancelled";
        case ErrorCode::InvalidConfig:        return "InvalidConfig";
        case ErrorCode::PackageNotFound:      return "PackageNotFound";
    }
    return "Unknown";
}

} // namespace pkgrepo
