#include "hpkvfs/types.hpp"
#include <chrono>

namespace hpkvfs {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IsADirectory: return "IsADirectory";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::DirectoryNotEmpty: return "DirectoryNotEmpty";
        case ErrorCode::CorruptMetadata: return "CorruptMetadata";
        case ErrorCode::StoreError: return "StoreError";
        default: return "Unknown";
    }
}

int64_t WallClockSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace hpkvfs
