#include "hpkvfs/server/errors.hpp"

namespace hpkvfs {
namespace server {

const Error Error::Success(0, "");
const Error Error::ErrMissingPath(1, "Path parameter is required");
const Error Error::ErrMissingCredentials(2, "API key and API URL headers are required");
const Error Error::ErrInvalidParameter(3, "Invalid parameter");
const Error Error::ErrMalformedBody(4, "Malformed request body");
const Error Error::ErrNotFound(5, "Not found");
const Error Error::ErrIsADirectory(6, "Path is a directory");
const Error Error::ErrNotADirectory(7, "Path is not a directory");
const Error Error::ErrConflict(8, "Path already exists");
const Error Error::ErrDirectoryNotEmpty(9, "Directory not empty");
const Error Error::ErrCorruptMetadata(10, "Corrupt metadata");
const Error Error::ErrStore(11, "Storage backend error");
const Error Error::ErrUnknown(12, "Unknown error");

Error Error::FromFsError(const hpkvfs::Error& err) {
    switch (err.code()) {
        case ErrorCode::OK:
            return Success;
        case ErrorCode::InvalidArgument:
            return ErrInvalidParameter.WithDetail(err.what());
        case ErrorCode::Unauthorized:
            return ErrMissingCredentials.WithDetail(err.what());
        case ErrorCode::NotFound:
            return ErrNotFound.WithDetail(err.what());
        case ErrorCode::IsADirectory:
            return ErrIsADirectory.WithDetail(err.what());
        case ErrorCode::NotADirectory:
            return ErrNotADirectory.WithDetail(err.what());
        case ErrorCode::Conflict:
            return ErrConflict.WithDetail(err.what());
        case ErrorCode::DirectoryNotEmpty:
            return ErrDirectoryNotEmpty.WithDetail(err.what());
        case ErrorCode::CorruptMetadata:
            return ErrCorruptMetadata.WithDetail(err.what());
        case ErrorCode::StoreError: {
            Error result(ErrStore.code_, err.what());
            result.upstreamStatus_ = err.upstreamStatus();
            return result;
        }
    }
    return ErrUnknown.WithDetail(err.what());
}

} // namespace server
} // namespace hpkvfs
