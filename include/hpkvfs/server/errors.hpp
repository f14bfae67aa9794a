#pragma once

#include <string>
#include <utility>
#include "hpkvfs/types.hpp"

namespace hpkvfs {
namespace server {

class Error {
public:
    Error() : code_(0), detail_("") {}
    Error(int code, std::string detail) : code_(code), detail_(std::move(detail)) {}

    int Code() const { return code_; }
    const std::string& Detail() const { return detail_; }

    Error WithDetail(const std::string& detail) const {
        Error err(code_, detail);
        err.upstreamStatus_ = upstreamStatus_;
        return err;
    }

    int HTTPStatusCode() const {
        switch (code_) {
            case 0: // NoError
                return 200;
            case 1: // ErrMissingPath
            case 3: // ErrInvalidParameter
            case 4: // ErrMalformedBody
            case 6: // ErrIsADirectory
            case 7: // ErrNotADirectory
            case 9: // ErrDirectoryNotEmpty
                return 400;
            case 2: // ErrMissingCredentials
                return 401;
            case 5: // ErrNotFound
                return 404;
            case 8: // ErrConflict
                return 409;
            case 11: // ErrStore
                if (upstreamStatus_ >= 400 && upstreamStatus_ < 600) {
                    return static_cast<int>(upstreamStatus_);
                }
                return 500;
            case 10: // ErrCorruptMetadata
            case 12: // ErrUnknown
            default:
                return 500;
        }
    }

    // 文件系统层错误转换为服务器错误，消息原样保留
    static Error FromFsError(const hpkvfs::Error& err);

    // 静态错误定义
    static const Error Success;
    static const Error ErrMissingPath;
    static const Error ErrMissingCredentials;
    static const Error ErrInvalidParameter;
    static const Error ErrMalformedBody;
    static const Error ErrNotFound;
    static const Error ErrIsADirectory;
    static const Error ErrNotADirectory;
    static const Error ErrConflict;
    static const Error ErrDirectoryNotEmpty;
    static const Error ErrCorruptMetadata;
    static const Error ErrStore;
    static const Error ErrUnknown;

private:
    int code_;
    std::string detail_;
    long upstreamStatus_ = 0;
};

} // namespace server
} // namespace hpkvfs
