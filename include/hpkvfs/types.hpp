#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <functional>

namespace hpkvfs {

// 存储键约定，所有共享同一存储的实现必须保持一致
const std::string METADATA_SUFFIX   = ".__meta__";
const std::string ROOT_METADATA_KEY = "/.__meta__";
const std::string CHUNK_SUFFIX      = ".chunk";
const std::string ROOT_PATH         = "/";

// HPKV单个值上限(编码后的字节数)
const size_t HPKV_MAX_VALUE_SIZE = 3072;

// 块大小，留出余量给块边界处被截断的UTF-8字符
const int64_t MAX_CHUNK_SIZE = 3000;

// POSIX文件类型与权限位(子集)
const uint32_t S_IFMT_MASK = 0170000;
const uint32_t S_IFDIR_BIT = 0040000;
const uint32_t S_IFREG_BIT = 0100000;

const uint32_t DEFAULT_DIR_MODE  = 040755;   // 16877
const uint32_t DEFAULT_FILE_MODE = 0100644;  // 33188

// 默认属主
const int64_t DEFAULT_UID = 1000;
const int64_t DEFAULT_GID = 1000;

using Bytes = std::vector<uint8_t>;

// 错误分类
enum class ErrorCode : int {
    OK = 0,
    InvalidArgument,
    Unauthorized,
    NotFound,
    IsADirectory,
    NotADirectory,
    Conflict,
    DirectoryNotEmpty,
    CorruptMetadata,
    StoreError
};

std::string ErrorCodeToString(ErrorCode code);

// 错误类型
class Error {
public:
    explicit Error(const std::string& message)
        : code_(ErrorCode::StoreError), message_(message), isError_(true) {}
    Error(ErrorCode code, const std::string& message)
        : code_(code), message_(message), isError_(code != ErrorCode::OK) {}
    Error() : code_(ErrorCode::OK), isError_(false) {}

    const std::string& what() const { return message_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }
    ErrorCode code() const { return code_; }
    bool is(ErrorCode code) const { return isError_ && code_ == code; }

    // 保留错误码，在消息前附加上下文
    Error Wrap(const std::string& context) const {
        if (!isError_) return *this;
        Error wrapped(code_, context + ": " + message_);
        wrapped.upstreamStatus_ = upstreamStatus_;
        return wrapped;
    }

    // 仅在网络层使用：上游HTTP状态码(0表示无)
    long upstreamStatus() const { return upstreamStatus_; }
    Error& WithUpstreamStatus(long status) {
        upstreamStatus_ = status;
        return *this;
    }

private:
    ErrorCode code_;
    std::string message_;
    bool isError_;
    long upstreamStatus_ = 0;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T& value() & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

// 属主身份，由调用方注入
struct Identity {
    int64_t uid = DEFAULT_UID;
    int64_t gid = DEFAULT_GID;
};

// 返回Unix时间戳(秒)，测试时可替换
using Clock = std::function<int64_t()>;

int64_t WallClockSeconds();

inline bool IsDirectoryMode(uint32_t mode) {
    return (mode & S_IFMT_MASK) == S_IFDIR_BIT;
}

inline bool IsRegularMode(uint32_t mode) {
    return (mode & S_IFMT_MASK) == S_IFREG_BIT;
}

// ceil(size / MAX_CHUNK_SIZE)
inline int64_t ChunkCountForSize(int64_t size) {
    if (size <= 0) return 0;
    return (size + MAX_CHUNK_SIZE - 1) / MAX_CHUNK_SIZE;
}

} // namespace hpkvfs
