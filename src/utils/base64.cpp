#include "hpkvfs/utils/base64.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace hpkvfs {
namespace utils {

namespace {

bool isBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

// 检查字符集与填充，OpenSSL遇到非法输入只会静默截断
bool isWellFormed(const std::string& s) {
    if (s.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '=') {
            ++padding;
            if (i < s.size() - 2) {
                return false;
            }
            continue;
        }
        if (padding > 0 || !isBase64Char(s[i])) {
            return false;
        }
    }
    return padding <= 2;
}

} // namespace

std::string Base64Encode(const Bytes& data) {
    if (data.empty()) {
        return "";
    }

    BIO* bio, * b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    // 不换行（默认 Base64 会每 64 字符换行）
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    result.erase(std::remove(result.begin(), result.end(), '\n'), result.end());
    return result;
}

Result<Bytes> Base64Decode(const std::string& base64) {
    std::string input;
    input.reserve(base64.size());
    for (char c : base64) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input.push_back(c);
        }
    }
    if (input.empty()) {
        return Result<Bytes>(Bytes());
    }
    if (!isWellFormed(input)) {
        return Result<Bytes>(Error(ErrorCode::InvalidArgument, "Invalid base64 data"));
    }

    BIO* bio, * b64;
    Bytes decoded(input.length());

    b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new_mem_buf(input.data(), static_cast<int>(input.length()));
    bio = BIO_push(b64, bio);

    int decodedLen = BIO_read(bio, decoded.data(), static_cast<int>(input.length()));
    BIO_free_all(bio);
    if (decodedLen < 0) {
        return Result<Bytes>(Error(ErrorCode::InvalidArgument, "Base64 decode failed"));
    }
    decoded.resize(static_cast<size_t>(decodedLen));
    return Result<Bytes>(std::move(decoded));
}

} // namespace utils
} // namespace hpkvfs
