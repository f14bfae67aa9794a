#pragma once

#include <string>
#include <vector>
#include "hpkvfs/types.hpp"

namespace hpkvfs {
namespace utils {

// Base64编码(不换行)
std::string Base64Encode(const Bytes& data);

// Base64解码，忽略空白；非法字符或长度返回InvalidArgument
Result<Bytes> Base64Decode(const std::string& base64);

} // namespace utils
} // namespace hpkvfs
