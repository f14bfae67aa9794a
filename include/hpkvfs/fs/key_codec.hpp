#pragma once

#include <string>
#include <cstdint>
#include "hpkvfs/types.hpp"

namespace hpkvfs {
namespace fs {

// 路径到存储键的映射，纯函数，无I/O

// 元数据键: path + ".__meta__"，根目录使用"/.__meta__"
std::string MetadataKey(const std::string& path);

// 分块键: path + ".chunk" + 十进制序号
std::string ChunkKey(const std::string& path, int64_t index);

// 扫描某文件全部分块用的前缀
std::string ChunkKeyPrefix(const std::string& path);

// 目录前缀，总以"/"结尾
std::string DirectoryPrefix(const std::string& path);

// 校验用户路径: 绝对路径、无空段、无"."/".."、不含保留后缀
Error ValidatePath(const std::string& path);

// 若key是元数据键，去掉后缀得到路径，否则返回false
bool StripMetadataSuffix(const std::string& key, std::string& path);

inline bool IsRootPath(const std::string& path) {
    return path == ROOT_PATH;
}

} // namespace fs
} // namespace hpkvfs
