#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"

namespace hpkvfs {
namespace fs {

using json = nlohmann::json;

// 每个文件或目录一条的旁路元数据记录
struct Metadata {
    uint32_t mode = DEFAULT_FILE_MODE;
    int64_t uid = DEFAULT_UID;
    int64_t gid = DEFAULT_GID;
    int64_t size = 0;
    int64_t atime = 0;
    int64_t mtime = 0;
    int64_t ctime = 0;
    int64_t numChunks = 0;
    // 线上可缺省；目录记录写出时不带该字段
    bool hasNumChunks = false;

    bool IsDirectory() const { return IsDirectoryMode(mode); }
    bool IsRegular() const { return IsRegularMode(mode); }

    json ToJson() const;

    // 解析并归一化: size>0时num_chunks总是由size推导
    static Result<Metadata> FromJson(const json& j, const Identity& identity = Identity());

    static Metadata NewFile(const Identity& identity, int64_t now);
    static Metadata NewDirectory(const Identity& identity, int64_t now);
};

// 元数据读写，所有上层操作经由此类访问元数据键
class MetadataStore {
public:
    MetadataStore(storage::KVStore& store, Identity identity = Identity())
        : store_(store), identity_(identity) {}

    // 不存在时返回ErrorCode::NotFound，格式错误返回ErrorCode::CorruptMetadata
    Result<Metadata> Get(const std::string& path);

    // 无条件覆盖
    Error Put(const std::string& path, const Metadata& metadata);

    const Identity& GetIdentity() const { return identity_; }

private:
    storage::KVStore& store_;
    Identity identity_;
};

} // namespace fs
} // namespace hpkvfs
