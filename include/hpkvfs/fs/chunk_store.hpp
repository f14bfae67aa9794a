#pragma once

#include <string>
#include <optional>
#include <vector>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"

namespace hpkvfs {
namespace fs {

// 单个分块的读写；不存在的分块是合法状态(稀疏)，不是错误
class ChunkStore {
public:
    explicit ChunkStore(storage::KVStore& store) : store_(store) {}

    // 分块不存在时返回空optional
    Result<std::optional<Bytes>> Get(const std::string& path, int64_t index);

    // data长度不得超过MAX_CHUNK_SIZE
    Error Put(const std::string& path, int64_t index, const Bytes& data);

    // 幂等删除
    Error Delete(const std::string& path, int64_t index);

    // 前缀扫描已落盘的分块序号(升序)；后缀不是十进制序号的键忽略
    Result<std::vector<int64_t>> ListIndices(const std::string& path);

private:
    storage::KVStore& store_;
};

} // namespace fs
} // namespace hpkvfs
