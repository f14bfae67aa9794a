#pragma once

#include <string>
#include "hpkvfs/types.hpp"
#include "hpkvfs/fs/metadata.hpp"
#include "hpkvfs/fs/chunk_store.hpp"

namespace hpkvfs {
namespace fs {

// 按字节区间写文件：逐块读-改-写，全部成功后更新元数据
class RangeWriter {
public:
    RangeWriter(MetadataStore& metadata, ChunkStore& chunks, Clock clock = WallClockSeconds)
        : metadata_(metadata), chunks_(chunks), clock_(std::move(clock)) {}

    // 返回写入字节数(即data.size())
    Result<int64_t> Write(const std::string& path, int64_t offset, const Bytes& data);

private:
    // 在单个分块内合并新数据
    Error writeChunk(const std::string& path, int64_t index,
                     int64_t offset, const Bytes& data);

    MetadataStore& metadata_;
    ChunkStore& chunks_;
    Clock clock_;
};

} // namespace fs
} // namespace hpkvfs
