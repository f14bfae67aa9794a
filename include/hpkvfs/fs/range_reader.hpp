#pragma once

#include <string>
#include "hpkvfs/types.hpp"
#include "hpkvfs/fs/metadata.hpp"
#include "hpkvfs/fs/chunk_store.hpp"

namespace hpkvfs {
namespace fs {

// 按字节区间读文件，结果截断到文件大小，稀疏区域读出为0
class RangeReader {
public:
    RangeReader(MetadataStore& metadata, ChunkStore& chunks)
        : metadata_(metadata), chunks_(chunks) {}

    Result<Bytes> Read(const std::string& path, int64_t offset, int64_t size);

private:
    MetadataStore& metadata_;
    ChunkStore& chunks_;
};

} // namespace fs
} // namespace hpkvfs
