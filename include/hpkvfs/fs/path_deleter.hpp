#pragma once

#include <string>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"
#include "hpkvfs/fs/metadata.hpp"
#include "hpkvfs/fs/chunk_store.hpp"

namespace hpkvfs {
namespace fs {

// 删除文件(连同全部分块)或空目录
class PathDeleter {
public:
    PathDeleter(storage::KVStore& store, MetadataStore& metadata, ChunkStore& chunks,
                size_t concurrency = 8)
        : store_(store), metadata_(metadata), chunks_(chunks),
          concurrency_(concurrency == 0 ? 1 : concurrency) {}

    Error Delete(const std::string& path);

private:
    Error deleteDirectory(const std::string& path);
    Error deleteFile(const std::string& path, bool hasMetadata);

    storage::KVStore& store_;
    MetadataStore& metadata_;
    ChunkStore& chunks_;
    size_t concurrency_;
};

} // namespace fs
} // namespace hpkvfs
