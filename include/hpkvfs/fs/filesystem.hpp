#pragma once

#include <memory>
#include <string>
#include <vector>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"
#include "hpkvfs/fs/metadata.hpp"
#include "hpkvfs/fs/chunk_store.hpp"
#include "hpkvfs/fs/range_writer.hpp"
#include "hpkvfs/fs/range_reader.hpp"
#include "hpkvfs/fs/directory_lister.hpp"
#include "hpkvfs/fs/path_deleter.hpp"

namespace hpkvfs {
namespace fs {

struct FileSystemOptions {
    Identity identity;
    ListOptions list;
    size_t deleteConcurrency = 8;
    Clock clock = WallClockSeconds;
};

// 在键值存储之上模拟的分层文件系统；所有入口先校验路径
class FileSystem {
public:
    explicit FileSystem(std::shared_ptr<storage::KVStore> store,
                        FileSystemOptions options = FileSystemOptions());

    Result<Metadata> Stat(const std::string& path);

    // 返回是否新建；已存在的目录视为成功，已存在的非目录返回Conflict
    Result<bool> Mkdir(const std::string& path);

    // 根目录元数据缺失时创建
    Error EnsureRoot();

    Result<int64_t> Write(const std::string& path, int64_t offset, const Bytes& data);
    Result<Bytes> Read(const std::string& path, int64_t offset, int64_t size);
    Result<std::vector<DirEntry>> List(const std::string& path);
    Error Delete(const std::string& path);

    std::string Location() const { return store_->Location(); }

private:
    std::shared_ptr<storage::KVStore> store_;
    FileSystemOptions options_;
    MetadataStore metadata_;
    ChunkStore chunks_;
    RangeWriter writer_;
    RangeReader reader_;
    DirectoryLister lister_;
    PathDeleter deleter_;
};

} // namespace fs
} // namespace hpkvfs
