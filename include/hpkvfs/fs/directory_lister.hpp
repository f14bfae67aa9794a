#pragma once

#include <string>
#include <vector>
#include "hpkvfs/types.hpp"
#include "hpkvfs/storage/store.hpp"
#include "hpkvfs/fs/metadata.hpp"

namespace hpkvfs {
namespace fs {

struct DirEntry {
    std::string name;
    bool isDir = false;

    bool operator==(const DirEntry& other) const {
        return name == other.name && isDir == other.isDir;
    }
};

struct ListOptions {
    // 为true时读取直接子项的元数据以区分文件和空目录；
    // 为false时只凭键推断，仅有元数据键的子项默认报告为文件
    bool resolve = true;
};

// 通过前缀扫描推断目录内容
class DirectoryLister {
public:
    DirectoryLister(storage::KVStore& store, MetadataStore& metadata, ListOptions options = ListOptions())
        : store_(store), metadata_(metadata), options_(options) {}

    // 返回按名称排序、去重后的直接子项
    Result<std::vector<DirEntry>> List(const std::string& path);

private:
    storage::KVStore& store_;
    MetadataStore& metadata_;
    ListOptions options_;
};

} // namespace fs
} // namespace hpkvfs
