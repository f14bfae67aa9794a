#include "hpkvfs/fs/directory_lister.hpp"
#include "hpkvfs/fs/key_codec.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <map>
#include <set>

namespace hpkvfs {
namespace fs {

Result<std::vector<DirEntry>> DirectoryLister::List(const std::string& path) {
    // 目标本身是普通文件时拒绝列举；元数据缺失的隐式目录照常列举
    if (!IsRootPath(path)) {
        auto self = metadata_.Get(path);
        if (self.ok() && !self.value().IsDirectory()) {
            return Result<std::vector<DirEntry>>(Error(ErrorCode::NotADirectory, "Not a directory: " + path));
        }
        if (!self.ok() && !self.error().is(ErrorCode::NotFound)) {
            return Result<std::vector<DirEntry>>(self.error());
        }
    }

    const std::string prefix = DirectoryPrefix(path);
    auto keys = storage::ListAllKeys(store_, prefix);
    if (!keys.ok()) {
        return Result<std::vector<DirEntry>>(keys.error());
    }

    // name -> isDir，目录的观测结果优先
    std::map<std::string, bool> entries;
    std::set<std::string> unresolved;

    for (const auto& key : keys.value()) {
        if (key == MetadataKey(path)) {
            continue;
        }
        const std::string relative = key.substr(prefix.size());

        size_t slash = relative.find('/');
        if (slash != std::string::npos) {
            // 更深层的键说明第一段是子目录
            std::string dirName = relative.substr(0, slash);
            if (!dirName.empty()) {
                entries[dirName] = true;
                unresolved.erase(dirName);
            }
            continue;
        }

        std::string childPath;
        if (StripMetadataSuffix(key, childPath)) {
            std::string name = childPath.substr(prefix.size());
            if (!name.empty() && entries.find(name) == entries.end()) {
                entries[name] = false;
                unresolved.insert(name);
            }
        }
        // 其余是直接子文件的分块键，不产生条目
    }

    if (options_.resolve) {
        for (const auto& name : unresolved) {
            auto childMeta = metadata_.Get(prefix + name);
            if (!childMeta.ok()) {
                utils::GetLogger().Warn("无法读取子项元数据，按文件处理",
                    utils::LogContext()
                        .With("path", prefix + name)
                        .With("error", childMeta.error().what()));
                continue;
            }
            entries[name] = childMeta.value().IsDirectory();
        }
    }

    std::vector<DirEntry> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(DirEntry{entry.first, entry.second});
    }

    utils::GetLogger().Debug("列举目录",
        utils::LogContext()
            .With("path", path)
            .With("entries", std::to_string(result.size())));

    return Result<std::vector<DirEntry>>(std::move(result));
}

} // namespace fs
} // namespace hpkvfs
