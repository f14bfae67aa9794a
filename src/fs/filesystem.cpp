#include "hpkvfs/fs/filesystem.hpp"
#include "hpkvfs/fs/key_codec.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace fs {

FileSystem::FileSystem(std::shared_ptr<storage::KVStore> store, FileSystemOptions options)
    : store_(std::move(store))
    , options_(std::move(options))
    , metadata_(*store_, options_.identity)
    , chunks_(*store_)
    , writer_(metadata_, chunks_, options_.clock)
    , reader_(metadata_, chunks_)
    , lister_(*store_, metadata_, options_.list)
    , deleter_(*store_, metadata_, chunks_, options_.deleteConcurrency) {}

Result<Metadata> FileSystem::Stat(const std::string& path) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return Result<Metadata>(err);
    }

    auto meta = metadata_.Get(path);
    // 根目录没有记录时按默认目录返回
    if (!meta.ok() && IsRootPath(path) && meta.error().is(ErrorCode::NotFound)) {
        return Result<Metadata>(Metadata::NewDirectory(options_.identity, 0));
    }
    return meta;
}

Result<bool> FileSystem::Mkdir(const std::string& path) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return Result<bool>(err);
    }
    if (IsRootPath(path)) {
        return Result<bool>(Error(ErrorCode::InvalidArgument, "Path cannot be root (/)"));
    }

    auto existing = metadata_.Get(path);
    if (existing.ok()) {
        if (existing.value().IsDirectory()) {
            utils::GetLogger().Debug("目录已存在", utils::LogContext().With("path", path));
            return Result<bool>(false);
        }
        return Result<bool>(Error(ErrorCode::Conflict, "Path exists but is not a directory: " + path));
    }
    if (!existing.error().is(ErrorCode::NotFound)) {
        return Result<bool>(existing.error().Wrap("Failed to check existing path"));
    }

    err = metadata_.Put(path, Metadata::NewDirectory(options_.identity, options_.clock()));
    if (!err.ok()) {
        return Result<bool>(err.Wrap("Failed to create directory metadata"));
    }
    utils::GetLogger().Info("已创建目录", utils::LogContext().With("path", path));
    return Result<bool>(true);
}

Error FileSystem::EnsureRoot() {
    auto existing = metadata_.Get(ROOT_PATH);
    if (existing.ok()) {
        return Error();
    }
    if (!existing.error().is(ErrorCode::NotFound)) {
        return existing.error();
    }
    utils::GetLogger().Info("初始化根目录元数据", utils::LogContext().With("store", store_->Location()));
    return metadata_.Put(ROOT_PATH, Metadata::NewDirectory(options_.identity, options_.clock()));
}

Result<int64_t> FileSystem::Write(const std::string& path, int64_t offset, const Bytes& data) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return Result<int64_t>(err);
    }
    if (IsRootPath(path)) {
        return Result<int64_t>(Error(ErrorCode::IsADirectory, "Path is a directory: /"));
    }
    return writer_.Write(path, offset, data);
}

Result<Bytes> FileSystem::Read(const std::string& path, int64_t offset, int64_t size) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return Result<Bytes>(err);
    }
    if (IsRootPath(path)) {
        return Result<Bytes>(Error(ErrorCode::IsADirectory, "Path is a directory: /"));
    }
    return reader_.Read(path, offset, size);
}

Result<std::vector<DirEntry>> FileSystem::List(const std::string& path) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return Result<std::vector<DirEntry>>(err);
    }
    return lister_.List(path);
}

Error FileSystem::Delete(const std::string& path) {
    Error err = ValidatePath(path);
    if (!err.ok()) {
        return err;
    }
    return deleter_.Delete(path);
}

} // namespace fs
} // namespace hpkvfs
