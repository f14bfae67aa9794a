#include "hpkvfs/fs/path_deleter.hpp"
#include "hpkvfs/fs/key_codec.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace hpkvfs {
namespace fs {

namespace {

// 并发执行删除任务，返回最先观察到的错误；已发出的删除不回滚
Error runConcurrently(const std::vector<std::function<Error()>>& tasks, size_t concurrency) {
    std::atomic<size_t> next{0};
    std::mutex errorMutex;
    Error firstError;

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= tasks.size()) {
                return;
            }
            Error err = tasks[i]();
            if (!err.ok()) {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (firstError.ok()) {
                    firstError = err;
                }
            }
        }
    };

    size_t threadCount = std::min(concurrency, tasks.size());
    if (threadCount <= 1) {
        worker();
        return firstError;
    }

    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return firstError;
}

} // namespace

Error PathDeleter::Delete(const std::string& path) {
    if (IsRootPath(path)) {
        return Error(ErrorCode::InvalidArgument, "Cannot delete the root directory");
    }

    auto metaResult = metadata_.Get(path);
    if (metaResult.ok()) {
        if (metaResult.value().IsDirectory()) {
            return deleteDirectory(path);
        }
        return deleteFile(path, true);
    }
    if (metaResult.error().is(ErrorCode::NotFound)) {
        // 元数据缺失仍尝试清理残留分块
        utils::GetLogger().Warn("删除时未找到元数据，尝试清理分块",
            utils::LogContext().With("path", path));
        return deleteFile(path, false);
    }
    return metaResult.error();
}

Error PathDeleter::deleteDirectory(const std::string& path) {
    auto children = storage::ListAllKeys(store_, DirectoryPrefix(path));
    if (!children.ok()) {
        return children.error().Wrap("Failed to check if directory is empty");
    }
    if (!children.value().empty()) {
        return Error(ErrorCode::DirectoryNotEmpty, "Directory not empty: " + path);
    }

    Error err = store_.Remove(MetadataKey(path));
    if (!err.ok() && !err.is(ErrorCode::NotFound)) {
        return err.Wrap("Failed to delete directory metadata");
    }
    utils::GetLogger().Info("已删除目录", utils::LogContext().With("path", path));
    return Error();
}

Error PathDeleter::deleteFile(const std::string& path, bool hasMetadata) {
    auto indices = chunks_.ListIndices(path);
    if (!indices.ok()) {
        return indices.error().Wrap("Failed to list chunks for " + path);
    }

    std::vector<std::function<Error()>> tasks;
    tasks.reserve(indices.value().size() + 1);
    if (hasMetadata) {
        tasks.push_back([this, path]() {
            Error err = store_.Remove(MetadataKey(path));
            if (!err.ok() && !err.is(ErrorCode::NotFound)) {
                return err.Wrap("Failed to delete metadata");
            }
            return Error();
        });
    }
    for (int64_t index : indices.value()) {
        tasks.push_back([this, path, index]() {
            return chunks_.Delete(path, index);
        });
    }

    Error err = runConcurrently(tasks, concurrency_);
    if (!err.ok()) {
        utils::GetLogger().Error("删除文件失败",
            utils::LogContext()
                .With("path", path)
                .With("keys", std::to_string(tasks.size()))
                .With("error", err.what()));
        return err.Wrap("Failed to delete one or more keys for " + path);
    }

    utils::GetLogger().Info("已删除文件",
        utils::LogContext()
            .With("path", path)
            .With("chunks", std::to_string(indices.value().size())));
    return Error();
}

} // namespace fs
} // namespace hpkvfs
