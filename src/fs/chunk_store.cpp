#include "hpkvfs/fs/chunk_store.hpp"
#include "hpkvfs/fs/key_codec.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <algorithm>
#include <cctype>

namespace hpkvfs {
namespace fs {

Result<std::optional<Bytes>> ChunkStore::Get(const std::string& path, int64_t index) {
    auto raw = store_.Get(ChunkKey(path, index));
    if (!raw.ok()) {
        if (raw.error().is(ErrorCode::NotFound)) {
            return Result<std::optional<Bytes>>(std::optional<Bytes>());
        }
        utils::GetLogger().Error("读取分块失败",
            utils::LogContext()
                .With("path", path)
                .With("chunk", std::to_string(index))
                .With("error", raw.error().what()));
        return Result<std::optional<Bytes>>(
            raw.error().Wrap("Failed to get chunk " + std::to_string(index)));
    }
    return Result<std::optional<Bytes>>(std::optional<Bytes>(std::move(raw).value()));
}

Error ChunkStore::Put(const std::string& path, int64_t index, const Bytes& data) {
    if (static_cast<int64_t>(data.size()) > MAX_CHUNK_SIZE) {
        return Error(ErrorCode::InvalidArgument,
            "Chunk " + std::to_string(index) + " exceeds " + std::to_string(MAX_CHUNK_SIZE) +
            " bytes: " + std::to_string(data.size()));
    }
    Error err = store_.Set(ChunkKey(path, index), data);
    if (!err.ok()) {
        return err.Wrap("Failed to write chunk " + std::to_string(index));
    }
    return Error();
}

Error ChunkStore::Delete(const std::string& path, int64_t index) {
    Error err = store_.Remove(ChunkKey(path, index));
    if (!err.ok() && !err.is(ErrorCode::NotFound)) {
        return err.Wrap("Failed to delete chunk " + std::to_string(index));
    }
    return Error();
}

Result<std::vector<int64_t>> ChunkStore::ListIndices(const std::string& path) {
    std::string prefix = ChunkKeyPrefix(path);
    auto keys = storage::ListAllKeys(store_, prefix);
    if (!keys.ok()) {
        return Result<std::vector<int64_t>>(keys.error());
    }

    std::vector<int64_t> indices;
    for (const auto& key : keys.value()) {
        std::string suffix = key.substr(prefix.size());
        // 序号无前导零
        bool numeric = !suffix.empty() && suffix.size() <= 18 &&
            (suffix.size() == 1 || suffix[0] != '0') &&
            std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!numeric) {
            utils::GetLogger().Warn("忽略非分块键",
                utils::LogContext().With("key", key).With("path", path));
            continue;
        }
        indices.push_back(std::stoll(suffix));
    }
    std::sort(indices.begin(), indices.end());
    return Result<std::vector<int64_t>>(std::move(indices));
}

} // namespace fs
} // namespace hpkvfs
