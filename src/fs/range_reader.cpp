#include "hpkvfs/fs/range_reader.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <algorithm>
#include <cstring>

namespace hpkvfs {
namespace fs {

Result<Bytes> RangeReader::Read(const std::string& path, int64_t offset, int64_t size) {
    if (offset < 0 || size < 0) {
        return Result<Bytes>(Error(ErrorCode::InvalidArgument,
            "Invalid offset or size: " + std::to_string(offset) + ", " + std::to_string(size)));
    }

    auto metaResult = metadata_.Get(path);
    if (!metaResult.ok()) {
        return Result<Bytes>(metaResult.error());
    }
    const Metadata& meta = metaResult.value();
    if (meta.IsDirectory()) {
        return Result<Bytes>(Error(ErrorCode::IsADirectory, "Path is a directory: " + path));
    }

    const int64_t fileSize = meta.size;
    if (size == 0 || offset >= fileSize) {
        return Result<Bytes>(Bytes());
    }

    const int64_t readSize = std::min(size, fileSize - offset);
    const int64_t readEnd = offset + readSize;
    const int64_t startChunk = offset / MAX_CHUNK_SIZE;
    const int64_t endChunk = (readEnd - 1) / MAX_CHUNK_SIZE;

    utils::GetLogger().Debug("读取文件",
        utils::LogContext()
            .With("path", path)
            .With("offset", std::to_string(offset))
            .With("length", std::to_string(readSize))
            .With("chunks", std::to_string(startChunk) + "-" + std::to_string(endChunk)));

    // 预先补零，缺失或偏短的分块直接保留0
    Bytes output(static_cast<size_t>(readSize), 0);
    int64_t covered = 0;

    for (int64_t i = startChunk; i <= endChunk && covered < readSize; ++i) {
        const int64_t chunkStart = i * MAX_CHUNK_SIZE;
        const int64_t chunkEnd = chunkStart + MAX_CHUNK_SIZE;

        // 本块与请求区间的交集(全局偏移)
        const int64_t overlapStart = std::max(offset, chunkStart);
        const int64_t overlapEnd = std::min(readEnd, chunkEnd);
        covered = overlapEnd - offset;

        auto chunkResult = chunks_.Get(path, i);
        if (!chunkResult.ok()) {
            return Result<Bytes>(chunkResult.error());
        }
        const std::optional<Bytes>& chunk = chunkResult.value();
        if (!chunk) {
            continue;
        }

        const int64_t chunkLength = static_cast<int64_t>(chunk->size());
        const int64_t copyStartInChunk = overlapStart - chunkStart;
        const int64_t copyEndInChunk = std::min(overlapEnd - chunkStart, chunkLength);
        if (copyEndInChunk > copyStartInChunk) {
            std::memcpy(output.data() + (overlapStart - offset),
                        chunk->data() + copyStartInChunk,
                        static_cast<size_t>(copyEndInChunk - copyStartInChunk));
        }
    }

    return Result<Bytes>(std::move(output));
}

} // namespace fs
} // namespace hpkvfs
