#include "hpkvfs/fs/range_writer.hpp"
#include "hpkvfs/utils/logger.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace hpkvfs {
namespace fs {

Result<int64_t> RangeWriter::Write(const std::string& path, int64_t offset, const Bytes& data) {
    if (offset < 0) {
        return Result<int64_t>(Error(ErrorCode::InvalidArgument, "Invalid offset: " + std::to_string(offset)));
    }

    // 1. 读取元数据，不存在则创建新文件
    Metadata meta;
    bool isNewFile = false;
    auto existing = metadata_.Get(path);
    if (existing.ok()) {
        meta = existing.value();
        if (meta.IsDirectory()) {
            return Result<int64_t>(Error(ErrorCode::IsADirectory, "Path is a directory: " + path));
        }
    } else if (existing.error().is(ErrorCode::NotFound)) {
        meta = Metadata::NewFile(metadata_.GetIdentity(), clock_());
        isNewFile = true;
    } else {
        return Result<int64_t>(existing.error());
    }

    const int64_t length = static_cast<int64_t>(data.size());
    if (offset > std::numeric_limits<int64_t>::max() - length) {
        return Result<int64_t>(Error(ErrorCode::InvalidArgument, "Write range overflows: offset " + std::to_string(offset)));
    }

    // 空写只保证元数据存在
    if (length == 0) {
        if (isNewFile) {
            Error err = metadata_.Put(path, meta);
            if (!err.ok()) {
                return Result<int64_t>(err);
            }
        }
        return Result<int64_t>(static_cast<int64_t>(0));
    }

    // 2. 计算受影响的分块范围
    const int64_t writeEnd = offset + length;
    const int64_t startChunk = offset / MAX_CHUNK_SIZE;
    const int64_t endChunk = (writeEnd - 1) / MAX_CHUNK_SIZE;

    utils::GetLogger().Debug("写入文件",
        utils::LogContext()
            .With("path", path)
            .With("offset", std::to_string(offset))
            .With("length", std::to_string(length))
            .With("chunks", std::to_string(startChunk) + "-" + std::to_string(endChunk)));

    // 3. 逐块读-改-写，任一失败立即中止
    for (int64_t i = startChunk; i <= endChunk; ++i) {
        Error err = writeChunk(path, i, offset, data);
        if (!err.ok()) {
            utils::GetLogger().Error("写入分块失败",
                utils::LogContext()
                    .With("path", path)
                    .With("chunk", std::to_string(i))
                    .With("error", err.what()));
            return Result<int64_t>(err);
        }
    }

    // 4. 更新元数据
    const int64_t now = clock_();
    meta.size = std::max(meta.size, writeEnd);
    meta.mtime = now;
    meta.atime = now;
    if (isNewFile) {
        meta.ctime = now;
    }
    meta.numChunks = ChunkCountForSize(meta.size);
    meta.hasNumChunks = true;

    Error err = metadata_.Put(path, meta);
    if (!err.ok()) {
        // 分块已领先于元数据，不回滚
        utils::GetLogger().Error("分块已写入但元数据更新失败",
            utils::LogContext()
                .With("path", path)
                .With("error", err.what()));
        return Result<int64_t>(Error(err.code(),
            "Chunks written but metadata update failed for " + path + ": " + err.what())
            .WithUpstreamStatus(err.upstreamStatus()));
    }

    return Result<int64_t>(length);
}

Error RangeWriter::writeChunk(const std::string& path, int64_t index,
                              int64_t offset, const Bytes& data) {
    const int64_t chunkStart = index * MAX_CHUNK_SIZE;
    const int64_t writeEnd = offset + static_cast<int64_t>(data.size());

    auto existingResult = chunks_.Get(path, index);
    if (!existingResult.ok()) {
        return existingResult.error();
    }
    const std::optional<Bytes>& existingChunk = existingResult.value();
    const Bytes empty;
    const Bytes& existing = existingChunk ? *existingChunk : empty;
    const int64_t existingLength = static_cast<int64_t>(existing.size());

    // 块内写入窗口[writeStartInChunk, writeEndInChunk)
    const int64_t writeStartInChunk = std::max<int64_t>(0, offset - chunkStart);
    const int64_t writeEndInChunk = std::min<int64_t>(MAX_CHUNK_SIZE, writeEnd - chunkStart);
    const int64_t bytesInChunk = writeEndInChunk - writeStartInChunk;
    const int64_t sourceOffset = chunkStart + writeStartInChunk - offset;

    // 新块长度取旧长度与写入末端的较大者，空洞由分配补零
    Bytes chunk(static_cast<size_t>(std::max(existingLength, writeEndInChunk)), 0);

    // 旧数据前缀
    int64_t prefixLength = std::min(writeStartInChunk, existingLength);
    if (prefixLength > 0) {
        std::memcpy(chunk.data(), existing.data(), static_cast<size_t>(prefixLength));
    }

    // 新数据
    std::memcpy(chunk.data() + writeStartInChunk,
                data.data() + sourceOffset,
                static_cast<size_t>(bytesInChunk));

    // 旧数据后缀
    if (writeEndInChunk < existingLength) {
        std::memcpy(chunk.data() + writeEndInChunk,
                    existing.data() + writeEndInChunk,
                    static_cast<size_t>(existingLength - writeEndInChunk));
    }

    return chunks_.Put(path, index, chunk);
}

} // namespace fs
} // namespace hpkvfs
