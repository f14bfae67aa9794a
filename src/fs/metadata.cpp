#include "hpkvfs/fs/metadata.hpp"
#include <cmath>
#include <limits>
#include "hpkvfs/fs/key_codec.hpp"
#include "hpkvfs/utils/logger.hpp"

namespace hpkvfs {
namespace fs {

namespace {

// 读取可选整数字段，类型不符时报错
Error readInt(const json& j, const char* name, bool required, int64_t& out) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        if (required) {
            return Error(ErrorCode::CorruptMetadata, std::string("Missing field: ") + name);
        }
        return Error();
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            out = static_cast<int64_t>(value);
            return Error();
        }
    } else if (it->is_number_integer()) {
        out = it->get<int64_t>();
        return Error();
    }
    // 其他实现可能把整数写成浮点(如1.0)；先检查范围再转换
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (value >= -9.2e18 && value <= 9.2e18 && std::trunc(value) == value) {
            out = static_cast<int64_t>(value);
            return Error();
        }
    }
    return Error(ErrorCode::CorruptMetadata, std::string("Field is not an integer: ") + name);
}

} // namespace

json Metadata::ToJson() const {
    json j = {
        {"mode", mode},
        {"uid", uid},
        {"gid", gid},
        {"size", size},
        {"atime", atime},
        {"mtime", mtime},
        {"ctime", ctime}
    };
    if (hasNumChunks) {
        j["num_chunks"] = numChunks;
    }
    return j;
}

Result<Metadata> Metadata::FromJson(const json& j, const Identity& identity) {
    if (!j.is_object()) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata, "Metadata is not a JSON object"));
    }

    Metadata meta;
    meta.uid = identity.uid;
    meta.gid = identity.gid;

    int64_t mode = 0;
    Error err = readInt(j, "mode", true, mode);
    if (err.ok()) err = readInt(j, "size", true, meta.size);
    if (err.ok()) err = readInt(j, "uid", false, meta.uid);
    if (err.ok()) err = readInt(j, "gid", false, meta.gid);
    if (err.ok()) err = readInt(j, "atime", false, meta.atime);
    if (err.ok()) err = readInt(j, "mtime", false, meta.mtime);
    if (err.ok()) err = readInt(j, "ctime", false, meta.ctime);

    int64_t storedChunks = -1;
    if (err.ok()) err = readInt(j, "num_chunks", false, storedChunks);
    if (!err.ok()) {
        return Result<Metadata>(err);
    }

    if (mode < 0 || mode > 0xFFFFFFFFLL) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata, "Mode out of range: " + std::to_string(mode)));
    }
    if (meta.size < 0) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata, "Negative size: " + std::to_string(meta.size)));
    }
    if (meta.size > std::numeric_limits<int64_t>::max() - MAX_CHUNK_SIZE) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata, "Size out of range: " + std::to_string(meta.size)));
    }
    meta.mode = static_cast<uint32_t>(mode);

    // num_chunks只作参考，以size为准
    if (meta.size > 0) {
        int64_t derived = ChunkCountForSize(meta.size);
        if (storedChunks >= 0 && storedChunks != derived) {
            utils::GetLogger().Warn("元数据num_chunks与size不一致，按size重算",
                utils::LogContext()
                    .With("stored", std::to_string(storedChunks))
                    .With("derived", std::to_string(derived)));
        }
        meta.numChunks = derived;
        meta.hasNumChunks = true;
    } else {
        meta.numChunks = 0;
        meta.hasNumChunks = storedChunks >= 0;
    }

    return Result<Metadata>(meta);
}

Metadata Metadata::NewFile(const Identity& identity, int64_t now) {
    Metadata meta;
    meta.mode = DEFAULT_FILE_MODE;
    meta.uid = identity.uid;
    meta.gid = identity.gid;
    meta.size = 0;
    meta.atime = now;
    meta.mtime = now;
    meta.ctime = now;
    meta.numChunks = 0;
    meta.hasNumChunks = true;
    return meta;
}

Metadata Metadata::NewDirectory(const Identity& identity, int64_t now) {
    Metadata meta;
    meta.mode = DEFAULT_DIR_MODE;
    meta.uid = identity.uid;
    meta.gid = identity.gid;
    meta.size = 0;
    meta.atime = now;
    meta.mtime = now;
    meta.ctime = now;
    meta.hasNumChunks = false;
    return meta;
}

Result<Metadata> MetadataStore::Get(const std::string& path) {
    std::string key = MetadataKey(path);
    auto raw = store_.Get(key);
    if (!raw.ok()) {
        if (raw.error().is(ErrorCode::NotFound)) {
            return Result<Metadata>(Error(ErrorCode::NotFound, "Metadata not found: " + path));
        }
        return Result<Metadata>(raw.error().Wrap("Failed to get metadata for " + path));
    }

    const Bytes& value = raw.value();
    if (value.empty()) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata, "Metadata found but empty: " + path));
    }

    json j;
    try {
        j = json::parse(value.begin(), value.end());
    } catch (const json::exception& e) {
        return Result<Metadata>(Error(ErrorCode::CorruptMetadata,
            "Failed to parse metadata JSON for " + path + ": " + e.what()));
    }

    auto meta = Metadata::FromJson(j, identity_);
    if (!meta.ok()) {
        return Result<Metadata>(meta.error().Wrap("Invalid metadata for " + path));
    }
    return meta;
}

Error MetadataStore::Put(const std::string& path, const Metadata& metadata) {
    std::string text = metadata.ToJson().dump();
    Error err = store_.Set(MetadataKey(path), Bytes(text.begin(), text.end()));
    if (!err.ok()) {
        return err.Wrap("Failed to write metadata for " + path);
    }
    return Error();
}

} // namespace fs
} // namespace hpkvfs
