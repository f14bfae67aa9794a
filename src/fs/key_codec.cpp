#include "hpkvfs/fs/key_codec.hpp"

namespace hpkvfs {
namespace fs {

std::string MetadataKey(const std::string& path) {
    if (IsRootPath(path)) {
        return ROOT_METADATA_KEY;
    }
    return path + METADATA_SUFFIX;
}

std::string ChunkKey(const std::string& path, int64_t index) {
    return path + CHUNK_SUFFIX + std::to_string(index);
}

std::string ChunkKeyPrefix(const std::string& path) {
    return path + CHUNK_SUFFIX;
}

std::string DirectoryPrefix(const std::string& path) {
    if (path.empty() || path.back() == '/') {
        return path.empty() ? ROOT_PATH : path;
    }
    return path + "/";
}

Error ValidatePath(const std::string& path) {
    if (path.empty()) {
        return Error(ErrorCode::InvalidArgument, "Path is required");
    }
    if (path.front() != '/') {
        return Error(ErrorCode::InvalidArgument, "Path must be absolute: " + path);
    }
    if (IsRootPath(path)) {
        return Error();
    }
    if (path.back() == '/') {
        return Error(ErrorCode::InvalidArgument, "Path must not end with a slash: " + path);
    }

    size_t start = 1;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);

        if (segment.empty()) {
            return Error(ErrorCode::InvalidArgument, "Path contains an empty segment: " + path);
        }
        if (segment == "." || segment == "..") {
            return Error(ErrorCode::InvalidArgument, "Path contains a relative segment: " + path);
        }
        // 保留后缀出现在段内会与其他路径的派生键冲突
        if (segment.find(METADATA_SUFFIX) != std::string::npos ||
            segment.find(CHUNK_SUFFIX) != std::string::npos) {
            return Error(ErrorCode::InvalidArgument,
                "Path segment uses a reserved suffix (" + METADATA_SUFFIX + ", " +
                CHUNK_SUFFIX + "): " + segment);
        }
        start = end + 1;
    }
    return Error();
}

bool StripMetadataSuffix(const std::string& key, std::string& path) {
    if (key.size() < METADATA_SUFFIX.size() ||
        key.compare(key.size() - METADATA_SUFFIX.size(), METADATA_SUFFIX.size(), METADATA_SUFFIX) != 0) {
        return false;
    }
    path = key.substr(0, key.size() - METADATA_SUFFIX.size());
    if (path.empty()) {
        path = ROOT_PATH;
    }
    return true;
}

} // namespace fs
} // namespace hpkvfs
