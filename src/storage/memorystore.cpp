#include "hpkvfs/storage/memorystore.hpp"
#include "hpkvfs/types.hpp"
#include <iterator>

namespace hpkvfs {
namespace storage {

MemoryStore::MemoryStore(size_t pageSize, size_t maxValueSize)
    : pageSize_(pageSize), maxValueSize_(maxValueSize) {}

Result<Bytes> MemoryStore::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(key);
    if (it == storage_.end()) {
        return Result<Bytes>(Error(ErrorCode::NotFound, "Key not found: " + key));
    }
    return Result<Bytes>(it->second);
}

Error MemoryStore::Set(const std::string& key, const Bytes& value) {
    if (key.empty()) {
        return Error(ErrorCode::InvalidArgument, "Key must not be empty");
    }
    // 模拟服务端的值大小限制
    if (maxValueSize_ > 0 && value.size() > maxValueSize_) {
        return Error(ErrorCode::StoreError, "Value too large for key " + key + ": " +
                     std::to_string(value.size()) + " > " + std::to_string(maxValueSize_));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    storage_[key] = value;
    return Error(); // 成功
}

Error MemoryStore::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage_.erase(key);
    return Error(); // 成功
}

Result<ListPage> MemoryStore::List(const std::string& prefix,
                                   const std::string& delimiter,
                                   const std::string& marker) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListPage page;

    // marker之后(不含)开始
    auto it = marker.empty() ? storage_.lower_bound(prefix) : storage_.upper_bound(marker);
    if (!marker.empty() && marker < prefix) {
        it = storage_.lower_bound(prefix);
    }

    for (; it != storage_.end(); ++it) {
        const std::string& key = it->first;
        if (key.compare(0, prefix.size(), prefix) != 0) {
            break;
        }

        if (pageSize_ > 0 && page.keys.size() >= pageSize_) {
            page.nextMarker = std::prev(it)->first;
            break;
        }

        // 有分隔符时把更深层的键折叠为一个公共前缀
        if (!delimiter.empty()) {
            size_t pos = key.find(delimiter, prefix.size());
            if (pos != std::string::npos) {
                std::string common = key.substr(0, pos + delimiter.size());
                page.keys.push_back(common);
                // 跳过同一公共前缀下的其余键
                auto next = std::next(it);
                while (next != storage_.end() &&
                       next->first.compare(0, common.size(), common) == 0) {
                    it = next++;
                }
                continue;
            }
        }
        page.keys.push_back(key);
    }

    return Result<ListPage>(std::move(page));
}

std::string MemoryStore::Location() const {
    return "memory";
}

size_t MemoryStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.size();
}

bool MemoryStore::Contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.count(key) > 0;
}

std::vector<std::string> MemoryStore::Keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& pair : storage_) {
        keys.push_back(pair.first);
    }
    return keys;
}

} // namespace storage
} // namespace hpkvfs
